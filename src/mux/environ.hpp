#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mux {

/// A set of environment variables given to a child process
using environment_map = std::map<std::string, std::string>;

/**
 * @brief Get the environment variable named by the given key
 *
 * @param key The name of an environment variable to get
 */
std::optional<std::string> getenv(std::string_view key) noexcept;

/**
 * @brief Render environment variables as `KEY=VALUE` strings, in key order
 */
std::vector<std::string> environment_strings(const environment_map& env);

}  // namespace mux
