#pragma once

namespace mux {

/**
 * @brief The spawn() options for creating a subprocess.
 */
struct subprocess_spawn_options;

/**
 * @brief Exception that represents a subprocess not exiting normally with successful exit status
 *
 * Derived from `std::runtime_error`
 */
class subprocess_failure;

/**
 * @brief The process-exit information of some subprocess.
 */
struct subprocess_exit;

/**
 * @brief A handle to a spawned subprocess and the parent ends of its stdio pipes
 */
class subprocess;

}  // namespace mux
