#pragma once

#include <spdlog/logger.h>

namespace mux {

/**
 * @brief The library's logger, named "muxio", writing to stderr.
 *
 * Created on first use. Its level defaults to `warn` and is taken from the `MUX_LOG_LEVEL`
 * environment variable when that is set (trace, debug, info, warn, error, critical, off).
 */
spdlog::logger& log();

}  // namespace mux
