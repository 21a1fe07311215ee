#pragma once

#include "./async_result.hpp"
#include "./iocp_reactor.hpp"
#include "./poll_reactor.hpp"

#include <neo/assert.hpp>
#include <neo/platform.hpp>

#include <chrono>
#include <type_traits>

namespace mux {

/// The event loop shipped for the current platform
using event_loop = std::conditional_t<neo::os_is_windows, iocp_reactor, poll_reactor>;

/**
 * @brief Run the loop until the given result is ready, then return its value.
 *
 * @throws std::system_error if the operation failed
 */
template <typename Loop, typename T>
T wait(Loop& loop, const async_result<T>& result) {
    while (!result.ready()) {
        neo_assert(expects,
                   loop.has_pending(),
                   "mux::wait() was called for an operation that nothing will ever complete");
        loop.run_once(std::chrono::milliseconds{-1});
    }
    return result.get();
}

/**
 * @brief Run the loop until the given result is ready or the timeout elapses.
 *
 * @return true if the result became ready
 */
template <typename Loop, typename T>
bool wait_for(Loop& loop, const async_result<T>& result, std::chrono::milliseconds timeout) {
    using clock         = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    while (!result.ready()) {
        const auto now = clock::now();
        if (now >= deadline) {
            return false;
        }
        loop.run_once(std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
    }
    return true;
}

}  // namespace mux
