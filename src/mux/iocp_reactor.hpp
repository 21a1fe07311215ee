#pragma once

#include "./reactor.hpp"

#include <chrono>
#include <cstddef>

namespace mux {

/**
 * @brief A completion reactor built on a Win32 I/O completion port.
 *
 * Completions are dequeued and delivered inside run_once() on the calling thread. Records may be
 * posted from any thread.
 */
class iocp_reactor : public completion_reactor {
    /// Per-platform state
    struct impl;
    impl* _impl;

public:
    iocp_reactor();
    ~iocp_reactor();

    iocp_reactor(const iocp_reactor&) = delete;
    iocp_reactor& operator=(const iocp_reactor&) = delete;

    void register_handle(native_handle_t h) override;
    void unregister_handle(native_handle_t h) override;
    void expect_completion(std::unique_ptr<completion_op> op) override;
    void post_completion(completion_op& op, std::size_t transferred, int status) override;

    /// Whether the given handle is currently registered
    [[nodiscard]] bool is_registered(native_handle_t h) const noexcept;

    /// Whether any submitted operation has yet to complete
    [[nodiscard]] bool has_pending() const noexcept;

    /**
     * @brief Dequeue one completion record and deliver it.
     *
     * @param timeout How long to wait. Negative waits forever, but returns at once when nothing is
     * outstanding.
     * @return std::size_t The number of operations that were completed (zero or one)
     */
    std::size_t run_once(std::chrono::milliseconds timeout);

    /// Keep dispatching until the given duration has elapsed
    void run_for(std::chrono::milliseconds duration);
};

}  // namespace mux
