#pragma once

#include "./reactor.hpp"

#include <chrono>
#include <cstddef>
#include <map>

namespace mux {

/**
 * @brief A readiness reactor built on poll(2).
 *
 * Single-threaded. Callbacks run inside run_once() on the calling thread.
 */
class poll_reactor : public readiness_reactor {
    struct interest {
        ready_callback on_read;
        ready_callback on_write;
    };

    std::map<native_handle_t, interest> _handles;

    bool _dispatch(native_handle_t fd, ready_callback interest::*slot);
    void _arm(native_handle_t fd, ready_callback interest::*slot, ready_callback cb);

public:
    poll_reactor() = default;

    poll_reactor(const poll_reactor&) = delete;
    poll_reactor& operator=(const poll_reactor&) = delete;

    void register_handle(native_handle_t fd) override;
    void unregister_handle(native_handle_t fd) override;
    void add_read_ready(native_handle_t fd, ready_callback cb) override;
    void add_write_ready(native_handle_t fd, ready_callback cb) override;

    /// Whether the given descriptor is currently registered
    [[nodiscard]] bool is_registered(native_handle_t fd) const noexcept {
        return _handles.contains(fd);
    }

    /// Whether any callback is armed
    [[nodiscard]] bool has_pending() const noexcept;

    /**
     * @brief Wait for readiness and run the callbacks of every ready handle.
     *
     * @param timeout How long to wait. Negative waits forever, but returns at once when nothing is
     * armed.
     * @return std::size_t The number of callbacks that were invoked
     */
    std::size_t run_once(std::chrono::milliseconds timeout);

    /// Keep dispatching until the given duration has elapsed
    void run_for(std::chrono::milliseconds duration);
};

}  // namespace mux
