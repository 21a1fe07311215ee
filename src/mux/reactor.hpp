#pragma once

#include "./native_handle.hpp"

#include <neo/platform.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>

namespace mux {

/**
 * @brief The interface of an event loop that reports "this handle can be read/written now".
 *
 * Used on POSIX platforms. The library only consumes this interface; see event_loop for the
 * implementation shipped with it.
 */
class readiness_reactor {
public:
    /**
     * @brief A readiness callback. Invoked with the handle that became ready.
     *
     * Returns `true` once the operation it drives has finished, which disarms the callback, or
     * `false` to stay armed and be invoked again at the next readiness.
     */
    using ready_callback = std::function<bool(native_handle_t)>;

    virtual ~readiness_reactor() = default;

    /// Begin tracking the given handle. Each handle is registered at most once.
    virtual void register_handle(native_handle_t h) = 0;
    /// Stop tracking the given handle and drop any armed callbacks for it
    virtual void unregister_handle(native_handle_t h) = 0;
    /// Arm a callback for read-readiness on a registered handle
    virtual void add_read_ready(native_handle_t h, ready_callback cb) = 0;
    /// Arm a callback for write-readiness on a registered handle
    virtual void add_write_ready(native_handle_t h, ready_callback cb) = 0;
};

/**
 * @brief An operation submitted to the OS on a completion-based platform.
 *
 * Carries storage for the OS's per-operation record (an OVERLAPPED on Windows) followed by a
 * pointer back to the operation, so the reactor can map a dequeued record to its operation.
 */
class completion_op {
public:
    /// Storage laid out to begin with the OS record
    struct os_record {
        alignas(void*) std::byte overlapped[32] = {};
        completion_op* owner                    = nullptr;
    };

private:
    os_record _record;

public:
    completion_op() noexcept { _record.owner = this; }

    completion_op(const completion_op&) = delete;
    completion_op& operator=(const completion_op&) = delete;

    virtual ~completion_op() = default;

    /// Address to hand to the OS as the operation's record
    [[nodiscard]] void* os_record_ptr() noexcept { return &_record; }

    /// Recover the operation from a record address returned by the OS
    [[nodiscard]] static completion_op* from_os_record(void* rec) noexcept {
        return static_cast<os_record*>(rec)->owner;
    }

    /**
     * @brief Deliver the outcome.
     *
     * @param transferred The number of bytes the OS moved
     * @param status Zero on success, otherwise the OS error code
     */
    virtual void complete(std::size_t transferred, int status) = 0;
};

/**
 * @brief The interface of an event loop that reports "this submitted operation finished".
 *
 * Used on Windows. The reactor owns each submitted operation from `expect_completion()` until its
 * completion record is dequeued, at which point it calls `complete()` and destroys it.
 */
class completion_reactor {
public:
    virtual ~completion_reactor() = default;

    /// Associate the handle with the reactor's completion channel
    virtual void register_handle(native_handle_t h) = 0;
    /// Stop tracking the handle
    virtual void unregister_handle(native_handle_t h) = 0;
    /// Take ownership of an operation whose record has been handed to the OS
    virtual void expect_completion(std::unique_ptr<completion_op> op) = 0;
    /**
     * @brief Post a completion record for an operation previously given to expect_completion().
     *
     * @note Safe to call from any thread
     */
    virtual void post_completion(completion_op& op, std::size_t transferred, int status) = 0;
};

/// The reactor interface of the current platform
using reactor
    = std::conditional_t<neo::os_is_windows, completion_reactor, readiness_reactor>;

}  // namespace mux
