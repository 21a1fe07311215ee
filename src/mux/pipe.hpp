#pragma once

#include "./async_result.hpp"
#include "./buffer.hpp"
#include "./native_handle.hpp"
#include "./reactor.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

namespace mux {

/**
 * @brief An aggregate of a pair of read and write endpoints of a new raw pipe
 */
struct pipe_pair {
    /// The read-end of the pipe
    unique_native_handle reader;
    /// The write-end of the pipe
    unique_native_handle writer;
};

/**
 * @brief Select which ends of a raw pipe are opened for asynchronous I/O.
 *
 * Only meaningful on Windows, where overlapped I/O must be requested when a handle is opened. On
 * POSIX, asynchrony is a descriptor flag and is set by async_pipe instead.
 */
enum class pipe_async_ends {
    none,
    reader,
    writer,
    both,
};

/**
 * @brief Create a new anonymous pipe. Both ends are blocking and are not inherited by children.
 *
 * @param async_ends The ends to open for overlapped I/O (Windows)
 * @param buffer_size A kernel buffer size to request. Zero keeps the system default.
 */
[[nodiscard]] pipe_pair create_pipe(pipe_async_ends async_ends  = pipe_async_ends::none,
                                    std::size_t     buffer_size = 0);

/**
 * @brief Options for async_pipe::create()
 */
struct pipe_options {
    /// A kernel buffer size to request, in bytes. Zero keeps the system default.
    std::size_t buffer_size = 0;
    /// Register both ends with the reactor on creation
    bool register_handles = true;
};

namespace detail {

/**
 * @brief The state of one direction of an async_pipe.
 *
 * Shared between the pipe and its pending operation, so that the operation never refers to the
 * async_pipe object itself.
 */
struct pipe_end {
    unique_native_handle handle;
    /// Whether the handle is registered with the reactor
    bool registered = false;
    /// Whether an operation is in flight on this end
    bool busy = false;
    /// Increments for each operation and each close, so a stale operation cannot clear `busy`
    std::uint64_t generation = 0;
    /// Set once the handle was found to be invalid. Later operations fail with this error.
    std::error_code broken;
    /// Fails the in-flight operation. Called when the end is closed under it.
    std::function<void()> abort_pending;

    /// Mark the start of an operation and return its generation
    std::uint64_t begin_op() noexcept {
        busy = true;
        return ++generation;
    }

    /// Mark the end of the operation with the given generation
    void finish_op(std::uint64_t gen) noexcept {
        if (gen == generation) {
            busy = false;
            abort_pending = nullptr;
        }
    }
};

}  // namespace detail

/**
 * @brief A byte-stream pipe with independently closable read and write ends and asynchronous
 * operations driven by a reactor.
 *
 * At most one read and one write may be pending at a time. A read and a write may be pending
 * together and complete in either order.
 */
class async_pipe {
    reactor*                          _reactor = nullptr;
    std::shared_ptr<detail::pipe_end> _read_end;
    std::shared_ptr<detail::pipe_end> _write_end;

    async_pipe(reactor& r, unique_native_handle reader, unique_native_handle writer);

    void _close_end(std::shared_ptr<detail::pipe_end>& end, bool unregister) noexcept;

    /// Per-platform impl of write(). `keepalive` owns the bytes of `buf`, or is null.
    async_result<void> _do_write(const_buffer buf, std::shared_ptr<const std::string> keepalive);

public:
    /// Construct a pipe with both ends absent
    async_pipe() = default;

    async_pipe(async_pipe&& o) noexcept
        : _reactor(o._reactor)
        , _read_end(std::move(o._read_end))
        , _write_end(std::move(o._write_end)) {}

    async_pipe& operator=(async_pipe&& o) noexcept {
        close();
        _reactor   = o._reactor;
        _read_end  = std::move(o._read_end);
        _write_end = std::move(o._write_end);
        return *this;
    }

    /// Closes and unregisters any ends that are still open
    ~async_pipe() { close(); }

    /**
     * @brief Create a new connected pipe.
     *
     * Windows: a uniquely named overlapped byte-mode pipe connected locally. POSIX: an anonymous
     * pipe with both ends non-blocking.
     *
     * @throws std::system_error if the pipe cannot be created
     */
    [[nodiscard]] static async_pipe create(reactor& r, pipe_options opts = {});

    /**
     * @brief Adopt existing handles into an async_pipe and register them with the reactor.
     *
     * Either handle may be `null_native_handle` when that end is absent. POSIX descriptors are
     * switched to non-blocking mode. Windows handles must have been opened for overlapped I/O.
     *
     * @note The returned pipe owns the handles and will close them
     */
    [[nodiscard]] static async_pipe
    wrap(reactor& r, native_handle_t read_handle, native_handle_t write_handle);

    /// Unregister both ends from the reactor without closing them
    void unwrap() noexcept;

    /// Register any open end that is not yet registered with the reactor
    void register_handles();

    /**
     * @brief Read at most `buf.size()` bytes.
     *
     * The result is the number of bytes read. Zero means the write end of the pipe was closed and
     * no more data will arrive.
     *
     * @note `buf` must remain valid and unmoved until the result is ready
     */
    [[nodiscard]] async_result<std::size_t> read_some(mutable_buffer buf);

    /**
     * @brief Write all of `buf`. The result becomes ready only once every byte is transferred.
     *
     * If the read end of the pipe has been closed the result fails with EPIPE (POSIX) or
     * ERROR_NO_DATA / ERROR_BROKEN_PIPE (Windows), and the write end remains usable. On POSIX,
     * SIGPIPE is blocked on the calling thread for the duration of each write attempt.
     *
     * @note `buf` must remain valid and unmoved until the result is ready
     */
    [[nodiscard]] async_result<void> write(const_buffer buf) { return _do_write(buf, nullptr); }

    /**
     * @brief Write all of `data`, which is moved into the pending operation
     */
    [[nodiscard]] async_result<void> write(std::string data) {
        auto owned = std::make_shared<const std::string>(std::move(data));
        return _do_write(neo::as_buffer(*owned), owned);
    }

    /**
     * @brief Close the read end.
     *
     * @param unregister If `false`, the handle is left registered with the reactor
     */
    void close_read(bool unregister = true) noexcept { _close_end(_read_end, unregister); }

    /**
     * @brief Close the write end.
     *
     * @param unregister If `false`, the handle is left registered with the reactor
     */
    void close_write(bool unregister = true) noexcept { _close_end(_write_end, unregister); }

    /// Close both ends
    void close(bool unregister = true) noexcept {
        close_read(unregister);
        close_write(unregister);
    }

    /// Determine whether the read end is open
    [[nodiscard]] bool has_reader() const noexcept {
        return _read_end && _read_end->handle.is_open();
    }
    /// Determine whether the write end is open
    [[nodiscard]] bool has_writer() const noexcept {
        return _write_end && _write_end->handle.is_open();
    }

    /// The OS handle of the read end, or null_native_handle
    [[nodiscard]] native_handle_t read_handle() const noexcept {
        return has_reader() ? _read_end->handle.get() : null_native_handle;
    }
    /// The OS handle of the write end, or null_native_handle
    [[nodiscard]] native_handle_t write_handle() const noexcept {
        return has_writer() ? _write_end->handle.get() : null_native_handle;
    }
};

}  // namespace mux
