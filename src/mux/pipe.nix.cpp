#include "./pipe.hpp"

#include "./log.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>

#if !_WIN32

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <ctime>

using namespace mux;

namespace {

/**
 * @brief Blocks SIGPIPE on the calling thread while in scope.
 *
 * A write to a pipe with no reader then fails with EPIPE instead of killing the process. The
 * SIGPIPE raised by such a write is consumed before the previous signal mask is restored, unless
 * one was already pending on entry.
 */
class sigpipe_block {
    ::sigset_t _prev_mask;
    bool       _was_pending = false;
    bool       _raised      = false;

public:
    sigpipe_block() noexcept {
        ::sigset_t pending;
        ::sigemptyset(&pending);
        ::sigpending(&pending);
        _was_pending = ::sigismember(&pending, SIGPIPE) == 1;

        ::sigset_t block;
        ::sigemptyset(&block);
        ::sigaddset(&block, SIGPIPE);
        const int rc = ::pthread_sigmask(SIG_BLOCK, &block, &_prev_mask);
        neo_assert(invariant, rc == 0, "pthread_sigmask() failed to block SIGPIPE", rc);
    }

    sigpipe_block(const sigpipe_block&) = delete;
    sigpipe_block& operator=(const sigpipe_block&) = delete;

    /// Note that a write in this scope failed with EPIPE and raised SIGPIPE
    void set_raised() noexcept { _raised = true; }

    ~sigpipe_block() {
        if (_raised && !_was_pending) {
            ::sigset_t sigpipe_only;
            ::sigemptyset(&sigpipe_only);
            ::sigaddset(&sigpipe_only, SIGPIPE);
            const ::timespec no_wait = {0, 0};
            while (::sigtimedwait(&sigpipe_only, nullptr, &no_wait) == -1 && errno == EINTR) {
            }
        }
        ::pthread_sigmask(SIG_SETMASK, &_prev_mask, nullptr);
    }
};

}  // namespace

pipe_pair mux::create_pipe(pipe_async_ends, std::size_t buffer_size) {
    int  p[2] = {};
    auto rc   = ::pipe(p);
    if (rc == -1) {
        throw_current_error("::pipe() failed in mux::create_pipe()");
    }
    mux::pipe_pair ret;
    ret.reader.reset(p[0]);
    ret.writer.reset(p[1]);
    set_inheritable(ret.reader.get(), false);
    set_inheritable(ret.writer.get(), false);
#ifdef F_SETPIPE_SZ
    if (buffer_size != 0) {
        if (::fcntl(ret.writer.get(), F_SETPIPE_SZ, static_cast<int>(buffer_size)) == -1) {
            log().warn("Failed to set a pipe buffer size of {} bytes: {}",
                       buffer_size,
                       get_current_error_code().message());
        }
    }
#else
    (void)buffer_size;
#endif
    return ret;
}

async_result<std::size_t> async_pipe::read_some(mutable_buffer buf) {
    neo_assertion_breadcrumbs("Reading from an async_pipe", buf.size());
    neo_assert(expects, has_reader(), "read_some() was called on a pipe whose read end is closed");
    auto end = _read_end;
    neo_assert(expects,
               !end->busy,
               "A second read was issued on an async_pipe while one is still pending");
    if (end->broken) {
        return failed_result<std::size_t>(end->broken.value(), "async_pipe read end is broken");
    }
    if (buf.size() == 0) {
        return ready_result<std::size_t>(std::size_t(0));
    }

    async_completion<std::size_t> done;
    const auto                    gen = end->begin_op();
    end->abort_pending                = [done]() mutable {
        done.fail(EBADF, "async_pipe read end was closed while a read was pending");
    };

    auto attempt = [end, buf, done, gen](int) mutable -> bool {
        if (done.finished()) {
            return true;
        }
        while (true) {
            auto nread = ::read(end->handle.get(), buf.data(), buf.size());
            if (nread >= 0) {
                end->finish_op(gen);
                done.complete(static_cast<std::size_t>(nread));
                return true;
            }
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            const auto kind = classify_io_error(err);
            if (kind == io_error_kind::would_block) {
                return false;
            }
            end->finish_op(gen);
            if (kind == io_error_kind::end_of_stream) {
                done.complete(std::size_t(0));
                return true;
            }
            if (kind == io_error_kind::handle_invalid) {
                end->broken = make_system_error_code(err);
            }
            done.fail(err, "::read() on an async_pipe failed");
            return true;
        }
    };

    auto result = done.result();
    const int fd = end->handle.get();
    if (!attempt(fd)) {
        _reactor->add_read_ready(fd, std::move(attempt));
    }
    return result;
}

async_result<void> async_pipe::_do_write(const_buffer buf, std::shared_ptr<const std::string> keepalive) {
    neo_assertion_breadcrumbs("Writing to an async_pipe", buf.size());
    neo_assert(expects, has_writer(), "write() was called on a pipe whose write end is closed");
    auto end = _write_end;
    neo_assert(expects,
               !end->busy,
               "A second write was issued on an async_pipe while one is still pending");
    if (end->broken) {
        return failed_result<void>(end->broken.value(), "async_pipe write end is broken");
    }
    if (buf.size() == 0) {
        return ready_result<void>();
    }

    async_completion<void> done;
    const auto             gen = end->begin_op();
    end->abort_pending         = [done]() mutable {
        done.fail(EBADF, "async_pipe write end was closed while a write was pending");
    };

    auto attempt = [end, buf, keepalive, done, gen, written = std::size_t(0)](int) mutable -> bool {
        if (done.finished()) {
            return true;
        }
        sigpipe_block no_sigpipe;
        while (written < buf.size()) {
            auto remain   = buf + written;
            auto nwritten = ::write(end->handle.get(), remain.data(), remain.size());
            if (nwritten >= 0) {
                written += static_cast<std::size_t>(nwritten);
                continue;
            }
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            if (err == EPIPE) {
                no_sigpipe.set_raised();
            }
            const auto kind = classify_io_error(err);
            if (kind == io_error_kind::would_block) {
                // Partial progress is kept in `written`. Wait for room in the pipe.
                return false;
            }
            end->finish_op(gen);
            if (kind == io_error_kind::handle_invalid) {
                end->broken = make_system_error_code(err);
            }
            done.fail(err, "::write() on an async_pipe failed");
            return true;
        }
        end->finish_op(gen);
        done.complete();
        return true;
    };

    auto result = done.result();
    const int fd = end->handle.get();
    if (!attempt(fd)) {
        _reactor->add_write_ready(fd, std::move(attempt));
    }
    return result;
}

#endif
