#include "./pipe.hpp"

#include "./log.hpp"
#include "./syserror.hpp"
#include "./text.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#if _WIN32

#include <windows.h>

#include <atomic>

using namespace mux;

namespace {

constexpr DWORD default_pipe_buffer_size = 65536;

std::atomic<unsigned long> S_pipe_counter{0};

std::wstring next_pipe_name() {
    ::LARGE_INTEGER ticks = {};
    ::QueryPerformanceCounter(&ticks);
    return wide_encode(neo::ufmt("\\\\.\\pipe\\muxio-{}-{}-{}",
                                 ::GetCurrentProcessId(),
                                 ++S_pipe_counter,
                                 static_cast<long long>(ticks.QuadPart)));
}

/// Wait for the server end of a freshly created pipe to see its client
void connect_local(HANDLE server, bool overlapped) {
    ::OVERLAPPED ovl = {};
    unique_native_handle event;
    if (overlapped) {
        auto ev = ::CreateEventW(nullptr, TRUE, FALSE, nullptr);
        if (ev == nullptr) {
            throw_current_error("::CreateEventW() failed while connecting a pipe");
        }
        event.reset(ev);
        ovl.hEvent = ev;
    }
    if (::ConnectNamedPipe(server, overlapped ? &ovl : nullptr)) {
        return;
    }
    const auto err = ::GetLastError();
    if (err == ERROR_PIPE_CONNECTED) {
        return;
    }
    if (err == ERROR_IO_PENDING) {
        DWORD ignored = 0;
        if (!::GetOverlappedResult(server, &ovl, &ignored, TRUE)) {
            throw_current_error("::GetOverlappedResult() failed while connecting a pipe");
        }
        return;
    }
    throw_for_system_error_code(static_cast<int>(err), "::ConnectNamedPipe() failed");
}

/// A pending overlapped ReadFile
class pipe_read_op : public completion_op {
public:
    std::shared_ptr<detail::pipe_end> end;
    mutable_buffer                    buf;
    async_completion<std::size_t>     done;
    std::uint64_t                     gen = 0;

    void complete(std::size_t transferred, int status) override {
        if (done.finished()) {
            // Already failed by a close of the read end
            return;
        }
        end->finish_op(gen);
        if (status == 0) {
            done.complete(transferred);
            return;
        }
        switch (classify_io_error(status)) {
        case io_error_kind::end_of_stream:
            done.complete(std::size_t(0));
            return;
        case io_error_kind::handle_invalid:
            end->broken = make_system_error_code(status);
            break;
        default:
            break;
        }
        done.fail(status, "::ReadFile() on an async_pipe failed");
    }
};

/// The state of a write that may need several overlapped WriteFile calls
struct write_state {
    completion_reactor*                 reactor = nullptr;
    std::shared_ptr<detail::pipe_end>   end;
    const_buffer                        buf;
    std::shared_ptr<const std::string>  keepalive;
    async_completion<void>              done;
    std::uint64_t                       gen     = 0;
    std::size_t                         written = 0;
};

void submit_write(std::shared_ptr<write_state> st);

/// A pending overlapped WriteFile for the remainder of a write
class pipe_write_op : public completion_op {
public:
    std::shared_ptr<write_state> state;

    void complete(std::size_t transferred, int status) override {
        auto& st = *state;
        if (st.done.finished()) {
            return;
        }
        if (status != 0) {
            st.end->finish_op(st.gen);
            if (classify_io_error(status) == io_error_kind::handle_invalid) {
                st.end->broken = make_system_error_code(status);
            }
            st.done.fail(status, "::WriteFile() on an async_pipe failed");
            return;
        }
        st.written += transferred;
        if (st.written < st.buf.size()) {
            submit_write(state);
            return;
        }
        st.end->finish_op(st.gen);
        st.done.complete();
    }
};

void submit_write(std::shared_ptr<write_state> st) {
    auto op    = std::make_unique<pipe_write_op>();
    op->state  = st;
    auto ovl   = static_cast<LPOVERLAPPED>(op->os_record_ptr());
    auto remain = st->buf + st->written;
    auto okay   = ::WriteFile(st->end->handle.get(),
                            remain.data(),
                            static_cast<DWORD>(remain.size()),
                            nullptr,
                            ovl);
    if (!okay) {
        const auto err = ::GetLastError();
        if (err != ERROR_IO_PENDING) {
            st->end->finish_op(st->gen);
            if (classify_io_error(static_cast<int>(err)) == io_error_kind::handle_invalid) {
                st->end->broken = make_system_error_code(static_cast<int>(err));
            }
            st->done.fail(static_cast<int>(err), "::WriteFile() on an async_pipe failed");
            return;
        }
    }
    // Pending or finished at once: the port receives a completion record either way
    st->reactor->expect_completion(std::move(op));
}

}  // namespace

pipe_pair mux::create_pipe(pipe_async_ends async_ends, std::size_t buffer_size) {
    const bool reader_async
        = async_ends == pipe_async_ends::reader || async_ends == pipe_async_ends::both;
    const bool writer_async
        = async_ends == pipe_async_ends::writer || async_ends == pipe_async_ends::both;
    const DWORD bufsize
        = buffer_size ? static_cast<DWORD>(buffer_size) : default_pipe_buffer_size;

    ::SECURITY_ATTRIBUTES security = {};
    security.nLength               = sizeof security;
    security.bInheritHandle        = FALSE;
    security.lpSecurityDescriptor  = nullptr;

    std::wstring name;
    HANDLE       server = INVALID_HANDLE_VALUE;
    while (true) {
        name           = next_pipe_name();
        DWORD open_mode = PIPE_ACCESS_INBOUND | FILE_FLAG_FIRST_PIPE_INSTANCE;
        if (reader_async) {
            open_mode |= FILE_FLAG_OVERLAPPED;
        }
        server = ::CreateNamedPipeW(name.c_str(),
                                    open_mode,
                                    PIPE_TYPE_BYTE | PIPE_READMODE_BYTE | PIPE_WAIT,
                                    1,
                                    bufsize,
                                    bufsize,
                                    0,
                                    &security);
        if (server != INVALID_HANDLE_VALUE) {
            break;
        }
        const auto err = ::GetLastError();
        // Another pipe already holds the name: pick a new one
        if (err != ERROR_PIPE_BUSY && err != ERROR_ACCESS_DENIED) {
            throw_for_system_error_code(static_cast<int>(err), "::CreateNamedPipeW() failed");
        }
    }
    pipe_pair ret;
    ret.reader.reset(server);

    auto client = ::CreateFileW(name.c_str(),
                                GENERIC_WRITE,
                                0,
                                &security,
                                OPEN_EXISTING,
                                writer_async ? FILE_FLAG_OVERLAPPED : FILE_ATTRIBUTE_NORMAL,
                                nullptr);
    if (client == INVALID_HANDLE_VALUE) {
        throw_current_error("::CreateFileW() failed to open the client end of a pipe");
    }
    ret.writer.reset(client);

    connect_local(server, reader_async);
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

    auto op   = std::make_unique<pipe_read_op>();
    op->end   = end;
    op->buf   = buf;
    op->gen   = end->begin_op();
    auto done = op->done;
    end->abort_pending = [done]() mutable {
        done.fail(ERROR_OPERATION_ABORTED,
                  "async_pipe read end was closed while a read was pending");
    };

    auto result = done.result();
    auto okay   = ::ReadFile(end->handle.get(),
                           buf.data(),
                           static_cast<DWORD>(buf.size()),
                           nullptr,
                           static_cast<LPOVERLAPPED>(op->os_record_ptr()));
    if (!okay) {
        const auto err = ::GetLastError();
        if (err != ERROR_IO_PENDING) {
            // Finished synchronously with an error, so no completion record will arrive
            op->complete(0, static_cast<int>(err));
            return result;
        }
    }
    _reactor->expect_completion(std::move(op));
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

    auto st       = std::make_shared<write_state>();
    st->reactor   = _reactor;
    st->end       = end;
    st->buf       = buf;
    st->keepalive = std::move(keepalive);
    st->gen       = end->begin_op();
    auto done     = st->done;
    end->abort_pending = [done]() mutable {
        done.fail(ERROR_OPERATION_ABORTED,
                  "async_pipe write end was closed while a write was pending");
    };
    submit_write(st);
    return done.result();
}

#endif
