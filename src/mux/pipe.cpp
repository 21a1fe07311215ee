#include "./pipe.hpp"

#include "./log.hpp"

#include <neo/assert.hpp>

using namespace mux;

async_pipe::async_pipe(reactor& r, unique_native_handle reader, unique_native_handle writer)
    : _reactor(&r) {
    if (reader.is_open()) {
        _read_end         = std::make_shared<detail::pipe_end>();
        _read_end->handle = std::move(reader);
    }
    if (writer.is_open()) {
        _write_end         = std::make_shared<detail::pipe_end>();
        _write_end->handle = std::move(writer);
    }
}

async_pipe async_pipe::create(reactor& r, pipe_options opts) {
    auto pair = create_pipe(pipe_async_ends::both, opts.buffer_size);
    set_nonblocking(pair.reader.get());
    set_nonblocking(pair.writer.get());
    async_pipe ret{r, std::move(pair.reader), std::move(pair.writer)};
    if (opts.register_handles) {
        ret.register_handles();
    }
    log().debug("Created async_pipe [read={}, write={}]", ret.read_handle(), ret.write_handle());
    return ret;
}

async_pipe async_pipe::wrap(reactor& r, native_handle_t read_handle, native_handle_t write_handle) {
    // Take ownership first, so the handles are closed if anything below throws
    async_pipe ret{r, unique_native_handle{read_handle}, unique_native_handle{write_handle}};
    if (ret.has_reader()) {
        set_nonblocking(ret.read_handle());
    }
    if (ret.has_writer()) {
        set_nonblocking(ret.write_handle());
    }
    ret.register_handles();
    return ret;
}

void async_pipe::register_handles() {
    for (auto end : {_read_end.get(), _write_end.get()}) {
        if (end && end->handle.is_open() && !end->registered) {
            _reactor->register_handle(end->handle.get());
            end->registered = true;
        }
    }
}

void async_pipe::unwrap() noexcept {
    for (auto end : {_read_end.get(), _write_end.get()}) {
        if (end && end->handle.is_open() && end->registered) {
            _reactor->unregister_handle(end->handle.get());
            end->registered = false;
        }
    }
}

void async_pipe::_close_end(std::shared_ptr<detail::pipe_end>& end, bool unregister) noexcept {
    if (!end || !end->handle.is_open()) {
        return;
    }
    if (unregister && end->registered) {
        _reactor->unregister_handle(end->handle.get());
        end->registered = false;
    }
    if (end->busy) {
        log().debug("async_pipe end closed while an operation was pending. Failing the operation.");
        auto abort = std::move(end->abort_pending);
        end->finish_op(end->generation);
        ++end->generation;
        if (abort) {
            abort();
        }
    }
    end->handle.close();
}
