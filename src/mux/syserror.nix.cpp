#include "./syserror.hpp"

#if !_WIN32

#include <cerrno>

using namespace mux;

int mux::get_current_error() noexcept { return errno; }

io_error_kind mux::classify_io_error(int code) noexcept {
    if (code == EAGAIN || code == EWOULDBLOCK || code == EINTR) {
        return io_error_kind::would_block;
    }
    switch (code) {
    case EBADF:
        return io_error_kind::handle_invalid;
    default:
        // EPIPE on a write is a real failure: the reader is gone and the bytes are lost
        return io_error_kind::transfer_failure;
    }
}

#endif
