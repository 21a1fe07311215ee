#include "./syserror.hpp"

#if _WIN32

#include <windows.h>

using namespace mux;

int mux::get_current_error() noexcept { return static_cast<int>(::GetLastError()); }

io_error_kind mux::classify_io_error(int code) noexcept {
    switch (static_cast<DWORD>(code)) {
    case ERROR_IO_PENDING:
        return io_error_kind::would_block;
    case ERROR_BROKEN_PIPE:
    case ERROR_HANDLE_EOF:
    case ERROR_NO_DATA:
        return io_error_kind::end_of_stream;
    case ERROR_INVALID_HANDLE:
        return io_error_kind::handle_invalid;
    default:
        return io_error_kind::transfer_failure;
    }
}

#endif
