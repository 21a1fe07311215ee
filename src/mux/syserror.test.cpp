#include "./syserror.hpp"

#include <catch2/catch.hpp>

#include <neo/platform.hpp>

#include <cerrno>

#if _WIN32
#include <windows.h>
#endif

TEST_CASE("Throw for an OS error code") {
    try {
        mux::throw_for_system_error_code(ENOENT, "Looking for a file");
        FAIL_CHECK("No exception was thrown");
    } catch (const std::system_error& e) {
        CHECK(e.code() == mux::make_system_error_code(ENOENT));
    }
}

#if !_WIN32

TEST_CASE("Classify POSIX transfer errors") {
    CHECK(mux::classify_io_error(EAGAIN) == mux::io_error_kind::would_block);
    CHECK(mux::classify_io_error(EWOULDBLOCK) == mux::io_error_kind::would_block);
    CHECK(mux::classify_io_error(EINTR) == mux::io_error_kind::would_block);
    CHECK(mux::classify_io_error(EBADF) == mux::io_error_kind::handle_invalid);
    CHECK(mux::classify_io_error(EPIPE) == mux::io_error_kind::transfer_failure);
    CHECK(mux::classify_io_error(EIO) == mux::io_error_kind::transfer_failure);
}

#else

TEST_CASE("Classify Win32 transfer errors") {
    CHECK(mux::classify_io_error(ERROR_IO_PENDING) == mux::io_error_kind::would_block);
    CHECK(mux::classify_io_error(ERROR_BROKEN_PIPE) == mux::io_error_kind::end_of_stream);
    CHECK(mux::classify_io_error(ERROR_HANDLE_EOF) == mux::io_error_kind::end_of_stream);
    CHECK(mux::classify_io_error(ERROR_NO_DATA) == mux::io_error_kind::end_of_stream);
    CHECK(mux::classify_io_error(ERROR_INVALID_HANDLE) == mux::io_error_kind::handle_invalid);
    CHECK(mux::classify_io_error(ERROR_ACCESS_DENIED) == mux::io_error_kind::transfer_failure);
}

#endif
