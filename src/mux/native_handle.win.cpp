#include "./native_handle.hpp"

#include "./syserror.hpp"

using namespace mux;

#if _WIN32

#include <windows.h>

void win32_handle_traits::close(HANDLE h) noexcept { ::CloseHandle(h); }

void mux::set_nonblocking(HANDLE) {}

void mux::set_inheritable(HANDLE h, bool inherit) {
    if (!::SetHandleInformation(h, HANDLE_FLAG_INHERIT, inherit ? HANDLE_FLAG_INHERIT : 0)) {
        throw_current_error("::SetHandleInformation() failed in mux::set_inheritable()");
    }
}

#endif
