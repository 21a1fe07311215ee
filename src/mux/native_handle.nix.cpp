#include "./native_handle.hpp"

#include "./syserror.hpp"

#include <neo/assert.hpp>

using namespace mux;

#if !_WIN32

#include <fcntl.h>
#include <unistd.h>

void posix_fd_traits::close(int fd) noexcept { ::close(fd); }

void mux::set_nonblocking(int fd) {
    neo_assert(expects, fd != null_native_handle, "Cannot change the mode of a closed descriptor");
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        throw_current_error("::fcntl(F_GETFL) failed in mux::set_nonblocking()");
    }
    if (flags & O_NONBLOCK) {
        return;
    }
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        throw_current_error("::fcntl(F_SETFL) failed in mux::set_nonblocking()");
    }
}

void mux::set_inheritable(int fd, bool inherit) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0) {
        throw_current_error("::fcntl(F_GETFD) failed in mux::set_inheritable()");
    }
    flags = inherit ? (flags & ~FD_CLOEXEC) : (flags | FD_CLOEXEC);
    if (::fcntl(fd, F_SETFD, flags) == -1) {
        throw_current_error("::fcntl(F_SETFD) failed in mux::set_inheritable()");
    }
}

#endif
