#include "./poll_reactor.hpp"

#include "./log.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>

#if !_WIN32

#include <poll.h>

#include <cerrno>
#include <vector>

using namespace mux;

void poll_reactor::register_handle(int fd) {
    neo_assert(expects, fd >= 0, "Attempted to register a closed descriptor with the reactor", fd);
    neo_assert(expects,
               !is_registered(fd),
               "Descriptor was registered with the reactor more than once",
               fd);
    _handles.emplace(fd, interest{});
    log().trace("poll_reactor: registered fd {}", fd);
}

void poll_reactor::unregister_handle(int fd) {
    auto erased = _handles.erase(fd);
    if (erased) {
        log().trace("poll_reactor: unregistered fd {}", fd);
    }
}

void poll_reactor::_arm(int fd, ready_callback interest::*slot, ready_callback cb) {
    auto it = _handles.find(fd);
    neo_assert(expects,
               it != _handles.end(),
               "Readiness was requested for a descriptor that is not registered with the reactor",
               fd);
    neo_assert(expects,
               !(it->second.*slot),
               "A second operation of the same direction was armed on one descriptor",
               fd);
    it->second.*slot = std::move(cb);
}

void poll_reactor::add_read_ready(int fd, ready_callback cb) {
    _arm(fd, &interest::on_read, std::move(cb));
}

void poll_reactor::add_write_ready(int fd, ready_callback cb) {
    _arm(fd, &interest::on_write, std::move(cb));
}

bool poll_reactor::has_pending() const noexcept {
    for (auto& [fd, in] : _handles) {
        if (in.on_read || in.on_write) {
            return true;
        }
    }
    return false;
}

bool poll_reactor::_dispatch(int fd, ready_callback interest::*slot) {
    auto it = _handles.find(fd);
    if (it == _handles.end() || !(it->second.*slot)) {
        return false;
    }
    auto cb          = std::move(it->second.*slot);
    it->second.*slot = nullptr;
    bool finished    = cb(fd);
    if (!finished) {
        // The callback may have unregistered or re-armed the descriptor
        it = _handles.find(fd);
        if (it != _handles.end() && !(it->second.*slot)) {
            it->second.*slot = std::move(cb);
        }
    }
    return true;
}

std::size_t poll_reactor::run_once(std::chrono::milliseconds timeout) {
    std::vector<::pollfd> fds;
    for (auto& [fd, in] : _handles) {
        ::pollfd pfd = {};
        pfd.fd       = fd;
        if (in.on_read) {
            pfd.events |= POLLIN;
        }
        if (in.on_write) {
            pfd.events |= POLLOUT;
        }
        if (pfd.events) {
            fds.push_back(pfd);
        }
    }

    if (fds.empty()) {
        if (timeout.count() > 0) {
            // Nothing to wait on: behave as a sleep
            ::poll(nullptr, 0, static_cast<int>(timeout.count()));
        }
        return 0;
    }

    const int wait_ms = timeout.count() < 0 ? -1 : static_cast<int>(timeout.count());
    const int rc      = ::poll(fds.data(), static_cast<::nfds_t>(fds.size()), wait_ms);
    if (rc < 0) {
        if (errno == EINTR) {
            return 0;
        }
        throw_current_error("::poll() failed in mux::poll_reactor::run_once()");
    }
    if (rc == 0) {
        return 0;
    }

    std::size_t n_dispatched = 0;
    for (const ::pollfd& pfd : fds) {
        if (pfd.revents == 0) {
            continue;
        }
        // Hang-up and error conditions wake both directions. The retried syscall reports them.
        const short wake_any = POLLHUP | POLLERR | POLLNVAL;
        if ((pfd.events & POLLIN) && (pfd.revents & (POLLIN | wake_any))) {
            n_dispatched += _dispatch(pfd.fd, &interest::on_read) ? 1 : 0;
        }
        if ((pfd.events & POLLOUT) && (pfd.revents & (POLLOUT | wake_any))) {
            n_dispatched += _dispatch(pfd.fd, &interest::on_write) ? 1 : 0;
        }
    }
    return n_dispatched;
}

void poll_reactor::run_for(std::chrono::milliseconds duration) {
    using clock         = std::chrono::steady_clock;
    const auto deadline = clock::now() + duration;
    while (true) {
        const auto now = clock::now();
        if (now >= deadline) {
            break;
        }
        auto remain = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        run_once(remain);
    }
}

#endif
