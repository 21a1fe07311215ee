#include "./iocp_reactor.hpp"

#include "./log.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>

#if _WIN32

#include <windows.h>

#include <set>
#include <unordered_map>

using namespace mux;

namespace {

/// Completion key of records produced by real I/O on an associated handle
constexpr ULONG_PTR io_completion_key = 0;

}  // namespace

static_assert(sizeof(::OVERLAPPED) <= sizeof(completion_op::os_record::overlapped),
              "completion_op record storage is too small for an OVERLAPPED");

struct iocp_reactor::impl {
    HANDLE port = nullptr;

    std::set<HANDLE> registered;

    std::unordered_map<completion_op*, std::unique_ptr<completion_op>> outstanding;

    ~impl() {
        if (port) {
            ::CloseHandle(port);
        }
    }
};

iocp_reactor::iocp_reactor()
    : _impl(new impl) {
    _impl->port = ::CreateIoCompletionPort(INVALID_HANDLE_VALUE, nullptr, 0, 1);
    if (_impl->port == nullptr) {
        delete _impl;
        throw_current_error("::CreateIoCompletionPort() failed creating a completion port");
    }
}

iocp_reactor::~iocp_reactor() { delete _impl; }

void iocp_reactor::register_handle(HANDLE h) {
    neo_assert(expects,
               h != null_native_handle,
               "Attempted to register a closed handle with the reactor");
    neo_assert(expects,
               !is_registered(h),
               "Handle was registered with the reactor more than once");
    if (::CreateIoCompletionPort(h, _impl->port, io_completion_key, 0) == nullptr) {
        throw_current_error("::CreateIoCompletionPort() failed associating a handle");
    }
    _impl->registered.insert(h);
    log().trace("iocp_reactor: registered handle {}", static_cast<void*>(h));
}

void iocp_reactor::unregister_handle(HANDLE h) {
    // A handle stays associated with the port until it is closed. Only our bookkeeping changes.
    _impl->registered.erase(h);
}

bool iocp_reactor::is_registered(HANDLE h) const noexcept { return _impl->registered.contains(h); }

bool iocp_reactor::has_pending() const noexcept { return !_impl->outstanding.empty(); }

void iocp_reactor::expect_completion(std::unique_ptr<completion_op> op) {
    neo_assert(expects, op != nullptr, "expect_completion() requires an operation");
    auto raw = op.get();
    _impl->outstanding.emplace(raw, std::move(op));
}

void iocp_reactor::post_completion(completion_op& op, std::size_t transferred, int status) {
    // Posted records carry `status + 1` as their key, distinguishing them from real I/O
    auto key  = static_cast<ULONG_PTR>(status) + 1;
    auto okay = ::PostQueuedCompletionStatus(_impl->port,
                                             static_cast<DWORD>(transferred),
                                             key,
                                             static_cast<LPOVERLAPPED>(op.os_record_ptr()));
    if (!okay) {
        throw_current_error("::PostQueuedCompletionStatus() failed");
    }
}

std::size_t iocp_reactor::run_once(std::chrono::milliseconds timeout) {
    if (!has_pending()) {
        if (timeout.count() > 0) {
            ::Sleep(static_cast<DWORD>(timeout.count()));
        }
        return 0;
    }

    DWORD        transferred = 0;
    ULONG_PTR    key         = 0;
    LPOVERLAPPED ovl         = nullptr;
    const DWORD  wait_ms = timeout.count() < 0 ? INFINITE : static_cast<DWORD>(timeout.count());
    BOOL okay = ::GetQueuedCompletionStatus(_impl->port, &transferred, &key, &ovl, wait_ms);
    if (ovl == nullptr) {
        if (::GetLastError() == WAIT_TIMEOUT) {
            return 0;
        }
        throw_current_error("::GetQueuedCompletionStatus() failed");
    }

    int status = 0;
    if (key != io_completion_key) {
        status = static_cast<int>(key - 1);
    } else if (!okay) {
        status = static_cast<int>(::GetLastError());
    }

    auto op = completion_op::from_os_record(ovl);
    auto it = _impl->outstanding.find(op);
    neo_assert(invariant,
               it != _impl->outstanding.end(),
               "A completion record was dequeued for an operation the reactor does not own",
               transferred,
               status);
    auto owned = std::move(it->second);
    _impl->outstanding.erase(it);
    owned->complete(static_cast<std::size_t>(transferred), status);
    return 1;
}

void iocp_reactor::run_for(std::chrono::milliseconds duration) {
    using clock         = std::chrono::steady_clock;
    const auto deadline = clock::now() + duration;
    while (true) {
        const auto now = clock::now();
        if (now >= deadline) {
            break;
        }
        run_once(std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
    }
}

#endif
