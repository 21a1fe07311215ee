#include "./mailbox.hpp"

#include "./log.hpp"
#include "./native_handle.hpp"
#include "./syserror.hpp"
#include "./text.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#if _WIN32

#include <windows.h>

#include <atomic>
#include <functional>
#include <new>

using namespace mux;

namespace {

std::wstring mapping_name(std::string_view name) {
    return wide_encode(detail::mailbox_object_name(name));
}

std::wstring event_name(std::string_view name, std::string_view which) {
    return wide_encode(neo::ufmt("{}-{}", detail::mailbox_object_name(name), which));
}

class mailbox_wait_op;

}  // namespace

struct mailbox::impl {
    std::string          name;
    std::size_t          capacity  = 0;
    bool                 destroyed = false;
    unique_native_handle mapping;
    unique_native_handle full_event;
    unique_native_handle empty_event;
};

struct mailbox_endpoint::impl {
    reactor*     loop = nullptr;
    std::string  name;
    mailbox_side side;
    std::byte*   base     = nullptr;
    std::size_t  capacity = 0;

    unique_native_handle mapping;
    /// The event set by the transition this side waits for
    unique_native_handle wait_event;
    /// The event this side sets after its own transition
    unique_native_handle signal_event;

    bool                  busy       = false;
    std::uint64_t         generation = 0;
    std::function<void()> abort_pending;
    /// The wait currently registered with the thread pool, if any
    mailbox_wait_op* pending_wait = nullptr;

    detail::mailbox_header& header() noexcept {
        return *reinterpret_cast<detail::mailbox_header*>(base);
    }
    std::byte* payload() noexcept { return base + mailbox_header_reserve; }

    std::uint64_t begin_op() noexcept {
        busy = true;
        return ++generation;
    }

    void finish_op(std::uint64_t gen) noexcept {
        if (gen == generation) {
            busy          = false;
            abort_pending = nullptr;
        }
    }

    ~impl() {
        if (base) {
            ::UnmapViewOfFile(base);
        }
    }
};

namespace {

/// Retry the operation. Returns `true` once the operation has finished.
using attempt_fn = std::function<bool()>;
/// Fail the operation with an OS error
using fail_fn = std::function<void(int)>;

void arm_wait(std::shared_ptr<mailbox_endpoint::impl> st, attempt_fn attempt, fail_fn fail);

/**
 * A thread-pool wait on the endpoint's event. The pool callback only posts a record to the
 * reactor. The attempt runs on the reactor's thread when that record is dequeued.
 */
class mailbox_wait_op : public completion_op {
public:
    std::shared_ptr<mailbox_endpoint::impl> st;
    attempt_fn                              attempt;
    fail_fn                                 fail;
    HANDLE                                  wait_handle = nullptr;
    std::atomic<bool>                       posted{false};

    /// Post this operation's record once, from whichever side gets there first
    void post(int status) {
        if (!posted.exchange(true)) {
            st->loop->post_completion(*this, 0, status);
        }
    }

    static VOID CALLBACK on_signaled(PVOID param, BOOLEAN) {
        auto self = static_cast<mailbox_wait_op*>(param);
        try {
            self->post(0);
        } catch (const std::system_error& e) {
            log().error("Failed to deliver a mailbox wake-up to the reactor: {}", e.what());
        }
    }

    void complete(std::size_t, int status) override {
        if (wait_handle) {
            ::UnregisterWaitEx(wait_handle, nullptr);
            wait_handle = nullptr;
        }
        if (st->pending_wait == this) {
            st->pending_wait = nullptr;
        }
        if (status != 0) {
            fail(status);
            return;
        }
        if (!attempt()) {
            arm_wait(std::move(st), std::move(attempt), std::move(fail));
        }
    }
};

void arm_wait(std::shared_ptr<mailbox_endpoint::impl> st, attempt_fn attempt, fail_fn fail) {
    auto op     = std::make_unique<mailbox_wait_op>();
    op->st      = st;
    op->attempt = std::move(attempt);
    op->fail    = std::move(fail);
    auto raw    = op.get();
    // The reactor owns the op before the pool can post for it
    st->loop->expect_completion(std::move(op));
    st->pending_wait = raw;
    if (!::RegisterWaitForSingleObject(&raw->wait_handle,
                                       st->wait_event.get(),
                                       &mailbox_wait_op::on_signaled,
                                       raw,
                                       INFINITE,
                                       WT_EXECUTEONLYONCE | WT_EXECUTEINWAITTHREAD)) {
        raw->wait_handle = nullptr;
        raw->post(static_cast<int>(::GetLastError()));
    }
}

}  // namespace

mailbox mailbox::create(std::string_view name, std::size_t capacity) {
    neo_assertion_breadcrumbs("Creating a mailbox", name, capacity);
    neo_assert(expects,
               capacity > mailbox_header_reserve && capacity <= max_mailbox_capacity,
               "Mailbox capacity is out of range",
               capacity,
               mailbox_header_reserve,
               max_mailbox_capacity);

    auto imp      = std::make_unique<impl>();
    imp->name     = std::string(name);
    imp->capacity = capacity;

    const auto total = static_cast<unsigned long long>(mailbox_header_reserve + capacity);
    auto       h     = ::CreateFileMappingW(INVALID_HANDLE_VALUE,
                                  nullptr,
                                  PAGE_READWRITE,
                                  static_cast<DWORD>(total >> 32),
                                  static_cast<DWORD>(total & 0xFFFF'FFFF),
                                  mapping_name(name).c_str());
    if (h == nullptr) {
        throw_current_error(neo::ufmt("Failed to create shared memory for mailbox [{}]", name));
    }
    imp->mapping.reset(h);
    if (::GetLastError() == ERROR_ALREADY_EXISTS) {
        throw_for_system_error_code(ERROR_ALREADY_EXISTS,
                                    neo::ufmt("Mailbox [{}] already exists", name));
    }

    auto base = ::MapViewOfFile(h, FILE_MAP_ALL_ACCESS, 0, 0, mailbox_header_reserve);
    if (base == nullptr) {
        throw_current_error(neo::ufmt("Failed to map shared memory for mailbox [{}]", name));
    }
    auto hdr      = new (base) detail::mailbox_header;
    hdr->capacity = static_cast<std::uint32_t>(capacity);
    hdr->magic    = detail::mailbox_magic;
    ::UnmapViewOfFile(base);

    auto make_event = [&](std::string_view which) {
        // Auto-reset, so one wake-up releases one waiter
        auto ev = ::CreateEventW(nullptr, FALSE, FALSE, event_name(name, which).c_str());
        if (ev == nullptr) {
            throw_current_error(
                neo::ufmt("Failed to create the [{}] signal of mailbox [{}]", which, name));
        }
        return unique_native_handle{ev};
    };
    imp->full_event  = make_event("full");
    imp->empty_event = make_event("empty");

    log().debug("Created mailbox [{}] with capacity {}", name, capacity);
    return mailbox{imp.release()};
}

void mailbox::destroy() {
    neo_assert(expects, _impl != nullptr, "destroy() was called on a moved-from mailbox");
    neo_assert(expects,
               !_impl->destroyed,
               "A mailbox was destroyed more than once",
               _impl->name);
    _impl->destroyed = true;
    // The kernel objects disappear once the last endpoint closes its handles
    _impl->mapping.close();
    _impl->full_event.close();
    _impl->empty_event.close();
    log().debug("Destroyed mailbox [{}]", _impl->name);
}

void mailbox::_do_close() noexcept { delete std::exchange(_impl, nullptr); }

const std::string& mailbox::name() const noexcept { return _impl->name; }
std::size_t        mailbox::capacity() const noexcept { return _impl->capacity; }
bool               mailbox::is_destroyed() const noexcept { return _impl->destroyed; }

mailbox_endpoint mailbox_endpoint::open(reactor& r, std::string_view name, mailbox_side side, bool) {
    neo_assertion_breadcrumbs("Opening a mailbox endpoint", name);
    auto st  = std::make_shared<impl>();
    st->loop = &r;
    st->name = std::string(name);
    st->side = side;

    auto h = ::OpenFileMappingW(FILE_MAP_ALL_ACCESS, FALSE, mapping_name(name).c_str());
    if (h == nullptr) {
        throw_current_error(neo::ufmt("Failed to open mailbox [{}]", name));
    }
    st->mapping.reset(h);
    auto base = ::MapViewOfFile(h, FILE_MAP_ALL_ACCESS, 0, 0, 0);
    if (base == nullptr) {
        throw_current_error(neo::ufmt("Failed to map mailbox [{}]", name));
    }
    st->base = static_cast<std::byte*>(base);

    ::MEMORY_BASIC_INFORMATION info = {};
    ::VirtualQuery(base, &info, sizeof info);
    auto& hdr = st->header();
    if (hdr.magic != detail::mailbox_magic
        || mailbox_header_reserve + hdr.capacity > info.RegionSize) {
        throw_for_system_error_code(ERROR_INVALID_DATA,
                                    neo::ufmt("[{}] is not a valid mailbox", name));
    }
    st->capacity = hdr.capacity;

    auto open_event = [&](std::string_view which) {
        auto ev = ::OpenEventW(EVENT_MODIFY_STATE | SYNCHRONIZE,
                               FALSE,
                               event_name(name, which).c_str());
        if (ev == nullptr) {
            throw_current_error(
                neo::ufmt("Failed to open the [{}] signal of mailbox [{}]", which, name));
        }
        return unique_native_handle{ev};
    };
    const bool is_reader = side == mailbox_side::reader;
    st->wait_event       = open_event(is_reader ? "full" : "empty");
    st->signal_event     = open_event(is_reader ? "empty" : "full");

    // Events are not associated with the completion port. Waits go through the thread pool.
    hdr.roles.fetch_or(detail::role_bit(side), std::memory_order_acq_rel);
    log().debug("Opened mailbox [{}] as {}", name, is_reader ? "reader" : "writer");
    return mailbox_endpoint{std::move(st)};
}

async_result<void> mailbox_endpoint::_do_write(const_buffer                       msg,
                                               std::shared_ptr<const std::string> keepalive) {
    neo_assertion_breadcrumbs("Writing to a mailbox", msg.size());
    neo_assert(expects, is_open(), "write() was called on a closed mailbox endpoint");
    auto st = _impl;
    neo_assert(expects,
               st->side == mailbox_side::writer,
               "write() was called on a mailbox reader endpoint",
               st->name);
    neo_assert(expects,
               msg.size() > 0 && msg.size() <= st->capacity,
               "Mailbox message size is out of range",
               msg.size(),
               st->capacity);
    neo_assert(expects,
               !st->busy,
               "A second operation was issued on a mailbox endpoint while one is still pending");

    async_completion<void> done;
    const auto             gen = st->begin_op();
    st->abort_pending          = [done]() mutable {
        done.fail(ERROR_OPERATION_ABORTED, "Mailbox endpoint was closed while a write was pending");
    };

    // Holds `st` weakly. The wait op holds the strong reference.
    std::weak_ptr<impl> weak = st;
    attempt_fn attempt = [weak, msg, keepalive, done, gen]() mutable -> bool {
        auto st = weak.lock();
        if (!st || done.finished()) {
            return true;
        }
        if (!detail::try_deposit(st->header(), st->payload(), msg)) {
            return false;
        }
        st->finish_op(gen);
        if (!::SetEvent(st->signal_event.get())) {
            done.fail(static_cast<int>(::GetLastError()), "Failed to signal a full mailbox");
        } else {
            done.complete();
        }
        return true;
    };
    fail_fn fail = [weak, done, gen](int err) mutable {
        if (done.finished()) {
            return;
        }
        if (auto st = weak.lock()) {
            st->finish_op(gen);
        }
        done.fail(err, "Waiting for an empty mailbox failed");
    };

    auto result = done.result();
    if (!attempt()) {
        arm_wait(st, std::move(attempt), std::move(fail));
    }
    return result;
}

async_result<std::size_t> mailbox_endpoint::read_some(mutable_buffer buf) {
    neo_assertion_breadcrumbs("Reading from a mailbox", buf.size());
    neo_assert(expects, is_open(), "read_some() was called on a closed mailbox endpoint");
    auto st = _impl;
    neo_assert(expects,
               st->side == mailbox_side::reader,
               "read_some() was called on a mailbox writer endpoint",
               st->name);
    neo_assert(expects, buf.size() > 0, "read_some() was given an empty buffer");
    neo_assert(expects,
               !st->busy,
               "A second operation was issued on a mailbox endpoint while one is still pending");

    async_completion<std::size_t> done;
    const auto                    gen = st->begin_op();
    st->abort_pending                 = [done]() mutable {
        done.fail(ERROR_OPERATION_ABORTED, "Mailbox endpoint was closed while a read was pending");
    };

    std::weak_ptr<impl> weak    = st;
    attempt_fn          attempt = [weak, buf, done, gen]() mutable -> bool {
        auto st = weak.lock();
        if (!st || done.finished()) {
            return true;
        }
        auto nread = detail::try_drain(st->header(), st->payload(), buf);
        if (!nread) {
            return false;
        }
        st->finish_op(gen);
        if (!::SetEvent(st->signal_event.get())) {
            done.fail(static_cast<int>(::GetLastError()), "Failed to signal an empty mailbox");
        } else {
            done.complete(*nread);
        }
        return true;
    };
    fail_fn fail = [weak, done, gen](int err) mutable {
        if (done.finished()) {
            return;
        }
        if (auto st = weak.lock()) {
            st->finish_op(gen);
        }
        done.fail(err, "Waiting for a full mailbox failed");
    };

    auto result = done.result();
    if (!attempt()) {
        arm_wait(st, std::move(attempt), std::move(fail));
    }
    return result;
}

void mailbox_endpoint::close(bool) noexcept {
    if (!is_open()) {
        return;
    }
    auto st = std::move(_impl);
    if (auto wait = std::exchange(st->pending_wait, nullptr)) {
        // Blocks until a callback already in flight has returned
        if (wait->wait_handle) {
            ::UnregisterWaitEx(std::exchange(wait->wait_handle, nullptr), INVALID_HANDLE_VALUE);
        }
        try {
            wait->post(ERROR_OPERATION_ABORTED);
        } catch (const std::system_error& e) {
            log().warn("Failed to release a pending mailbox wait: {}", e.what());
        }
    }
    if (st->busy) {
        auto abort = std::move(st->abort_pending);
        st->finish_op(st->generation);
        ++st->generation;
        if (abort) {
            abort();
        }
    }
    st->header().roles.fetch_and(~detail::role_bit(st->side), std::memory_order_acq_rel);
    log().debug("Closed mailbox endpoint of [{}]", st->name);
}

bool mailbox_endpoint::is_open() const noexcept { return _impl != nullptr; }
mailbox_side mailbox_endpoint::side() const noexcept { return _impl->side; }
std::size_t  mailbox_endpoint::capacity() const noexcept { return _impl->capacity; }

std::uint32_t mailbox_endpoint::attached_roles() const noexcept {
    return _impl->header().roles.load(std::memory_order_acquire);
}

#endif
