#include "./mailbox.hpp"

#include "./log.hpp"
#include "./native_handle.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#if !_WIN32

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <functional>
#include <new>

using namespace mux;

namespace {

std::string shm_path(std::string_view name) {
    return "/" + detail::mailbox_object_name(name);
}

std::string fifo_path(std::string_view name, std::string_view which) {
    return neo::ufmt("/tmp/{}.{}", detail::mailbox_object_name(name), which);
}

void remove_objects(std::string_view name) noexcept {
    ::shm_unlink(shm_path(name).c_str());
    ::unlink(fifo_path(name, "full").c_str());
    ::unlink(fifo_path(name, "empty").c_str());
}

/// Post one wake token. A FIFO that is already full of tokens still wakes its waiter.
int post_token(int fd) noexcept {
    const char token = 1;
    while (true) {
        if (::write(fd, &token, 1) == 1) {
            return 0;
        }
        const int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (classify_io_error(err) == io_error_kind::would_block) {
            return 0;
        }
        return err;
    }
}

/// Discard all pending wake tokens
void drain_tokens(int fd) noexcept {
    char sink[64];
    while (true) {
        auto nread = ::read(fd, sink, sizeof sink);
        if (nread > 0) {
            continue;
        }
        if (nread == -1 && errno == EINTR) {
            continue;
        }
        return;
    }
}

}  // namespace

struct mailbox::impl {
    std::string name;
    std::size_t capacity  = 0;
    bool        destroyed = false;
};

struct mailbox_endpoint::impl {
    reactor*     loop = nullptr;
    std::string  name;
    mailbox_side side;
    std::byte*   base     = nullptr;
    std::size_t  map_size = 0;
    std::size_t  capacity = 0;

    /// The FIFO carrying the transition this side waits for
    unique_native_handle wait_fifo;
    /// The FIFO carrying the transition this side causes
    unique_native_handle signal_fifo;

    bool                  registered = false;
    bool                  busy       = false;
    std::uint64_t         generation = 0;
    std::function<void()> abort_pending;

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
            ::munmap(base, map_size);
        }
    }
};

mailbox mailbox::create(std::string_view name, std::size_t capacity) {
    neo_assertion_breadcrumbs("Creating a mailbox", name, capacity);
    neo_assert(expects,
               capacity > mailbox_header_reserve && capacity <= max_mailbox_capacity,
               "Mailbox capacity is out of range",
               capacity,
               mailbox_header_reserve,
               max_mailbox_capacity);

    const auto shm_name = shm_path(name);
    unique_native_handle shm{::shm_open(shm_name.c_str(), O_CREAT | O_EXCL | O_RDWR, 0666)};
    if (!shm.is_open()) {
        throw_current_error(neo::ufmt("Failed to create shared memory for mailbox [{}]", name));
    }

    try {
        const auto total = mailbox_header_reserve + capacity;
        if (::ftruncate(shm.get(), static_cast<off_t>(total)) == -1) {
            throw_current_error(neo::ufmt("Failed to size shared memory for mailbox [{}]", name));
        }
        auto base = ::mmap(nullptr, mailbox_header_reserve, PROT_READ | PROT_WRITE, MAP_SHARED, shm.get(), 0);
        if (base == MAP_FAILED) {
            throw_current_error(neo::ufmt("Failed to map shared memory for mailbox [{}]", name));
        }
        auto hdr      = new (base) detail::mailbox_header;
        hdr->capacity = static_cast<std::uint32_t>(capacity);
        hdr->magic    = detail::mailbox_magic;
        ::munmap(base, mailbox_header_reserve);

        for (auto which : {"full", "empty"}) {
            if (::mkfifo(fifo_path(name, which).c_str(), 0666) == -1) {
                throw_current_error(
                    neo::ufmt("Failed to create the [{}] signal of mailbox [{}]", which, name));
            }
        }
    } catch (const std::system_error&) {
        remove_objects(name);
        throw;
    }

    log().debug("Created mailbox [{}] with capacity {}", name, capacity);
    return mailbox{new impl{std::string(name), capacity}};
}

void mailbox::destroy() {
    neo_assert(expects, _impl != nullptr, "destroy() was called on a moved-from mailbox");
    neo_assert(expects,
               !_impl->destroyed,
               "A mailbox was destroyed more than once",
               _impl->name);
    _impl->destroyed = true;
    const auto& name = _impl->name;
    if (::shm_unlink(shm_path(name).c_str()) == -1) {
        throw_current_error(neo::ufmt("Failed to remove shared memory of mailbox [{}]", name));
    }
    for (auto which : {"full", "empty"}) {
        if (::unlink(fifo_path(name, which).c_str()) == -1) {
            throw_current_error(
                neo::ufmt("Failed to remove the [{}] signal of mailbox [{}]", which, name));
        }
    }
    log().debug("Destroyed mailbox [{}]", name);
}

void mailbox::_do_close() noexcept { delete std::exchange(_impl, nullptr); }

const std::string& mailbox::name() const noexcept { return _impl->name; }
std::size_t        mailbox::capacity() const noexcept { return _impl->capacity; }
bool               mailbox::is_destroyed() const noexcept { return _impl->destroyed; }

mailbox_endpoint
mailbox_endpoint::open(reactor& r, std::string_view name, mailbox_side side, bool register_handles) {
    neo_assertion_breadcrumbs("Opening a mailbox endpoint", name);
    auto st  = std::make_shared<impl>();
    st->loop = &r;
    st->name = std::string(name);
    st->side = side;

    {
        unique_native_handle shm{::shm_open(shm_path(name).c_str(), O_RDWR, 0)};
        if (!shm.is_open()) {
            throw_current_error(neo::ufmt("Failed to open mailbox [{}]", name));
        }
        struct ::stat st_buf = {};
        if (::fstat(shm.get(), &st_buf) == -1) {
            throw_current_error(neo::ufmt("Failed to inspect mailbox [{}]", name));
        }
        const auto size = static_cast<std::size_t>(st_buf.st_size);
        if (size <= mailbox_header_reserve) {
            throw_for_system_error_code(EINVAL, neo::ufmt("[{}] is not a valid mailbox", name));
        }
        auto base = ::mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, shm.get(), 0);
        if (base == MAP_FAILED) {
            throw_current_error(neo::ufmt("Failed to map mailbox [{}]", name));
        }
        st->base     = static_cast<std::byte*>(base);
        st->map_size = size;
    }

    auto& hdr = st->header();
    if (hdr.magic != detail::mailbox_magic
        || mailbox_header_reserve + hdr.capacity > st->map_size) {
        throw_for_system_error_code(EINVAL, neo::ufmt("[{}] is not a valid mailbox", name));
    }
    st->capacity = hdr.capacity;

    auto open_fifo = [&](std::string_view which) {
        // Opened read-write so that neither open blocks waiting for a peer
        unique_native_handle fd{
            ::open(fifo_path(name, which).c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC)};
        if (!fd.is_open()) {
            throw_current_error(
                neo::ufmt("Failed to open the [{}] signal of mailbox [{}]", which, name));
        }
        return fd;
    };
    // The reader waits for "full" and posts "empty". The writer does the opposite.
    const bool is_reader = side == mailbox_side::reader;
    st->wait_fifo        = open_fifo(is_reader ? "full" : "empty");
    st->signal_fifo      = open_fifo(is_reader ? "empty" : "full");

    hdr.roles.fetch_or(detail::role_bit(side), std::memory_order_acq_rel);
    mailbox_endpoint ret{std::move(st)};
    if (register_handles) {
        r.register_handle(ret._impl->wait_fifo.get());
        ret._impl->registered = true;
    }
    log().debug("Opened mailbox [{}] as {}", name, is_reader ? "reader" : "writer");
    return ret;
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
        done.fail(EBADF, "Mailbox endpoint was closed while a write was pending");
    };

    auto attempt = [st, msg, keepalive, done, gen](int) mutable -> bool {
        if (done.finished()) {
            return true;
        }
        // Tokens posted before this point are for transitions the check below will observe
        drain_tokens(st->wait_fifo.get());
        if (!detail::try_deposit(st->header(), st->payload(), msg)) {
            return false;
        }
        st->finish_op(gen);
        if (int err = post_token(st->signal_fifo.get())) {
            done.fail(err, "Failed to signal a full mailbox");
        } else {
            done.complete();
        }
        return true;
    };

    auto      result = done.result();
    const int fd     = st->wait_fifo.get();
    if (!attempt(fd)) {
        st->loop->add_read_ready(fd, std::move(attempt));
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
        done.fail(EBADF, "Mailbox endpoint was closed while a read was pending");
    };

    auto attempt = [st, buf, done, gen](int) mutable -> bool {
        if (done.finished()) {
            return true;
        }
        drain_tokens(st->wait_fifo.get());
        auto nread = detail::try_drain(st->header(), st->payload(), buf);
        if (!nread) {
            return false;
        }
        st->finish_op(gen);
        if (int err = post_token(st->signal_fifo.get())) {
            done.fail(err, "Failed to signal an empty mailbox");
        } else {
            done.complete(*nread);
        }
        return true;
    };

    auto      result = done.result();
    const int fd     = st->wait_fifo.get();
    if (!attempt(fd)) {
        st->loop->add_read_ready(fd, std::move(attempt));
    }
    return result;
}

void mailbox_endpoint::close(bool unregister) noexcept {
    if (!is_open()) {
        return;
    }
    auto st = std::move(_impl);
    if (unregister && st->registered) {
        st->loop->unregister_handle(st->wait_fifo.get());
        st->registered = false;
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
    // Any callback still armed holds its own reference to the state and sees a finished result
}

bool mailbox_endpoint::is_open() const noexcept { return _impl != nullptr; }
mailbox_side mailbox_endpoint::side() const noexcept { return _impl->side; }
std::size_t  mailbox_endpoint::capacity() const noexcept { return _impl->capacity; }

std::uint32_t mailbox_endpoint::attached_roles() const noexcept {
    return _impl->header().roles.load(std::memory_order_acquire);
}

#endif
