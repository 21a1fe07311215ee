#pragma once

#include "./async_result.hpp"
#include "./buffer.hpp"
#include "./reactor.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mux {

/// The role of a mailbox endpoint
enum class mailbox_side {
    reader,
    writer,
};

/// Bytes reserved ahead of the payload for the shared header
inline constexpr std::size_t mailbox_header_reserve = 4096;

/// The capacity of a mailbox when none is given
inline constexpr std::size_t default_mailbox_capacity = 65536;

/// The largest capacity a mailbox may have
inline constexpr std::size_t max_mailbox_capacity = 0x3FFF'FFFF;

namespace detail {

/**
 * @brief The header at the start of a mailbox's shared region.
 *
 * `length` is the slot state: 0 when empty, the message size when full. While one side is copying
 * the payload it holds the slot by setting one of the claim bits. Every change to `length` and
 * `roles` is an atomic read-modify-write, because other processes touch them concurrently.
 */
struct mailbox_header {
    std::uint32_t              magic    = 0;
    std::uint32_t              capacity = 0;
    std::atomic<std::uint32_t> roles{0};
    std::atomic<std::uint32_t> length{0};
};

static_assert(std::atomic<std::uint32_t>::is_always_lock_free,
              "Mailbox header atomics must be lock-free to be shared between processes");
static_assert(sizeof(mailbox_header) <= mailbox_header_reserve);

inline constexpr std::uint32_t mailbox_magic = 0x6D75'786D;

/// Set in `length` while a writer copies a message into the empty slot
inline constexpr std::uint32_t slot_writing = 0x8000'0000;
/// Set in `length` while a reader copies a message out of the full slot
inline constexpr std::uint32_t slot_reading = 0x4000'0000;

/// The role-flag bit of the given side
constexpr std::uint32_t role_bit(mailbox_side side) noexcept {
    return side == mailbox_side::reader ? 1u : 2u;
}

/// The OS object name of a mailbox named `name`
std::string mailbox_object_name(std::string_view name);

/**
 * @brief Copy `msg` into the slot if it is empty.
 *
 * @return true if the message was deposited. The caller must then signal the "full" transition.
 */
bool try_deposit(mailbox_header& hdr, std::byte* payload, const_buffer msg) noexcept;

/**
 * @brief Copy the message out of the slot if it is full, emptying the slot.
 *
 * At most `out.size()` bytes are copied. The rest of a longer message is discarded.
 *
 * @return The number of bytes copied, or nullopt if the slot holds no message. After a value is
 * returned the caller must signal the "empty" transition.
 */
std::optional<std::size_t>
try_drain(mailbox_header& hdr, const std::byte* payload, mutable_buffer out) noexcept;

}  // namespace detail

/**
 * @brief The owner's handle to a named single-slot mailbox.
 *
 * Exactly one process creates a mailbox. Any process may then open reader and writer endpoints on
 * it by name with mailbox_endpoint::open(). Only the owner destroys it, exactly once, with
 * destroy(). Dropping the mailbox object without calling destroy() releases local resources only.
 */
class mailbox {
    /// The per-platform implementation of the mailbox
    struct impl;
    impl* _impl = nullptr;

    explicit mailbox(impl* p) noexcept
        : _impl(p) {}

    void _do_close() noexcept;

public:
    mailbox(mailbox&& o) noexcept
        : _impl(std::exchange(o._impl, nullptr)) {}

    mailbox& operator=(mailbox&& o) noexcept {
        _do_close();
        _impl = std::exchange(o._impl, nullptr);
        return *this;
    }

    ~mailbox() { _do_close(); }

    /**
     * @brief Create a new mailbox.
     *
     * @param name A name unique among live mailboxes. It is given a fixed prefix internally.
     * @param capacity The payload capacity in bytes. Must exceed mailbox_header_reserve.
     *
     * @throws std::system_error if a mailbox by that name exists or OS resources cannot be created
     */
    [[nodiscard]] static mailbox create(std::string_view name,
                                        std::size_t      capacity = default_mailbox_capacity);

    /**
     * @brief Remove the mailbox from the system. Existing endpoints keep their local mappings, but
     * no new endpoint can be opened.
     */
    void destroy();

    /// The name the mailbox was created with
    [[nodiscard]] const std::string& name() const noexcept;
    /// The payload capacity in bytes
    [[nodiscard]] std::size_t capacity() const noexcept;
    /// Whether destroy() has been called
    [[nodiscard]] bool is_destroyed() const noexcept;
};

/**
 * @brief A reader or writer attached to a mailbox by name.
 *
 * At most one operation may be pending on an endpoint at a time.
 */
class mailbox_endpoint {
public:
    /// The per-platform implementation of the endpoint
    struct impl;

private:
    std::shared_ptr<impl> _impl;

    explicit mailbox_endpoint(std::shared_ptr<impl> p) noexcept
        : _impl(std::move(p)) {}

    /// Per-platform impl of write(). `keepalive` owns the bytes of `msg`, or is null.
    async_result<void> _do_write(const_buffer msg, std::shared_ptr<const std::string> keepalive);

public:
    mailbox_endpoint(mailbox_endpoint&&) noexcept = default;
    mailbox_endpoint& operator=(mailbox_endpoint&& o) noexcept {
        close();
        _impl = std::move(o._impl);
        return *this;
    }

    /// Closes the endpoint if it is still open
    ~mailbox_endpoint() { close(); }

    /**
     * @brief Attach to an existing mailbox.
     *
     * @param r The reactor that will drive the endpoint's operations
     * @param name The name the mailbox was created with
     * @param side Whether to attach as reader or writer
     * @param register_handles If `false`, the endpoint is not registered with the reactor
     *
     * @throws std::system_error if no mailbox by that name exists
     */
    [[nodiscard]] static mailbox_endpoint
    open(reactor& r, std::string_view name, mailbox_side side, bool register_handles = true);

    /**
     * @brief Deposit a message once the slot is empty.
     *
     * The size must be at least one byte and at most capacity(). If the slot is empty now, the
     * message is deposited before this function returns.
     *
     * @note `msg` must remain valid and unmoved until the result is ready
     */
    [[nodiscard]] async_result<void> write(const_buffer msg) { return _do_write(msg, nullptr); }

    /// Deposit a message that is moved into the pending operation
    [[nodiscard]] async_result<void> write(std::string msg) {
        auto owned = std::make_shared<const std::string>(std::move(msg));
        return _do_write(neo::as_buffer(*owned), owned);
    }

    /**
     * @brief Take the message out of the slot once one is present.
     *
     * The result is the number of bytes copied into `buf`. A message longer than `buf` is
     * truncated, so `buf` should be at least capacity() bytes.
     *
     * @note `buf` must remain valid and unmoved until the result is ready
     */
    [[nodiscard]] async_result<std::size_t> read_some(mutable_buffer buf);

    /**
     * @brief Detach from the mailbox, clearing this endpoint's role flag. Does not destroy it.
     *
     * @param unregister If `false`, the endpoint's handle is left registered with the reactor
     */
    void close(bool unregister = true) noexcept;

    /// Whether the endpoint is attached
    [[nodiscard]] bool is_open() const noexcept;
    /// The side this endpoint was opened as
    [[nodiscard]] mailbox_side side() const noexcept;
    /// The payload capacity of the mailbox
    [[nodiscard]] std::size_t capacity() const noexcept;
    /// The current role-flag word: bit 0 set while a reader is attached, bit 1 for a writer
    [[nodiscard]] std::uint32_t attached_roles() const noexcept;
};

}  // namespace mux
