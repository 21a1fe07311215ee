#include "./mailbox.hpp"

#include <neo/ufmt.hpp>

#include <algorithm>
#include <cstring>

using namespace mux;

std::string detail::mailbox_object_name(std::string_view name) {
    return neo::ufmt("muxio-mailbox-{}", name);
}

bool detail::try_deposit(mailbox_header& hdr, std::byte* payload, const_buffer msg) noexcept {
    std::uint32_t expect = 0;
    if (!hdr.length.compare_exchange_strong(expect, slot_writing, std::memory_order_acquire)) {
        return false;
    }
    std::memcpy(payload, msg.data(), msg.size());
    hdr.length.exchange(static_cast<std::uint32_t>(msg.size()), std::memory_order_release);
    return true;
}

std::optional<std::size_t>
detail::try_drain(mailbox_header& hdr, const std::byte* payload, mutable_buffer out) noexcept {
    auto state = hdr.length.load(std::memory_order_acquire);
    if (state == 0 || (state & (slot_writing | slot_reading))) {
        return std::nullopt;
    }
    if (!hdr.length.compare_exchange_strong(state,
                                            state | slot_reading,
                                            std::memory_order_acquire)) {
        return std::nullopt;
    }
    const auto ncopy = std::min(static_cast<std::size_t>(state), out.size());
    std::memcpy(out.data(), payload, ncopy);
    hdr.length.exchange(0, std::memory_order_release);
    return ncopy;
}
