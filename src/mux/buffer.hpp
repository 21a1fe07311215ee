#pragma once

#include <neo/as_buffer.hpp>
#include <neo/const_buffer.hpp>
#include <neo/mutable_buffer.hpp>

namespace mux {

/**
 * @brief A borrowed, read-only view of bytes given to an asynchronous write.
 *
 * @note The viewed bytes must remain valid and unmoved until the result of the operation that
 * received the buffer is ready. Operations that cannot guarantee this should use the overloads
 * that take ownership of a std::string instead.
 */
using neo::const_buffer;

/**
 * @brief A borrowed, writable view of bytes given to an asynchronous read.
 *
 * @note Same lifetime contract as const_buffer: valid and unmoved until the result is ready.
 */
using neo::mutable_buffer;

}  // namespace mux
