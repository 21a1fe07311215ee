#pragma once

#include <string_view>
#include <system_error>

namespace mux {

/// Get the current OS error code
[[nodiscard]] int get_current_error() noexcept;
/// Get the current OS error code wrapped in a std::error_code
[[nodiscard]] std::error_code get_current_error_code() noexcept;

/// Wrap an OS error code number in a std::error_code of the system category
[[nodiscard]] inline std::error_code make_system_error_code(int code) noexcept {
    return std::error_code(code, std::system_category());
}

/**
 * @brief How an OS error code observed during an asynchronous transfer should be treated
 */
enum class io_error_kind {
    /// The operation cannot make progress now. Re-arm interest and try again later.
    would_block,
    /// The peer has gone away. Reads report this as a zero-length transfer.
    end_of_stream,
    /// The handle itself is unusable. The owning endpoint is permanently broken.
    handle_invalid,
    /// Any other failure. Fails only the operation that observed it.
    transfer_failure,
};

/**
 * @brief Classify an OS error code returned by a read or write on a pipe-like handle
 *
 * @param code An OS-level error code number (errno or a Win32 error)
 */
[[nodiscard]] io_error_kind classify_io_error(int code) noexcept;

/**
 * @brief Throw a std::system_error that contains the given OS error code and the associated string
 * message
 *
 * @param code An OS-level error code number
 * @param message A message to include in the exception
 */
[[noreturn]] void throw_for_system_error_code(int code, std::string_view message);

/**
 * @brief Throw a std::system_error for the current OS error code, using the associated string
 * message
 *
 * @param message A string message to include in the exception
 */
[[noreturn]] void throw_current_error(std::string_view message);

}  // namespace mux
