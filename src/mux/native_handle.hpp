#pragma once

#include <neo/platform.hpp>

#include <cstdint>
#include <type_traits>

namespace mux {

/**
 * @brief Traits for a Win32 HANDLE
 */
struct win32_handle_traits {
    using handle_type = void*;

    inline static const handle_type null_handle
        = reinterpret_cast<handle_type>(static_cast<std::intptr_t>(-1));

    static void close(handle_type) noexcept;
};

/**
 * @brief Traits for a POSIX file descriptor
 */
struct posix_fd_traits {
    using handle_type = int;

    inline static const handle_type null_handle = -1;

    static void close(handle_type) noexcept;
};

/// The handle traits for the current platform
using native_handle_traits
    = std::conditional_t<neo::os_is_windows, win32_handle_traits, posix_fd_traits>;

/// An OS resource handle for the current platform: a file descriptor or a HANDLE
using native_handle_t = native_handle_traits::handle_type;

/// The distinct "invalid" handle value for the current platform
inline const native_handle_t null_native_handle = native_handle_traits::null_handle;

/**
 * @brief Exclusive owner of an OS handle.
 *
 * The handle is never duplicated. Moving transfers ownership, and the moved-from object is left
 * holding the null handle.
 *
 * @tparam Traits The traits of the handle type, including how to close it
 */
template <typename Traits>
class unique_handle {
public:
    using handle_type = typename Traits::handle_type;

    inline static const handle_type null_handle = Traits::null_handle;

private:
    handle_type _handle = null_handle;

public:
    /// Default-construct a null (unopened) handle
    unique_handle() = default;
    /// Take ownership of the handle held by another object
    unique_handle(unique_handle&& other) noexcept { reset(other.release()); }
    /// Close our handle and take the handle held by another object
    unique_handle& operator=(unique_handle&& o) noexcept {
        reset(o.release());
        return *this;
    }

    explicit unique_handle(handle_type h) noexcept { reset(h); }

    /// Closes the handle
    ~unique_handle() { reset(handle_type{null_handle}); }

    /**
     * @brief Obtain a copy of the managed handle. Ownership is retained.
     */
    [[nodiscard]] handle_type get() const noexcept { return _handle; }

    /// Determine whether a handle is held
    [[nodiscard]] bool is_open() const noexcept { return get() != null_handle; }

    /// Close the handle, if any, and reset to null
    void close() noexcept {
        if (is_open()) {
            Traits::close(get());
        }
        _handle = null_handle;
    }

    /**
     * @brief Replace the handle managed by this object, closing the prior one
     */
    void reset(handle_type h) noexcept {
        close();
        _handle = h;
    }

    /**
     * @brief Relinquish ownership of the managed handle and return it to the caller.
     *
     * @note It is the duty of the caller to ensure the returned handle will be closed properly
     */
    [[nodiscard]] handle_type release() noexcept {
        auto h  = _handle;
        _handle = null_handle;
        return h;
    }
};

/// An owned handle for the current platform
using unique_native_handle = unique_handle<native_handle_traits>;

/**
 * @brief Put a descriptor into non-blocking mode. Does nothing on Windows, where asynchrony is
 * chosen when the handle is opened.
 */
void set_nonblocking(native_handle_t h);

/**
 * @brief Control whether spawned child processes inherit the handle
 */
void set_inheritable(native_handle_t h, bool inherit);

}  // namespace mux
