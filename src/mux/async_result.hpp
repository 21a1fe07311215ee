#pragma once

#include "./syserror.hpp"

#include <neo/assert.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace mux {

template <typename T>
class async_completion;

namespace detail {

template <typename T>
struct async_state {
    using value_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::optional<value_type> value;
    std::error_code           error;
    std::string               message;
};

}  // namespace detail

/**
 * @brief The consumer side of a single asynchronous operation.
 *
 * Becomes ready exactly once, either with a value or with an OS error. Copies refer to the same
 * outcome. Not thread-safe: the outcome is produced and observed on the event loop's thread.
 *
 * @tparam T The value produced by the operation, or void
 */
template <typename T>
class async_result {
    using state_type = detail::async_state<T>;

    std::shared_ptr<state_type> _state;

    friend class async_completion<T>;

    explicit async_result(std::shared_ptr<state_type> st) noexcept
        : _state(std::move(st)) {}

public:
    /// Whether the operation has finished, successfully or not
    [[nodiscard]] bool ready() const noexcept {
        return _state->value.has_value() || bool(_state->error);
    }

    /// Whether the operation finished with an error
    [[nodiscard]] bool failed() const noexcept { return bool(_state->error); }

    /// The error the operation failed with, or an empty error code
    [[nodiscard]] std::error_code error() const noexcept { return _state->error; }

    /**
     * @brief Obtain the outcome of the finished operation.
     *
     * @throws std::system_error if the operation failed
     */
    T get() const {
        neo_assert(expects,
                   ready(),
                   "async_result::get() was called before the operation finished");
        if (failed()) {
            throw std::system_error(_state->error, _state->message);
        }
        if constexpr (std::is_void_v<T>) {
            return;
        } else {
            return *_state->value;
        }
    }
};

/**
 * @brief The producer side of a single asynchronous operation, held by the pending operation.
 */
template <typename T>
class async_completion {
    using state_type = detail::async_state<T>;

    std::shared_ptr<state_type> _state = std::make_shared<state_type>();

    void _expect_unfinished() const noexcept {
        neo_assert(expects,
                   !finished(),
                   "An asynchronous operation was completed more than once",
                   _state->message);
    }

public:
    /// Obtain the consumer side of this operation
    [[nodiscard]] async_result<T> result() const noexcept { return async_result<T>{_state}; }

    /// Whether an outcome has already been produced
    [[nodiscard]] bool finished() const noexcept { return result().ready(); }

    /// Finish a void operation successfully
    void complete() requires std::is_void_v<T> {
        _expect_unfinished();
        _state->value.emplace();
    }

    /// Finish the operation with a value
    template <typename U = T>
    requires(!std::is_void_v<T>) void complete(U&& value) {
        _expect_unfinished();
        _state->value.emplace(std::forward<U>(value));
    }

    /// Finish the operation with the given OS error code
    void fail(std::error_code ec, std::string_view message) {
        _expect_unfinished();
        neo_assert(expects, bool(ec), "Failed an operation with an empty error code", message);
        _state->message = std::string(message);
        _state->error   = ec;
    }

    /// Finish the operation with the given OS error number
    void fail(int os_error, std::string_view message) {
        fail(make_system_error_code(os_error), message);
    }
};

/**
 * @brief Create a result that is already finished successfully
 */
template <typename T, typename... Args>
async_result<T> ready_result(Args&&... args) {
    async_completion<T> done;
    done.complete(std::forward<Args>(args)...);
    return done.result();
}

/**
 * @brief Create a result that has already failed with the given OS error number
 */
template <typename T>
async_result<T> failed_result(int os_error, std::string_view message) {
    async_completion<T> done;
    done.fail(os_error, message);
    return done.result();
}

}  // namespace mux
