#pragma once

/// @file result.hpp
/// @brief Result<T,E>: success value or error, returned instead of throwing.

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace lw {

/// Success-or-error return type used across the library surface.
///
/// The library's own error type is foundation::WatchError; see
/// foundation::WatchResult<T>.
///
/// @tparam T The success value type (may be move-only, or void).
/// @tparam E The error type.
///
/// Example:
/// @code
///   auto result = LocationWatcher::open("conf/app.yaml");
///   if (!result) {
///       log(result.error().message());
///       return;
///   }
///   auto watcher = std::move(result).value();
/// @endcode
template <typename T, typename E>
class Result {
public:
    using ValueType = T;
    using ErrorType = E;

    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(data_)); }

    /// The value, or @p fallback on error.
    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }
    [[nodiscard]] T valueOr(T fallback) && {
        return hasValue() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Specialization for operations that only succeed or fail.
template <typename E>
class Result<void, E> {
public:
    using ValueType = void;
    using ErrorType = E;

    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    [[nodiscard]] const E& error() const& { return *error_; }
    [[nodiscard]] E&& error() && { return std::move(*error_); }

private:
    Result() = default;
    explicit Result(E error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

}  // namespace lw
