#pragma once

/// @file watch_error.hpp
/// @brief Library error type used with Result<T, WatchError>.

#include <string>
#include <string_view>
#include <utility>

#include "lw/foundation/error_code.hpp"

namespace lw::foundation {

/// An error code plus a human-readable message naming the path involved.
class WatchError {
public:
    WatchError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error ("Watch", "Config", "Logger").
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace lw::foundation
