#pragma once

/// @file watch_result.hpp
/// @brief WatchResult<T> type alias for library error handling.

#include "lw/core/result.hpp"
#include "lw/foundation/watch_error.hpp"

namespace lw::foundation {

/// Result type specialized with WatchError.
///
/// Every watcher, debounce and config method that can fail returns
/// WatchResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   WatchResult<std::filesystem::path> absoluteTarget(const std::filesystem::path& p) {
///       if (p.empty()) {
///           return WatchResult<std::filesystem::path>::err(
///               WatchError(ErrorCode::ResolutionFailed, "empty path"));
///       }
///       return WatchResult<std::filesystem::path>::ok(std::filesystem::absolute(p));
///   }
/// @endcode
template <typename T>
using WatchResult = lw::Result<T, WatchError>;

}  // namespace lw::foundation
