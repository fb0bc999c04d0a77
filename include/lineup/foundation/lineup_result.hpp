#pragma once

/// @file lineup_result.hpp
/// @brief LineupResult<T> alias binding Result to LineupError.

#include "lineup/core/result.hpp"
#include "lineup/foundation/lineup_error.hpp"

namespace lineup::foundation {

/// Result type specialized with LineupError.
///
/// Example:
/// @code
///   LineupResult<int> parseDistance(int raw) {
///       if (raw < 0) {
///           return LineupResult<int>::err(
///               LineupError(ErrorCode::InvalidRatingDistance, "negative distance"));
///       }
///       return LineupResult<int>::ok(raw);
///   }
/// @endcode
template <typename T>
using LineupResult = lineup::Result<T, LineupError>;

}  // namespace lineup::foundation
