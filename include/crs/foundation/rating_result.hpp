#pragma once

/// @file rating_result.hpp
/// @brief RatingResult<T> alias binding Result to RatingError.

#include "crs/core/result.hpp"
#include "crs/foundation/rating_error.hpp"

namespace crs::foundation {

/// Result type returned by every fallible parser, loader and config call.
///
/// Example:
/// @code
///   RatingResult<int> parseKFactor(int raw) {
///       if (raw < 1) {
///           return RatingResult<int>::err(
///               RatingError(ErrorCode::ConfigValueOutOfRange, "K-factor must be positive"));
///       }
///       return RatingResult<int>::ok(raw);
///   }
/// @endcode
template <typename T>
using RatingResult = crs::Result<T, RatingError>;

}  // namespace crs::foundation
