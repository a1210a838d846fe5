#pragma once

/// @file rank_result.hpp
/// @brief RankResult<T> alias used across the library.

#include "arank/core/result.hpp"
#include "arank/foundation/rank_error.hpp"

namespace arank::foundation {

/// Result type specialized with RankError.
///
/// Example:
/// @code
///   RankResult<std::size_t> indexOf(std::size_t i, std::size_t n) {
///       if (i >= n) {
///           return RankResult<std::size_t>::err(
///               RankError(ErrorCode::InvalidItem, "index out of range"));
///       }
///       return RankResult<std::size_t>::ok(i);
///   }
/// @endcode
template <typename T>
using RankResult = arank::Result<T, RankError>;

} // namespace arank::foundation
