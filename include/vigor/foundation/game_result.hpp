#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used by every fallible combat operation.

#include "vigor/core/result.hpp"
#include "vigor/foundation/game_error.hpp"

namespace vigor::foundation {

/// Result specialized with GameError.
///
/// Example:
/// @code
///   GameResult<int> absorb(int successValue, int armor) {
///       if (armor < 0) {
///           return GameResult<int>::err(
///               GameError(ErrorCode::InvalidArgument, "negative armor"));
///       }
///       return GameResult<int>::ok(std::max(0, successValue - armor));
///   }
/// @endcode
template <typename T>
using GameResult = vigor::Result<T, GameError>;

}  // namespace vigor::foundation
