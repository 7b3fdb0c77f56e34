#pragma once

/// @file sim_result.hpp
/// @brief SimResult<T> alias for simulator operations.

#include "wbs/core/result.hpp"
#include "wbs/foundation/sim_error.hpp"

namespace wbs::foundation {

/// Result type specialized with SimError.
///
/// Example:
/// @code
///   SimResult<int> thresholdFor(std::string_view size) {
///       if (size.empty()) {
///           return SimResult<int>::err(
///               SimError(ErrorCode::UnknownSizeClass, "empty size class"));
///       }
///       return SimResult<int>::ok(12);
///   }
/// @endcode
template <typename T>
using SimResult = wbs::Result<T, SimError>;

} // namespace wbs::foundation
