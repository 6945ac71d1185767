#pragma once

/// @file budget_result.hpp
/// @brief BudgetResult<T> type alias for library error handling.

#include "pbt/core/result.hpp"
#include "pbt/foundation/budget_error.hpp"

namespace pbt::foundation {

/// Result type specialized with BudgetError.
///
/// Example:
/// @code
///   BudgetResult<double> parseBudget(double raw) {
///       if (raw < 0.0) {
///           return BudgetResult<double>::err(
///               BudgetError(ErrorCode::InvalidArgument, "negative budget"));
///       }
///       return BudgetResult<double>::ok(raw);
///   }
/// @endcode
template <typename T>
using BudgetResult = pbt::Result<T, BudgetError>;

}  // namespace pbt::foundation
