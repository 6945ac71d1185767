#pragma once

/// @file budget_config_loader.hpp
/// @brief Builds named BudgetingConfigs from a ConfigManager.
///
/// Expected layout (durations in milliseconds):
/// @code
///   budgets:
///     default:
///       budgeting_window_ms: 10000
///       bucket_width_ms: 5000
///       backoff_duration_ms: 1000   # optional, default 0
///       allowed_budget: 100.0
///       num_buckets: 2              # optional override
/// @endcode

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pbt/budget/budgeting_config.hpp"
#include "pbt/budget/clock.hpp"
#include "pbt/foundation/budget_result.hpp"
#include "pbt/foundation/config_manager.hpp"

namespace pbt::budget {

/// Config name -> validated configuration.
using BudgetingConfigMap =
    std::unordered_map<std::string, std::shared_ptr<const BudgetingConfig>>;

/// Root key holding the named budget sections.
inline constexpr std::string_view kBudgetsKey = "budgets";

/// Read the parameters of one named section.
///
/// Only the millisecond ranges are checked here (non-negative and at most
/// kMaxConfigDuration); BudgetingConfig::create validates the rest.
foundation::BudgetResult<BudgetingParams>
readBudgetingParams(const foundation::ConfigManager& config, std::string_view name);

/// Load and validate every section under `budgets`.
///
/// Fails on the first invalid section; the error message is prefixed with
/// the section name. An absent or empty `budgets` section is reported as
/// ConfigKeyNotFound.
foundation::BudgetResult<BudgetingConfigMap>
loadBudgetingConfigs(const foundation::ConfigManager& config,
                     std::shared_ptr<const Clock> clock = nullptr);

} // namespace pbt::budget
