/// @file budget_config_loader.cpp
/// @brief Named BudgetingConfig loading from YAML-backed configuration.

#include "pbt/budget/budget_config_loader.hpp"

#include <chrono>
#include <cstdint>
#include <string>

#include "pbt/foundation/budget_logger.hpp"

namespace pbt::budget {

using foundation::BudgetError;
using foundation::BudgetResult;
using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

std::string sectionKey(std::string_view name, std::string_view field) {
    std::string key(kBudgetsKey);
    key += '.';
    key += name;
    key += '.';
    key += field;
    return key;
}

BudgetResult<Duration> readMillis(const ConfigManager& config, const std::string& key) {
    auto ms = config.get<int64_t>(key);
    if (!ms) {
        return BudgetResult<Duration>::err(ms.error());
    }

    // Range-check before converting: milliseconds -> nanoseconds can overflow.
    constexpr auto kMaxMillis =
        std::chrono::duration_cast<std::chrono::milliseconds>(kMaxConfigDuration).count();
    if (ms.value() < 0) {
        return BudgetResult<Duration>::err(
            BudgetError(ErrorCode::InvalidBudgetConfig, key + " must not be negative"));
    }
    if (ms.value() > kMaxMillis) {
        return BudgetResult<Duration>::err(
            BudgetError(ErrorCode::InvalidBudgetConfig,
                        key + " exceeds " + std::to_string(kMaxMillis) + " ms"));
    }
    return BudgetResult<Duration>::ok(std::chrono::milliseconds(ms.value()));
}

} // namespace

BudgetResult<BudgetingParams>
readBudgetingParams(const ConfigManager& config, std::string_view name) {
    BudgetingParams params;

    auto window = readMillis(config, sectionKey(name, "budgeting_window_ms"));
    if (!window) {
        return BudgetResult<BudgetingParams>::err(window.error());
    }
    params.budgetingWindow = window.value();

    auto width = readMillis(config, sectionKey(name, "bucket_width_ms"));
    if (!width) {
        return BudgetResult<BudgetingParams>::err(width.error());
    }
    params.bucketWidth = width.value();

    auto allowed = config.get<double>(sectionKey(name, "allowed_budget"));
    if (!allowed) {
        return BudgetResult<BudgetingParams>::err(allowed.error());
    }
    params.allowedBudget = allowed.value();

    auto backoffKey = sectionKey(name, "backoff_duration_ms");
    if (config.hasKey(backoffKey)) {
        auto backoff = readMillis(config, backoffKey);
        if (!backoff) {
            return BudgetResult<BudgetingParams>::err(backoff.error());
        }
        params.backoffDuration = backoff.value();
    }

    auto bucketsKey = sectionKey(name, "num_buckets");
    if (config.hasKey(bucketsKey)) {
        auto buckets = config.get<uint64_t>(bucketsKey);
        if (!buckets) {
            return BudgetResult<BudgetingParams>::err(buckets.error());
        }
        params.numBuckets = static_cast<std::size_t>(buckets.value());
    }

    return BudgetResult<BudgetingParams>::ok(params);
}

BudgetResult<BudgetingConfigMap>
loadBudgetingConfigs(const ConfigManager& config, std::shared_ptr<const Clock> clock) {
    auto names = config.childKeys(kBudgetsKey);
    if (names.empty()) {
        return BudgetResult<BudgetingConfigMap>::err(
            BudgetError(ErrorCode::ConfigKeyNotFound, "no budgeting configs under 'budgets'"));
    }

    BudgetingConfigMap configs;
    for (const auto& name : names) {
        auto params = readBudgetingParams(config, name);
        if (!params) {
            auto err = params.error().withContext("budget '" + name + "'");
            PBT_LOG_ERROR(LogCategory::Config, std::string(err.message()));
            return BudgetResult<BudgetingConfigMap>::err(std::move(err));
        }

        auto created = BudgetingConfig::create(params.value(), clock);
        if (!created) {
            auto err = created.error().withContext("budget '" + name + "'");
            PBT_LOG_ERROR(LogCategory::Config, std::string(err.message()));
            return BudgetResult<BudgetingConfigMap>::err(std::move(err));
        }

        configs.emplace(name, std::move(created).value());
    }

    PBT_LOG_INFO(LogCategory::Config,
                 "loaded " + std::to_string(configs.size()) + " budgeting configs");
    return BudgetResult<BudgetingConfigMap>::ok(std::move(configs));
}

} // namespace pbt::budget
