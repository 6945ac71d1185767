/// @file budgeting_config.cpp
/// @brief BudgetingConfig validation and bucket grid arithmetic.

#include "pbt/budget/budgeting_config.hpp"

#include <chrono>
#include <cmath>
#include <string>

namespace pbt::budget {

using foundation::BudgetError;
using foundation::BudgetResult;
using foundation::ErrorCode;

namespace {

BudgetResult<std::shared_ptr<const BudgetingConfig>> invalid(std::string message) {
    return BudgetResult<std::shared_ptr<const BudgetingConfig>>::err(
        BudgetError(ErrorCode::InvalidBudgetConfig, std::move(message)));
}

} // namespace

BudgetingConfig::BudgetingConfig(const BudgetingParams& params,
                                 std::size_t numBuckets,
                                 std::shared_ptr<const Clock> clock)
    : budgetingWindow_(params.budgetingWindow),
      bucketWidth_(params.bucketWidth),
      backoffDuration_(params.backoffDuration),
      allowedBudget_(params.allowedBudget),
      numBuckets_(numBuckets),
      clock_(std::move(clock)) {}

BudgetResult<std::shared_ptr<const BudgetingConfig>>
BudgetingConfig::create(const BudgetingParams& params,
                        std::shared_ptr<const Clock> clock) {
    if (params.bucketWidth <= Duration::zero()) {
        return invalid("bucket width must be positive");
    }
    if (params.budgetingWindow <= Duration::zero()) {
        return invalid("budgeting window must be positive");
    }
    if (params.backoffDuration < Duration::zero()) {
        return invalid("backoff duration must not be negative");
    }
    if (params.bucketWidth > kMaxConfigDuration ||
        params.budgetingWindow > kMaxConfigDuration ||
        params.backoffDuration > kMaxConfigDuration) {
        return invalid("durations must not exceed " +
                       std::to_string(std::chrono::duration_cast<std::chrono::hours>(
                           kMaxConfigDuration).count()) + "h");
    }
    if (std::isnan(params.allowedBudget) || params.allowedBudget < 0.0) {
        return invalid("allowed budget must be a non-negative number");
    }

    std::size_t numBuckets = 0;
    if (params.numBuckets) {
        if (*params.numBuckets == 0) {
            return invalid("bucket count must be at least 1");
        }
        numBuckets = *params.numBuckets;
    } else {
        // ceil(window / width); both are positive here.
        auto width = params.bucketWidth.count();
        auto window = params.budgetingWindow.count();
        numBuckets = static_cast<std::size_t>(window / width + (window % width != 0 ? 1 : 0));
    }

    if (!clock) {
        clock = SteadyClock::shared();
    }

    // The constructor is private, so make_shared cannot reach it.
    std::shared_ptr<const BudgetingConfig> config(
        new BudgetingConfig(params, numBuckets, std::move(clock)));
    return BudgetResult<std::shared_ptr<const BudgetingConfig>>::ok(std::move(config));
}

TimePoint BudgetingConfig::truncate(TimePoint instant) const {
    auto sinceEpoch = std::chrono::duration_cast<Duration>(instant.time_since_epoch());
    auto offset = sinceEpoch % bucketWidth_;
    // Floor rather than round toward zero for instants before the epoch.
    if (offset < Duration::zero()) {
        offset += bucketWidth_;
    }
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(sinceEpoch - offset));
}

} // namespace pbt::budget
