#pragma once

/// @file budgeting_config.hpp
/// @brief Immutable parameters shared by every tracker of one budget.

#include <cstddef>
#include <memory>
#include <optional>

#include "pbt/budget/clock.hpp"
#include "pbt/foundation/budget_result.hpp"

namespace pbt::budget {

/// Largest window, bucket width or backoff a config accepts (100 years).
///
/// Keeps `now + backoff` and `now - window` inside the range of TimePoint
/// for any instant a monotonic clock can reach.
inline constexpr Duration kMaxConfigDuration =
    std::chrono::hours(24 * 365 * 100);

/// Raw, unvalidated budgeting parameters.
struct BudgetingParams {
    /// Rolling window over which spend is summed.
    Duration budgetingWindow{};

    /// Grid spacing used to truncate spend timestamps into buckets.
    Duration bucketWidth{};

    /// Minimum dwell time after an over/under budget flip.
    Duration backoffDuration{};

    /// Ceiling; a windowed sum strictly above it exceeds the budget.
    double allowedBudget = 0.0;

    /// Overrides the derived ceil(budgetingWindow / bucketWidth).
    std::optional<std::size_t> numBuckets;
};

/// Validated budgeting configuration.
///
/// Created once through create() and shared read-only by every tracker
/// of the same budget, so instances are only handed out as
/// std::shared_ptr<const BudgetingConfig>.
///
/// Example:
/// @code
///   BudgetingParams params;
///   params.budgetingWindow = std::chrono::seconds{10};
///   params.bucketWidth = std::chrono::seconds{5};
///   params.backoffDuration = std::chrono::seconds{1};
///   params.allowedBudget = 100.0;
///
///   auto config = BudgetingConfig::create(params);
///   if (config) {
///       BudgetTracker tracker(config.value());
///   }
/// @endcode
class BudgetingConfig {
public:
    /// Validate parameters and build a shared configuration.
    ///
    /// Rejects (InvalidBudgetConfig) a non-positive window or bucket width,
    /// a negative backoff, any duration above kMaxConfigDuration, a negative
    /// or NaN budget, and an explicit bucket count of zero. A null clock selects SteadyClock::shared().
    static foundation::BudgetResult<std::shared_ptr<const BudgetingConfig>>
    create(const BudgetingParams& params,
           std::shared_ptr<const Clock> clock = nullptr);

    [[nodiscard]] Duration budgetingWindow() const noexcept { return budgetingWindow_; }
    [[nodiscard]] Duration bucketWidth() const noexcept { return bucketWidth_; }
    [[nodiscard]] Duration backoffDuration() const noexcept { return backoffDuration_; }
    [[nodiscard]] double allowedBudget() const noexcept { return allowedBudget_; }
    [[nodiscard]] std::size_t numBuckets() const noexcept { return numBuckets_; }
    [[nodiscard]] const Clock& clock() const noexcept { return *clock_; }

    [[nodiscard]] TimePoint now() const { return clock_->now(); }

    /// Round an instant down onto the bucket grid.
    ///
    /// The grid is anchored at the clock epoch, so every tracker sharing
    /// this config buckets the same instant identically.
    [[nodiscard]] TimePoint truncate(TimePoint instant) const;

    [[nodiscard]] TimePoint truncatedNow() const { return truncate(now()); }

private:
    BudgetingConfig(const BudgetingParams& params, std::size_t numBuckets,
                    std::shared_ptr<const Clock> clock);

    Duration budgetingWindow_;
    Duration bucketWidth_;
    Duration backoffDuration_;
    double allowedBudget_;
    std::size_t numBuckets_;
    std::shared_ptr<const Clock> clock_;
};

} // namespace pbt::budget
