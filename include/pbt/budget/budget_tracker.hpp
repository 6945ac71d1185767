#pragma once

/// @file budget_tracker.hpp
/// @brief Per-project rolling-window spend accumulator with hysteresis.
///
/// A tracker sums the spend recorded within the configured budgeting
/// window and reports whether it is strictly above the allowed budget.
/// Every state flip arms a backoff deadline; until it passes the tracker
/// keeps reporting the flipped state without rescanning its buckets, which
/// keeps bursty spend near the threshold from oscillating.

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>

#include "pbt/budget/budgeting_config.hpp"
#include "pbt/budget/clock.hpp"

namespace pbt::budget {

/// Budget state of a single project.
///
/// Usage:
/// @code
///   BudgetTracker tracker(config);
///   if (tracker.recordSpend(cost)) {
///       // project is over budget; the caller decides what to do
///   }
///   bool blocked = tracker.check();   // poll without spending
/// @endcode
///
/// Not thread-safe: the owner (BudgetRegistry) serializes calls.
/// No call blocks or allocates beyond one bucket; cost is O(numBuckets).
class BudgetTracker {
public:
    /// Spend aggregated into one grid cell of the bucket width.
    struct Bucket {
        TimePoint timestamp;
        double spent = 0.0;
    };

    explicit BudgetTracker(std::shared_ptr<const BudgetingConfig> config);

    /// Add spend at the current instant and return the updated state.
    ///
    /// Spend falling into the cell of the newest bucket (or an earlier one,
    /// should the clock step back) is merged into it; otherwise a new
    /// bucket is pushed and the oldest is dropped once the count exceeds
    /// numBuckets(). `amount` must be non-negative; it is not validated.
    bool recordSpend(double amount);

    /// Recompute the state at the current instant without adding spend.
    /// May flip the state and arm a backoff, as recordSpend() does.
    bool check();

    /// True when the tracker can no longer influence a future decision:
    /// no backoff deadline is pending after `now` and every bucket lies
    /// before `now - budgetingWindow`.
    [[nodiscard]] bool isStale(TimePoint now) const;

    /// Last computed state, without recomputation.
    [[nodiscard]] bool exceedsBudget() const noexcept { return exceedsBudget_; }

    [[nodiscard]] std::optional<TimePoint> backoffDeadline() const noexcept {
        return backoffDeadline_;
    }

    /// Sum of the spend that counts towards a decision made at `now`.
    [[nodiscard]] double spentInWindow(TimePoint now) const;

    /// Buckets, newest first.
    [[nodiscard]] const std::deque<Bucket>& buckets() const noexcept { return buckets_; }

    [[nodiscard]] std::size_t bucketCount() const noexcept { return buckets_.size(); }

    [[nodiscard]] const BudgetingConfig& config() const noexcept { return *config_; }

private:
    bool updateAggregatedState(TimePoint now);

    std::shared_ptr<const BudgetingConfig> config_;
    bool exceedsBudget_ = false;
    std::optional<TimePoint> backoffDeadline_;
    std::deque<Bucket> buckets_;
};

} // namespace pbt::budget
