/// @file budget_tracker.cpp
/// @brief BudgetTracker bucket maintenance and hysteresis.

#include "pbt/budget/budget_tracker.hpp"

namespace pbt::budget {

BudgetTracker::BudgetTracker(std::shared_ptr<const BudgetingConfig> config)
    : config_(std::move(config)) {}

bool BudgetTracker::recordSpend(double amount) {
    auto now = config_->now();
    auto nowBucket = config_->truncate(now);

    if (!buckets_.empty() && buckets_.front().timestamp >= nowBucket) {
        buckets_.front().spent += amount;
    } else {
        buckets_.push_front(Bucket{nowBucket, amount});
        if (buckets_.size() > config_->numBuckets()) {
            buckets_.pop_back();
        }
    }

    return updateAggregatedState(now);
}

bool BudgetTracker::check() {
    return updateAggregatedState(config_->now());
}

bool BudgetTracker::isStale(TimePoint now) const {
    // A pending backoff still decides the next answer.
    if (backoffDeadline_ && *backoffDeadline_ > now) {
        return false;
    }

    auto windowStart = now - config_->budgetingWindow();
    for (const auto& bucket : buckets_) {
        if (bucket.timestamp >= windowStart) {
            return false;
        }
    }
    return true;
}

double BudgetTracker::spentInWindow(TimePoint now) const {
    auto windowStart = now - config_->budgetingWindow();
    double total = 0.0;
    for (const auto& bucket : buckets_) {
        // Newest first: everything after the first miss is older still.
        if (bucket.timestamp < windowStart) {
            break;
        }
        total += bucket.spent;
    }
    return total;
}

bool BudgetTracker::updateAggregatedState(TimePoint now) {
    if (backoffDeadline_) {
        if (*backoffDeadline_ > now) {
            return exceedsBudget_;
        }
        backoffDeadline_.reset();
    }

    bool exceeds = spentInWindow(now) > config_->allowedBudget();
    if (exceeds != exceedsBudget_) {
        exceedsBudget_ = exceeds;
        backoffDeadline_ = now + config_->backoffDuration();
    }
    return exceedsBudget_;
}

} // namespace pbt::budget
