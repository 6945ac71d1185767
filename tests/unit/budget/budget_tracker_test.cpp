/// @file budget_tracker_test.cpp
/// @brief Unit tests for BudgetTracker bucketing, hysteresis and staleness.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "pbt/budget/budget_tracker.hpp"
#include "pbt/budget/budgeting_config.hpp"
#include "pbt/budget/clock.hpp"

using namespace pbt::budget;
using namespace std::chrono_literals;

class BudgetTrackerTest : public ::testing::Test {
protected:
    std::shared_ptr<const BudgetingConfig> makeConfig(
        Duration window, Duration width, Duration backoff, double allowed,
        std::optional<std::size_t> numBuckets = std::nullopt) {
        BudgetingParams params;
        params.budgetingWindow = window;
        params.bucketWidth = width;
        params.backoffDuration = backoff;
        params.allowedBudget = allowed;
        params.numBuckets = numBuckets;

        auto config = BudgetingConfig::create(params, clock_);
        EXPECT_TRUE(config.hasValue());
        return config.value();
    }

    TimePoint at(Duration sinceEpoch) const { return TimePoint(sinceEpoch); }

    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>(100s);
};

// ===========================================================================
// Initial state
// ===========================================================================

TEST_F(BudgetTrackerTest, StartsUnderBudgetAndStale) {
    BudgetTracker tracker(makeConfig(10s, 5s, 1s, 100.0));

    EXPECT_FALSE(tracker.exceedsBudget());
    EXPECT_FALSE(tracker.backoffDeadline().has_value());
    EXPECT_EQ(tracker.bucketCount(), 0u);
    EXPECT_TRUE(tracker.isStale(clock_->now()));

    EXPECT_FALSE(tracker.check());
    EXPECT_FALSE(tracker.backoffDeadline().has_value());
}

// ===========================================================================
// Scenario traces
// ===========================================================================

TEST_F(BudgetTrackerTest, ShortBackoffScenario) {
    // window 10s, bucket width 5s, backoff 1s, budget 100, from T=100s.
    BudgetTracker tracker(makeConfig(10s, 5s, 1s, 100.0));

    EXPECT_FALSE(tracker.recordSpend(40.0));
    EXPECT_FALSE(tracker.recordSpend(10.0));

    clock_->advance(1500ms);  // T=101.5s, same 100s cell
    EXPECT_FALSE(tracker.recordSpend(45.0));
    EXPECT_EQ(tracker.bucketCount(), 1u);
    EXPECT_DOUBLE_EQ(tracker.spentInWindow(clock_->now()), 95.0);

    clock_->advance(750ms);  // T=102.25s
    EXPECT_TRUE(tracker.recordSpend(10.0));
    ASSERT_TRUE(tracker.backoffDeadline().has_value());
    EXPECT_EQ(*tracker.backoffDeadline(), at(103250ms));

    clock_->advance(6s);  // T=108.25s, backoff over, 100s bucket still in window
    EXPECT_TRUE(tracker.check());
    EXPECT_FALSE(tracker.backoffDeadline().has_value());

    clock_->advance(3s);  // T=111.25s, 100s bucket left the window
    EXPECT_FALSE(tracker.check());
    ASSERT_TRUE(tracker.backoffDeadline().has_value());
    EXPECT_EQ(*tracker.backoffDeadline(), at(112250ms));

    // The backoff armed by the flip keeps the tracker alive.
    EXPECT_FALSE(tracker.isStale(clock_->now()));

    clock_->advance(1s);  // T=112.25s
    EXPECT_TRUE(tracker.isStale(clock_->now()));
    EXPECT_EQ(tracker.bucketCount(), 1u);
}

TEST_F(BudgetTrackerTest, LongBackoffOutlivesWindow) {
    // window 5s, bucket width 1s, backoff 10s, budget 100, from T=100s.
    BudgetTracker tracker(makeConfig(5s, 1s, 10s, 100.0));

    EXPECT_FALSE(tracker.recordSpend(40.0));
    EXPECT_FALSE(tracker.recordSpend(10.0));

    clock_->advance(1500ms);
    EXPECT_FALSE(tracker.recordSpend(45.0));

    clock_->advance(750ms);  // T=102.25s
    EXPECT_TRUE(tracker.recordSpend(10.0));
    EXPECT_EQ(tracker.bucketCount(), 3u);

    clock_->advance(6s);  // T=108.25s: window is empty, still in backoff
    EXPECT_DOUBLE_EQ(tracker.spentInWindow(clock_->now()), 0.0);
    EXPECT_TRUE(tracker.check());

    clock_->advance(3s);  // T=111.25s: still in backoff
    EXPECT_TRUE(tracker.check());

    clock_->advance(2s);  // T=113.25s: backoff passed, unblocked
    EXPECT_FALSE(tracker.check());

    // The flip back armed another backoff, so the tracker is not stale yet.
    EXPECT_FALSE(tracker.isStale(clock_->now()));

    clock_->advance(10s);
    EXPECT_TRUE(tracker.isStale(clock_->now()));
}

// ===========================================================================
// Threshold and window bounds
// ===========================================================================

TEST_F(BudgetTrackerTest, SpendEqualToBudgetDoesNotExceed) {
    BudgetTracker tracker(makeConfig(10s, 1s, 0s, 100.0));

    EXPECT_FALSE(tracker.recordSpend(100.0));
    EXPECT_FALSE(tracker.exceedsBudget());
    EXPECT_FALSE(tracker.backoffDeadline().has_value());

    EXPECT_TRUE(tracker.recordSpend(1.0));
}

TEST_F(BudgetTrackerTest, ZeroBudgetExceededByAnySpend) {
    BudgetTracker tracker(makeConfig(10s, 1s, 0s, 0.0));

    EXPECT_FALSE(tracker.recordSpend(0.0));
    EXPECT_TRUE(tracker.recordSpend(0.5));
}

TEST_F(BudgetTrackerTest, WindowLowerBoundIsInclusive) {
    BudgetTracker tracker(makeConfig(10s, 1s, 0s, 5.0));
    EXPECT_TRUE(tracker.recordSpend(6.0));

    clock_->advance(10s);  // window start == bucket timestamp
    EXPECT_TRUE(tracker.check());

    clock_->advance(1ns);
    EXPECT_FALSE(tracker.check());
}

TEST_F(BudgetTrackerTest, SpendLeavesWindowAfterWindowLength) {
    BudgetTracker tracker(makeConfig(10s, 1s, 0s, 50.0));

    EXPECT_FALSE(tracker.recordSpend(30.0));  // T=100
    clock_->advance(4s);
    EXPECT_TRUE(tracker.recordSpend(30.0));   // T=104, sum 60

    clock_->advance(6s + 1ns);                // first bucket out, sum 30
    EXPECT_FALSE(tracker.check());
    EXPECT_DOUBLE_EQ(tracker.spentInWindow(clock_->now()), 30.0);
}

TEST_F(BudgetTrackerTest, CheckDoesNotEvictOldBuckets) {
    BudgetTracker tracker(makeConfig(2s, 1s, 0s, 100.0));
    tracker.recordSpend(1.0);
    clock_->advance(1s);
    tracker.recordSpend(1.0);

    clock_->advance(1h);
    EXPECT_FALSE(tracker.check());
    EXPECT_EQ(tracker.bucketCount(), 2u);
}

// ===========================================================================
// Bucket maintenance
// ===========================================================================

TEST_F(BudgetTrackerTest, SpendWithinOneCellMerges) {
    BudgetTracker tracker(makeConfig(10s, 5s, 1s, 1000.0));

    tracker.recordSpend(1.0);
    clock_->advance(1s);
    tracker.recordSpend(2.0);
    clock_->advance(3999ms);  // T=104.999s
    tracker.recordSpend(3.0);

    ASSERT_EQ(tracker.bucketCount(), 1u);
    EXPECT_EQ(tracker.buckets().front().timestamp, at(100s));
    EXPECT_DOUBLE_EQ(tracker.buckets().front().spent, 6.0);

    clock_->advance(1ms);  // T=105s opens the next cell
    tracker.recordSpend(4.0);
    ASSERT_EQ(tracker.bucketCount(), 2u);
    EXPECT_EQ(tracker.buckets().front().timestamp, at(105s));
    EXPECT_EQ(tracker.buckets().back().timestamp, at(100s));
}

TEST_F(BudgetTrackerTest, ClockSteppingBackMergesIntoNewestBucket) {
    BudgetTracker tracker(makeConfig(10s, 5s, 1s, 1000.0));

    clock_->set(at(110s));
    tracker.recordSpend(5.0);

    clock_->set(at(104s));  // earlier cell than the newest bucket
    tracker.recordSpend(7.0);

    ASSERT_EQ(tracker.bucketCount(), 1u);
    EXPECT_EQ(tracker.buckets().front().timestamp, at(110s));
    EXPECT_DOUBLE_EQ(tracker.buckets().front().spent, 12.0);
}

TEST_F(BudgetTrackerTest, BucketCountNeverExceedsCapacity) {
    auto config = makeConfig(10s, 1s, 0s, 1e9);
    ASSERT_EQ(config->numBuckets(), 10u);
    BudgetTracker tracker(config);

    for (int i = 0; i < 30; ++i) {
        tracker.recordSpend(1.0);
        EXPECT_LE(tracker.bucketCount(), config->numBuckets());
        clock_->advance(1s);
    }

    ASSERT_EQ(tracker.bucketCount(), 10u);
    // Newest first, strictly decreasing, oldest ones evicted.
    EXPECT_EQ(tracker.buckets().front().timestamp, at(129s));
    EXPECT_EQ(tracker.buckets().back().timestamp, at(120s));
    for (std::size_t i = 1; i < tracker.buckets().size(); ++i) {
        EXPECT_GT(tracker.buckets()[i - 1].timestamp, tracker.buckets()[i].timestamp);
    }
}

TEST_F(BudgetTrackerTest, ExplicitCapacityLimitsCountedSpend) {
    // Three buckets cannot cover a 10s window of 1s cells.
    BudgetTracker tracker(makeConfig(10s, 1s, 0s, 25.0, 3));

    for (int i = 0; i < 5; ++i) {
        tracker.recordSpend(10.0);
        clock_->advance(1s);
    }

    EXPECT_EQ(tracker.bucketCount(), 3u);
    EXPECT_DOUBLE_EQ(tracker.spentInWindow(clock_->now()), 30.0);
    EXPECT_TRUE(tracker.check());
}

// ===========================================================================
// Hysteresis
// ===========================================================================

TEST_F(BudgetTrackerTest, BackoffHoldsBlockedStateAfterWindowPasses) {
    BudgetTracker tracker(makeConfig(2s, 1s, 5s, 10.0));
    EXPECT_TRUE(tracker.recordSpend(11.0));  // flip at T=100, deadline 105

    clock_->advance(3s);
    EXPECT_DOUBLE_EQ(tracker.spentInWindow(clock_->now()), 0.0);
    EXPECT_TRUE(tracker.check());

    clock_->advance(2s);  // deadline reached
    EXPECT_FALSE(tracker.check());
}

TEST_F(BudgetTrackerTest, BackoffHoldsUnblockedStateDespiteNewSpend) {
    BudgetTracker tracker(makeConfig(2s, 1s, 5s, 10.0));
    EXPECT_TRUE(tracker.recordSpend(11.0));

    clock_->advance(5s);                       // T=105
    EXPECT_FALSE(tracker.check());             // flip back, deadline 110

    clock_->advance(4s);                       // T=109
    EXPECT_FALSE(tracker.recordSpend(50.0));   // locked under budget
    EXPECT_FALSE(tracker.recordSpend(50.0));

    clock_->advance(1s);                       // T=110, spend still in window
    EXPECT_TRUE(tracker.check());
}

TEST_F(BudgetTrackerTest, CheckAloneFlipsAndArmsBackoff) {
    BudgetTracker tracker(makeConfig(2s, 1s, 5s, 10.0));
    tracker.recordSpend(11.0);
    EXPECT_TRUE(tracker.exceedsBudget());

    clock_->advance(5s);
    tracker.check();
    EXPECT_FALSE(tracker.exceedsBudget());
    ASSERT_TRUE(tracker.backoffDeadline().has_value());
    EXPECT_EQ(*tracker.backoffDeadline(), at(110s));
}

TEST_F(BudgetTrackerTest, LongestBackoffHoldsState) {
    BudgetTracker tracker(makeConfig(2s, 1s, kMaxConfigDuration, 10.0));
    EXPECT_TRUE(tracker.recordSpend(11.0));
    ASSERT_TRUE(tracker.backoffDeadline().has_value());
    EXPECT_EQ(*tracker.backoffDeadline(), at(100s) + kMaxConfigDuration);

    clock_->advance(20s);
    EXPECT_TRUE(tracker.check());
    EXPECT_FALSE(tracker.isStale(clock_->now()));
}

TEST_F(BudgetTrackerTest, LongestWindowKeepsEarlySpend) {
    BudgetTracker tracker(makeConfig(kMaxConfigDuration, 1s, 0s, 10.0));
    EXPECT_FALSE(tracker.recordSpend(6.0));

    clock_->advance(24h * 365);
    EXPECT_TRUE(tracker.recordSpend(6.0));
    EXPECT_DOUBLE_EQ(tracker.spentInWindow(clock_->now()), 12.0);
    EXPECT_FALSE(tracker.isStale(clock_->now()));
}

TEST_F(BudgetTrackerTest, ZeroBackoffFlipsImmediately) {
    BudgetTracker tracker(makeConfig(1s, 1s, 0s, 10.0));
    EXPECT_TRUE(tracker.recordSpend(11.0));

    clock_->advance(1001ms);
    EXPECT_FALSE(tracker.check());
}

TEST_F(BudgetTrackerTest, FlipsAreSeparatedByAtLeastBackoff) {
    const Duration backoff = 700ms;
    BudgetTracker tracker(makeConfig(1s, 100ms, backoff, 10.0));

    std::vector<TimePoint> flips;
    bool last = tracker.exceedsBudget();

    // Bursts of spend well above the budget alternating with idle phases.
    for (int step = 0; step < 400; ++step) {
        double amount = (step / 25) % 2 == 0 ? 4.0 : 0.0;
        bool state = (step % 2 == 0) ? tracker.recordSpend(amount) : tracker.check();
        if (state != last) {
            flips.push_back(clock_->now());
            last = state;
        }
        clock_->advance(50ms);
    }

    ASSERT_GE(flips.size(), 2u);
    for (std::size_t i = 1; i < flips.size(); ++i) {
        EXPECT_GE(flips[i] - flips[i - 1], backoff);
    }
}

TEST_F(BudgetTrackerTest, UnchangedStateDoesNotArmBackoff) {
    BudgetTracker tracker(makeConfig(10s, 1s, 5s, 100.0));
    EXPECT_FALSE(tracker.recordSpend(10.0));
    EXPECT_FALSE(tracker.check());
    EXPECT_FALSE(tracker.backoffDeadline().has_value());
}

// ===========================================================================
// Staleness
// ===========================================================================

TEST_F(BudgetTrackerTest, NotStaleWhileBucketInWindow) {
    BudgetTracker tracker(makeConfig(10s, 1s, 0s, 100.0));
    tracker.recordSpend(1.0);

    EXPECT_FALSE(tracker.isStale(at(110s)));   // bucket == window start
    EXPECT_TRUE(tracker.isStale(at(110s) + 1ns));
}

TEST_F(BudgetTrackerTest, NotStaleDuringBackoffEvenWithOldBuckets) {
    BudgetTracker tracker(makeConfig(1s, 1s, 10s, 0.0));
    EXPECT_TRUE(tracker.recordSpend(1.0));  // deadline 110s

    EXPECT_FALSE(tracker.isStale(at(105s)));
    EXPECT_FALSE(tracker.isStale(at(110s) - 1ns));
    EXPECT_TRUE(tracker.isStale(at(110s)));
}
