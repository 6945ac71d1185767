/// @file budgeting_config_test.cpp
/// @brief Unit tests for BudgetingConfig validation and truncation.

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <limits>
#include <memory>

#include "pbt/budget/budgeting_config.hpp"
#include "pbt/budget/clock.hpp"

using namespace pbt::budget;
using pbt::foundation::ErrorCode;
using namespace std::chrono_literals;

namespace {

BudgetingParams makeParams(Duration window, Duration width, Duration backoff,
                           double allowed) {
    BudgetingParams params;
    params.budgetingWindow = window;
    params.bucketWidth = width;
    params.backoffDuration = backoff;
    params.allowedBudget = allowed;
    return params;
}

} // namespace

class BudgetingConfigTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>(100s);
};

TEST_F(BudgetingConfigTest, CreateKeepsParameters) {
    auto config = BudgetingConfig::create(makeParams(10s, 5s, 1s, 100.0), clock_);
    ASSERT_TRUE(config.hasValue());

    const auto& cfg = *config.value();
    EXPECT_EQ(cfg.budgetingWindow(), Duration(10s));
    EXPECT_EQ(cfg.bucketWidth(), Duration(5s));
    EXPECT_EQ(cfg.backoffDuration(), Duration(1s));
    EXPECT_DOUBLE_EQ(cfg.allowedBudget(), 100.0);
    EXPECT_EQ(cfg.numBuckets(), 2u);
    EXPECT_EQ(&cfg.clock(), clock_.get());
}

TEST_F(BudgetingConfigTest, DerivedBucketCountRoundsUp) {
    auto exact = BudgetingConfig::create(makeParams(10s, 5s, 0s, 1.0), clock_);
    auto ragged = BudgetingConfig::create(makeParams(10s, 3s, 0s, 1.0), clock_);
    auto wide = BudgetingConfig::create(makeParams(1s, 5s, 0s, 1.0), clock_);
    ASSERT_TRUE(exact.hasValue());
    ASSERT_TRUE(ragged.hasValue());
    ASSERT_TRUE(wide.hasValue());

    EXPECT_EQ(exact.value()->numBuckets(), 2u);
    EXPECT_EQ(ragged.value()->numBuckets(), 4u);
    EXPECT_EQ(wide.value()->numBuckets(), 1u);
}

TEST_F(BudgetingConfigTest, ExplicitBucketCountOverridesDerived) {
    auto params = makeParams(10s, 1s, 0s, 1.0);
    params.numBuckets = 3;
    auto config = BudgetingConfig::create(params, clock_);
    ASSERT_TRUE(config.hasValue());
    EXPECT_EQ(config.value()->numBuckets(), 3u);
}

TEST_F(BudgetingConfigTest, ZeroBackoffAndZeroBudgetAreAccepted) {
    auto config = BudgetingConfig::create(makeParams(1s, 1s, 0s, 0.0), clock_);
    EXPECT_TRUE(config.hasValue());
}

TEST_F(BudgetingConfigTest, RejectsDegenerateParameters) {
    const BudgetingParams invalid[] = {
        makeParams(10s, 0s, 1s, 100.0),                                     // zero width
        makeParams(10s, -5s, 1s, 100.0),                                    // negative width
        makeParams(0s, 5s, 1s, 100.0),                                      // zero window
        makeParams(10s, 5s, -1s, 100.0),                                    // negative backoff
        makeParams(10s, 5s, 1s, -1.0),                                      // negative budget
        makeParams(10s, 5s, 1s, std::numeric_limits<double>::quiet_NaN()),  // NaN budget
    };

    for (const auto& params : invalid) {
        auto config = BudgetingConfig::create(params, clock_);
        ASSERT_TRUE(config.hasError());
        EXPECT_EQ(config.error().code(), ErrorCode::InvalidBudgetConfig);
        EXPECT_FALSE(config.error().message().empty());
    }
}

TEST_F(BudgetingConfigTest, RejectsZeroBucketOverride) {
    auto params = makeParams(10s, 5s, 1s, 100.0);
    params.numBuckets = 0;
    auto config = BudgetingConfig::create(params, clock_);
    ASSERT_TRUE(config.hasError());
    EXPECT_EQ(config.error().code(), ErrorCode::InvalidBudgetConfig);
}

TEST_F(BudgetingConfigTest, RejectsDurationsBeyondLimit) {
    const BudgetingParams rejected[] = {
        makeParams(10s, 5s, Duration::max(), 100.0),
        makeParams(Duration::max(), 5s, 1s, 100.0),
        makeParams(10s, Duration::max(), 1s, 100.0),
        makeParams(kMaxConfigDuration + 1ns, 5s, 1s, 100.0),
    };
    for (const auto& params : rejected) {
        auto config = BudgetingConfig::create(params, clock_);
        ASSERT_TRUE(config.hasError());
        EXPECT_EQ(config.error().code(), ErrorCode::InvalidBudgetConfig);
    }
}

TEST_F(BudgetingConfigTest, AcceptsDurationsAtLimit) {
    auto config = BudgetingConfig::create(
        makeParams(kMaxConfigDuration, 1s, kMaxConfigDuration, 100.0), clock_);
    ASSERT_TRUE(config.hasValue());

    auto expected = static_cast<std::size_t>(
        std::chrono::duration_cast<std::chrono::seconds>(kMaxConfigDuration).count());
    EXPECT_EQ(config.value()->numBuckets(), expected);

    auto ragged = BudgetingConfig::create(
        makeParams(kMaxConfigDuration, 7s, 0s, 100.0), clock_);
    ASSERT_TRUE(ragged.hasValue());
    EXPECT_EQ(ragged.value()->numBuckets(), expected / 7 + (expected % 7 != 0 ? 1 : 0));
}

TEST_F(BudgetingConfigTest, NullClockFallsBackToSteadyClock) {
    auto config = BudgetingConfig::create(makeParams(10s, 5s, 1s, 100.0));
    ASSERT_TRUE(config.hasValue());
    EXPECT_NE(dynamic_cast<const SteadyClock*>(&config.value()->clock()), nullptr);
}

TEST_F(BudgetingConfigTest, TruncateFloorsOntoGrid) {
    auto config = BudgetingConfig::create(makeParams(10s, 5s, 1s, 100.0), clock_);
    ASSERT_TRUE(config.hasValue());
    const auto& cfg = *config.value();

    EXPECT_EQ(cfg.truncate(TimePoint(100s)), TimePoint(100s));
    EXPECT_EQ(cfg.truncate(TimePoint(102250ms)), TimePoint(100s));
    EXPECT_EQ(cfg.truncate(TimePoint(104999ms)), TimePoint(100s));
    EXPECT_EQ(cfg.truncate(TimePoint(105s)), TimePoint(105s));
    // Floors, not rounds toward zero, before the epoch.
    EXPECT_EQ(cfg.truncate(TimePoint(-1s)), TimePoint(-5s));
}

TEST_F(BudgetingConfigTest, TruncatedNowFollowsClock) {
    auto config = BudgetingConfig::create(makeParams(10s, 5s, 1s, 100.0), clock_);
    ASSERT_TRUE(config.hasValue());

    clock_->advance(2250ms);
    EXPECT_EQ(config.value()->now(), TimePoint(102250ms));
    EXPECT_EQ(config.value()->truncatedNow(), TimePoint(100s));
}
