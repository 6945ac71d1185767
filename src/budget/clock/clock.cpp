/// @file clock.cpp
/// @brief SteadyClock and ManualClock implementations.

#include "pbt/budget/clock.hpp"

namespace pbt::budget {

TimePoint SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

std::shared_ptr<const SteadyClock> SteadyClock::shared() {
    static const auto instance = std::make_shared<const SteadyClock>();
    return instance;
}

ManualClock::ManualClock(Duration sinceEpoch)
    : now_(sinceEpoch) {}

TimePoint ManualClock::now() const {
    std::lock_guard lock(mutex_);
    return now_;
}

void ManualClock::advance(Duration delta) {
    std::lock_guard lock(mutex_);
    now_ += delta;
}

void ManualClock::set(TimePoint instant) {
    std::lock_guard lock(mutex_);
    now_ = instant;
}

} // namespace pbt::budget
