#pragma once

/// @file clock.hpp
/// @brief Injectable monotonic time source.
///
/// Budget decisions never read a global clock directly. Production code
/// uses SteadyClock; tests drive a ManualClock so that windows and
/// backoffs can be crossed without sleeping.

#include <chrono>
#include <memory>
#include <mutex>

namespace pbt::budget {

/// Monotonic instant used throughout the budget layer.
using TimePoint = std::chrono::steady_clock::time_point;

/// Duration type; nanosecond resolution matches steady_clock on Linux.
using Duration = std::chrono::nanoseconds;

/// Source of "now".
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

/// Clock backed by std::chrono::steady_clock.
class SteadyClock final : public Clock {
public:
    [[nodiscard]] TimePoint now() const override;

    /// Process-wide instance, used when no clock is injected.
    static std::shared_ptr<const SteadyClock> shared();
};

/// Manually driven clock for deterministic tests.
///
/// Example:
/// @code
///   auto clock = std::make_shared<ManualClock>(std::chrono::seconds{100});
///   clock->advance(std::chrono::milliseconds{1500});
///   // clock->now().time_since_epoch() == 101.5s
/// @endcode
///
/// Thread-safe. Moving the clock backwards is allowed.
class ManualClock final : public Clock {
public:
    /// Start at the given offset from the clock epoch.
    explicit ManualClock(Duration sinceEpoch = Duration::zero());

    [[nodiscard]] TimePoint now() const override;

    /// Move the clock by `delta` (may be negative).
    void advance(Duration delta);

    /// Jump to an absolute instant.
    void set(TimePoint instant);

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace pbt::budget
