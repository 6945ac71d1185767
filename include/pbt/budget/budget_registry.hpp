#pragma once

/// @file budget_registry.hpp
/// @brief Thread-safe map of per-project budget trackers.

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "pbt/budget/budget_tracker.hpp"
#include "pbt/budget/budgeting_config.hpp"
#include "pbt/foundation/types.hpp"

namespace pbt::budget {

/// Holds one BudgetTracker per project, all sharing one BudgetingConfig.
///
/// Trackers are created lazily on first use and removed by evictStale()
/// once they no longer hold anything that could affect a decision.
/// All operations lock a single mutex, which gives every tracker the
/// single-writer access it requires. Logging happens after the mutex is
/// released, so a log sink may call back into the registry.
///
/// Example:
/// @code
///   BudgetRegistry registry(config, "default");
///   bool blocked = registry.recordSpend(ProjectId(42), 12.5);
///   // ... periodically:
///   registry.evictStale();
/// @endcode
class BudgetRegistry {
public:
    /// @param config Shared configuration for every tracker.
    /// @param name   Budget name used in log context.
    explicit BudgetRegistry(std::shared_ptr<const BudgetingConfig> config,
                            std::string name = "default");

    /// Record spend for a project; returns whether it now exceeds its budget.
    bool recordSpend(foundation::ProjectId project, double amount);

    /// Whether the project currently exceeds its budget.
    [[nodiscard]] bool exceedsBudget(foundation::ProjectId project);

    /// Drop every stale tracker. Returns the number removed.
    std::size_t evictStale();

    [[nodiscard]] bool contains(foundation::ProjectId project) const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const std::shared_ptr<const BudgetingConfig>& config() const noexcept {
        return config_;
    }

private:
    /// State change captured under the lock and logged after releasing it.
    struct Transition {
        foundation::ProjectId project;
        bool exceeds = false;
        double spent = 0.0;
    };

    BudgetTracker& trackerFor(foundation::ProjectId project);

    Transition describe(foundation::ProjectId project, const BudgetTracker& tracker) const;

    void logTransition(const Transition& transition) const;

    std::shared_ptr<const BudgetingConfig> config_;
    std::string name_;
    mutable std::mutex mutex_;
    std::unordered_map<foundation::ProjectId, BudgetTracker> trackers_;
};

} // namespace pbt::budget
