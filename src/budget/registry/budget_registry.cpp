/// @file budget_registry.cpp
/// @brief BudgetRegistry implementation.

#include "pbt/budget/budget_registry.hpp"

#include "pbt/foundation/budget_logger.hpp"

namespace pbt::budget {

using foundation::BudgetLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ProjectId;

BudgetRegistry::BudgetRegistry(std::shared_ptr<const BudgetingConfig> config,
                               std::string name)
    : config_(std::move(config)), name_(std::move(name)) {}

bool BudgetRegistry::recordSpend(ProjectId project, double amount) {
    std::optional<Transition> transition;
    bool after = false;
    {
        std::lock_guard lock(mutex_);
        auto& tracker = trackerFor(project);
        bool before = tracker.exceedsBudget();
        after = tracker.recordSpend(amount);
        if (after != before) {
            transition = describe(project, tracker);
        }
    }
    if (transition) {
        logTransition(*transition);
    }
    return after;
}

bool BudgetRegistry::exceedsBudget(ProjectId project) {
    std::optional<Transition> transition;
    bool after = false;
    {
        std::lock_guard lock(mutex_);
        auto& tracker = trackerFor(project);
        bool before = tracker.exceedsBudget();
        after = tracker.check();
        if (after != before) {
            transition = describe(project, tracker);
        }
    }
    if (transition) {
        logTransition(*transition);
    }
    return after;
}

std::size_t BudgetRegistry::evictStale() {
    std::size_t removed = 0;
    std::size_t remaining = 0;
    {
        std::lock_guard lock(mutex_);
        auto now = config_->now();
        for (auto it = trackers_.begin(); it != trackers_.end();) {
            if (it->second.isStale(now)) {
                it = trackers_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        remaining = trackers_.size();
    }

    if (removed > 0) {
        PBT_LOG_DEBUG(LogCategory::Registry,
                      "evicted " + std::to_string(removed) + " stale trackers from '" +
                          name_ + "', " + std::to_string(remaining) + " remain");
    }
    return removed;
}

bool BudgetRegistry::contains(ProjectId project) const {
    std::lock_guard lock(mutex_);
    return trackers_.find(project) != trackers_.end();
}

std::size_t BudgetRegistry::size() const {
    std::lock_guard lock(mutex_);
    return trackers_.size();
}

BudgetTracker& BudgetRegistry::trackerFor(ProjectId project) {
    auto it = trackers_.find(project);
    if (it == trackers_.end()) {
        it = trackers_.emplace(project, BudgetTracker(config_)).first;
    }
    return it->second;
}

BudgetRegistry::Transition BudgetRegistry::describe(ProjectId project,
                                                   const BudgetTracker& tracker) const {
    return Transition{project, tracker.exceedsBudget(),
                      tracker.spentInWindow(config_->now())};
}

void BudgetRegistry::logTransition(const Transition& transition) const {
    auto& logger = BudgetLogger::instance();
    if (!logger.isEnabled(LogLevel::Info, LogCategory::Budget)) {
        return;
    }

    LogContext ctx;
    ctx.projectId = transition.project;
    ctx.configName = name_;
    ctx.extra["spent"] = std::to_string(transition.spent);
    ctx.extra["allowed"] = std::to_string(config_->allowedBudget());
    logger.logWithContext(LogLevel::Info, LogCategory::Budget,
                          transition.exceeds ? "project exceeds budget"
                                             : "project back within budget",
                          ctx);
}

} // namespace pbt::budget
