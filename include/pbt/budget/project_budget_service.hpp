#pragma once

/// @file project_budget_service.hpp
/// @brief Named-budget front end: ExceedsBudget / RecordBudgetSpend.
///
/// Routes requests by config name to a BudgetRegistry and by project id to
/// that registry's tracker. This layer owns the caller side of the tracker
/// contract, so malformed spend is rejected here.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pbt/budget/budget_config_loader.hpp"
#include "pbt/budget/budget_registry.hpp"
#include "pbt/budget/budgeting_config.hpp"
#include "pbt/budget/clock.hpp"
#include "pbt/foundation/budget_result.hpp"
#include "pbt/foundation/config_manager.hpp"
#include "pbt/foundation/types.hpp"

namespace pbt::budget {

/// Query the current state of a project.
struct ExceedsBudgetRequest {
    std::string configName;
    uint64_t projectId = 0;
};

/// Record spend for a project.
struct RecordBudgetSpendRequest {
    std::string configName;
    uint64_t projectId = 0;
    double spentBudget = 0.0;
};

/// Reply shared by both requests.
struct ExceedsBudgetReply {
    bool exceedsBudget = false;
};

/// Budget service over a set of named configurations.
///
/// Usage:
/// @code
///   ConfigManager cfg;
///   cfg.load("budgets.yaml");
///   auto service = ProjectBudgetService::fromConfig(cfg);
///   if (service) {
///       auto blocked = service.value()->recordBudgetSpend("default", ProjectId(7), 3.0);
///   }
/// @endcode
///
/// Thread-safe. Config lookups take a shared lock; per-project state is
/// serialized inside each BudgetRegistry.
class ProjectBudgetService {
public:
    ProjectBudgetService() = default;

    ProjectBudgetService(const ProjectBudgetService&) = delete;
    ProjectBudgetService& operator=(const ProjectBudgetService&) = delete;

    /// Build a service with every config found under `budgets`.
    static foundation::BudgetResult<std::unique_ptr<ProjectBudgetService>>
    fromConfig(const foundation::ConfigManager& config,
               std::shared_ptr<const Clock> clock = nullptr);

    /// Register a named configuration.
    /// @return InvalidArgument for an empty name or null config,
    ///         AlreadyExists if the name is taken.
    foundation::BudgetResult<void> addConfig(std::string name,
                                             std::shared_ptr<const BudgetingConfig> config);

    /// Whether the project exceeds the named budget.
    /// @return BudgetConfigNotFound for an unknown name.
    foundation::BudgetResult<bool> exceedsBudget(std::string_view configName,
                                                 foundation::ProjectId project);

    /// Record spend and return the updated state.
    /// @return BudgetConfigNotFound for an unknown name, InvalidArgument
    ///         for a negative or non-finite amount.
    foundation::BudgetResult<bool> recordBudgetSpend(std::string_view configName,
                                                     foundation::ProjectId project,
                                                     double spent);

    foundation::BudgetResult<ExceedsBudgetReply> handle(const ExceedsBudgetRequest& request);
    foundation::BudgetResult<ExceedsBudgetReply> handle(const RecordBudgetSpendRequest& request);

    /// Sweep stale trackers from every registry. Returns the number removed.
    std::size_t evictStale();

    /// Trackers currently held across all registries.
    [[nodiscard]] std::size_t trackedProjects() const;

    [[nodiscard]] bool hasConfig(std::string_view configName) const;

    [[nodiscard]] std::size_t configCount() const;

private:
    foundation::BudgetResult<BudgetRegistry*> registryFor(std::string_view configName) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<BudgetRegistry>> registries_;
};

} // namespace pbt::budget
