/// @file project_budget_service.cpp
/// @brief ProjectBudgetService request routing and validation.

#include "pbt/budget/project_budget_service.hpp"

#include <cmath>
#include <mutex>

#include "pbt/foundation/budget_logger.hpp"

namespace pbt::budget {

using foundation::BudgetError;
using foundation::BudgetResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ProjectId;

BudgetResult<std::unique_ptr<ProjectBudgetService>>
ProjectBudgetService::fromConfig(const foundation::ConfigManager& config,
                                 std::shared_ptr<const Clock> clock) {
    auto configs = loadBudgetingConfigs(config, std::move(clock));
    if (!configs) {
        return BudgetResult<std::unique_ptr<ProjectBudgetService>>::err(configs.error());
    }

    auto service = std::make_unique<ProjectBudgetService>();
    for (auto& [name, budgeting] : configs.value()) {
        auto added = service->addConfig(name, budgeting);
        if (!added) {
            return BudgetResult<std::unique_ptr<ProjectBudgetService>>::err(added.error());
        }
    }
    return BudgetResult<std::unique_ptr<ProjectBudgetService>>::ok(std::move(service));
}

BudgetResult<void> ProjectBudgetService::addConfig(std::string name,
                                                   std::shared_ptr<const BudgetingConfig> config) {
    if (name.empty()) {
        return BudgetResult<void>::err(
            BudgetError(ErrorCode::InvalidArgument, "config name must not be empty"));
    }
    if (!config) {
        return BudgetResult<void>::err(
            BudgetError(ErrorCode::InvalidArgument, "config '" + name + "' is null"));
    }

    std::unique_lock lock(mutex_);
    if (registries_.count(name) > 0) {
        return BudgetResult<void>::err(
            BudgetError(ErrorCode::AlreadyExists, "config '" + name + "' already registered"));
    }
    auto registry = std::make_unique<BudgetRegistry>(std::move(config), name);
    registries_.emplace(std::move(name), std::move(registry));
    return BudgetResult<void>::ok();
}

BudgetResult<bool> ProjectBudgetService::exceedsBudget(std::string_view configName,
                                                       ProjectId project) {
    auto registry = registryFor(configName);
    if (!registry) {
        return BudgetResult<bool>::err(registry.error());
    }
    return BudgetResult<bool>::ok(registry.value()->exceedsBudget(project));
}

BudgetResult<bool> ProjectBudgetService::recordBudgetSpend(std::string_view configName,
                                                           ProjectId project,
                                                           double spent) {
    if (!std::isfinite(spent) || spent < 0.0) {
        PBT_LOG_WARN(LogCategory::Service,
                     "rejected spend of " + std::to_string(spent) + " for project " +
                         std::to_string(project.value()));
        return BudgetResult<bool>::err(
            BudgetError(ErrorCode::InvalidArgument,
                        "spent budget must be a finite, non-negative number"));
    }

    auto registry = registryFor(configName);
    if (!registry) {
        return BudgetResult<bool>::err(registry.error());
    }
    return BudgetResult<bool>::ok(registry.value()->recordSpend(project, spent));
}

BudgetResult<ExceedsBudgetReply> ProjectBudgetService::handle(const ExceedsBudgetRequest& request) {
    auto result = exceedsBudget(request.configName, ProjectId(request.projectId));
    if (!result) {
        return BudgetResult<ExceedsBudgetReply>::err(result.error());
    }
    return BudgetResult<ExceedsBudgetReply>::ok(ExceedsBudgetReply{result.value()});
}

BudgetResult<ExceedsBudgetReply> ProjectBudgetService::handle(const RecordBudgetSpendRequest& request) {
    auto result = recordBudgetSpend(request.configName, ProjectId(request.projectId),
                                    request.spentBudget);
    if (!result) {
        return BudgetResult<ExceedsBudgetReply>::err(result.error());
    }
    return BudgetResult<ExceedsBudgetReply>::ok(ExceedsBudgetReply{result.value()});
}

std::size_t ProjectBudgetService::evictStale() {
    std::shared_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto& [name, registry] : registries_) {
        removed += registry->evictStale();
    }
    return removed;
}

std::size_t ProjectBudgetService::trackedProjects() const {
    std::shared_lock lock(mutex_);
    std::size_t total = 0;
    for (const auto& [name, registry] : registries_) {
        total += registry->size();
    }
    return total;
}

bool ProjectBudgetService::hasConfig(std::string_view configName) const {
    std::shared_lock lock(mutex_);
    return registries_.find(std::string(configName)) != registries_.end();
}

std::size_t ProjectBudgetService::configCount() const {
    std::shared_lock lock(mutex_);
    return registries_.size();
}

BudgetResult<BudgetRegistry*> ProjectBudgetService::registryFor(std::string_view configName) const {
    std::shared_lock lock(mutex_);
    auto it = registries_.find(std::string(configName));
    if (it == registries_.end()) {
        PBT_LOG_WARN(LogCategory::Service,
                     "unknown budgeting config '" + std::string(configName) + "'");
        return BudgetResult<BudgetRegistry*>::err(
            BudgetError(ErrorCode::BudgetConfigNotFound,
                        "unknown budgeting config: " + std::string(configName)));
    }
    // Registries are never removed, so the pointer outlives the lock.
    return BudgetResult<BudgetRegistry*>::ok(it->second.get());
}

} // namespace pbt::budget
