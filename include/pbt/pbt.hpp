#pragma once

/// @file pbt.hpp
/// @brief Umbrella header for the project budget tracker library.

#include "pbt/core/result.hpp"
#include "pbt/foundation/budget_error.hpp"
#include "pbt/foundation/budget_logger.hpp"
#include "pbt/foundation/budget_result.hpp"
#include "pbt/foundation/config_manager.hpp"
#include "pbt/foundation/error_code.hpp"
#include "pbt/foundation/types.hpp"
#include "pbt/budget/budget_config_loader.hpp"
#include "pbt/budget/budget_registry.hpp"
#include "pbt/budget/budget_tracker.hpp"
#include "pbt/budget/budgeting_config.hpp"
#include "pbt/budget/clock.hpp"
#include "pbt/budget/project_budget_service.hpp"
