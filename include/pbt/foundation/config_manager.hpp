#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access and watch support.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "pbt/foundation/budget_result.hpp"

namespace pbt::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g. "budgets.default.allowed_budget"), runtime overrides, and change
/// callbacks.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    BudgetResult<void> load(const std::filesystem::path& path);

    /// Load configuration from a YAML document held in memory.
    /// @return Success or ConfigLoadFailed error.
    BudgetResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    BudgetResult<T> get(std::string_view key) const;

    /// Set a value by dotted key and notify watchers for that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Names of the immediate children of a dotted prefix, sorted.
    ///
    /// For entries "budgets.a.x" and "budgets.b.y", childKeys("budgets")
    /// returns {"a", "b"}.
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

private:
    BudgetResult<void> replaceWith(const YAML::Node& root);

    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
BudgetResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return BudgetResult<T>::err(
            BudgetError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return BudgetResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return BudgetResult<T>::err(
            BudgetError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace pbt::foundation
