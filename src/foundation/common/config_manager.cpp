/// @file config_manager.cpp
/// @brief ConfigManager YAML loading, flattening and watcher dispatch.

#include "pbt/foundation/config_manager.hpp"

#include <algorithm>

namespace pbt::foundation {

BudgetResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return replaceWith(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return BudgetResult<void>::err(
            BudgetError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return BudgetResult<void>::err(
            BudgetError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    } catch (const YAML::Exception& e) {
        return BudgetResult<void>::err(
            BudgetError(ErrorCode::ConfigLoadFailed, std::string("YAML error: ") + e.what()));
    }
}

BudgetResult<void> ConfigManager::loadString(std::string_view yaml) {
    try {
        return replaceWith(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return BudgetResult<void>::err(
            BudgetError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    } catch (const YAML::Exception& e) {
        return BudgetResult<void>::err(
            BudgetError(ErrorCode::ConfigLoadFailed, std::string("YAML error: ") + e.what()));
    }
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::string head(prefix);
    if (!head.empty()) {
        head += '.';
    }

    std::vector<std::string> children;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, node] : entries_) {
            if (key.size() <= head.size() || key.compare(0, head.size(), head) != 0) {
                continue;
            }
            auto rest = key.substr(head.size());
            children.push_back(rest.substr(0, rest.find('.')));
        }
    }

    std::sort(children.begin(), children.end());
    children.erase(std::unique(children.begin(), children.end()), children.end());
    return children;
}

BudgetResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    if (!root.IsNull() && !root.IsMap()) {
        return BudgetResult<void>::err(
            BudgetError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root.IsMap()) {
        flatten("", root);
    }
    return BudgetResult<void>::ok();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    // Invoked unlocked so a callback may read the new value back.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace pbt::foundation
