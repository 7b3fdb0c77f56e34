/// @file config_manager.cpp
/// @brief ConfigManager implementation over yaml-cpp.

#include "wbs/foundation/config_manager.hpp"

#include <algorithm>

namespace wbs::foundation {

SimResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return loadNode(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return SimResult<void>::err(
            SimError(ErrorCode::ConfigLoadFailed,
                     "failed to open config file: " + path.string(), path));
    } catch (const YAML::ParserException& e) {
        return SimResult<void>::err(
            SimError(ErrorCode::ConfigLoadFailed,
                     std::string("YAML parse error: ") + e.what(), path));
    }
}

SimResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        return loadNode(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return SimResult<void>::err(
            SimError(ErrorCode::ConfigLoadFailed,
                     std::string("YAML parse error: ") + e.what()));
    }
}

SimResult<void> ConfigManager::loadNode(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return SimResult<void>::err(
            SimError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root && root.IsMap()) {
        flatten("", root);
    }
    return SimResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keys() const {
    std::vector<std::string> out;
    {
        std::lock_guard lock(mutex_);
        out.reserve(entries_.size());
        for (const auto& [key, _] : entries_) {
            out.push_back(key);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Scalars and sequences are leaves.
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
    // Invoked without the lock so a callback may read the new value.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

} // namespace wbs::foundation
