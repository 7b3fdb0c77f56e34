#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "wbs/foundation/sim_result.hpp"

namespace wbs::foundation {

/// Callback invoked when a watched key changes through set().
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Configuration store for simulation runs.
///
/// The YAML tree is flattened into "section.key" entries on load, so
/// `scenario.target_ac` addresses `scenario: { target_ac: 15 }`.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    SimResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    SimResult<void> loadFromString(std::string_view yaml);

    /// Typed lookup; ConfigKeyNotFound or ConfigTypeMismatch on failure.
    template <typename T>
    SimResult<T> get(std::string_view key) const;

    /// Typed lookup that falls back to @p fallback when the key is absent.
    /// A present key with the wrong type is still reported as an error.
    template <typename T>
    SimResult<T> getOr(std::string_view key, T fallback) const;

    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All flattened keys, sorted.
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    SimResult<void> loadNode(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
SimResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return SimResult<T>::err(
            SimError(ErrorCode::ConfigKeyNotFound,
                     std::string("config key not found: ") + std::string(key)));
    }
    try {
        return SimResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return SimResult<T>::err(
            SimError(ErrorCode::ConfigTypeMismatch,
                     std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
SimResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return SimResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace wbs::foundation
