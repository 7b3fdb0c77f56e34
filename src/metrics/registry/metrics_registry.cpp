/// @file metrics_registry.cpp
/// @brief MetricsRegistry implementation.

#include "wbs/metrics/metrics_registry.hpp"

#include <algorithm>

namespace wbs::metrics {

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry registry;
    return registry;
}

MetricsRegistry::Table& MetricsRegistry::table(TrackerCategory category) {
    return category == TrackerCategory::Class ? classTrackers_ : mechanicTrackers_;
}

const MetricsRegistry::Table& MetricsRegistry::table(TrackerCategory category) const {
    return category == TrackerCategory::Class ? classTrackers_ : mechanicTrackers_;
}

void MetricsRegistry::registerTracker(TrackerCategory category, std::string key,
                                      TrackerFactory factory) {
    std::lock_guard lock(mutex_);
    table(category)[std::move(key)] = std::move(factory);
}

void MetricsRegistry::unregisterTracker(TrackerCategory category, std::string_view key) {
    std::lock_guard lock(mutex_);
    table(category).erase(std::string(key));
}

bool MetricsRegistry::hasTracker(TrackerCategory category, std::string_view key) const {
    std::lock_guard lock(mutex_);
    return table(category).count(std::string(key)) > 0;
}

std::unique_ptr<ITracker> MetricsRegistry::create(TrackerCategory category,
                                                  std::string_view key) const {
    TrackerFactory factory;
    {
        std::lock_guard lock(mutex_);
        const auto& t = table(category);
        auto it = t.find(std::string(key));
        if (it == t.end()) {
            return nullptr;
        }
        factory = it->second;
    }
    return factory();
}

std::vector<std::unique_ptr<ITracker>> MetricsRegistry::createForCombat(
    std::string_view classKey, const std::vector<std::string>& mechanicTypes) const
{
    std::vector<std::unique_ptr<ITracker>> trackers;
    if (auto tracker = create(TrackerCategory::Class, classKey)) {
        trackers.push_back(std::move(tracker));
    }

    std::vector<std::string> seen;
    for (const auto& type : mechanicTypes) {
        if (std::find(seen.begin(), seen.end(), type) != seen.end()) {
            continue;
        }
        seen.push_back(type);
        if (auto tracker = create(TrackerCategory::Mechanic, type)) {
            trackers.push_back(std::move(tracker));
        }
    }
    return trackers;
}

std::vector<std::string> MetricsRegistry::keys(TrackerCategory category) const {
    std::vector<std::string> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& entry : table(category)) {
            out.push_back(entry.first);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace wbs::metrics
