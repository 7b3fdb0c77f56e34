#pragma once

/// @file metrics_registry.hpp
/// @brief Name-keyed tracker factories, populated at static-init time.
///
/// The metrics engine only depends on ITracker and this registry; concrete
/// trackers add themselves with WBS_REGISTER_TRACKER in their own .cpp.

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "wbs/metrics/tracker.hpp"

namespace wbs::metrics {

using TrackerFactory = std::function<std::unique_ptr<ITracker>()>;

/// Two independent key -> factory tables (class and mechanic trackers).
///
/// Registering the same key twice replaces the earlier factory.
class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    void registerTracker(TrackerCategory category, std::string key, TrackerFactory factory);

    /// Drop a registration; used by tests that install temporary trackers.
    void unregisterTracker(TrackerCategory category, std::string_view key);

    [[nodiscard]] bool hasTracker(TrackerCategory category, std::string_view key) const;

    /// Fresh tracker for @p key, or nullptr when none is registered.
    [[nodiscard]] std::unique_ptr<ITracker> create(TrackerCategory category,
                                                   std::string_view key) const;

    /// Fresh trackers for a combat: one for the lower-case class name (if
    /// registered) and one per distinct mechanic type (if registered).
    [[nodiscard]] std::vector<std::unique_ptr<ITracker>> createForCombat(
        std::string_view classKey, const std::vector<std::string>& mechanicTypes) const;

    /// Registered keys of one table, sorted.
    [[nodiscard]] std::vector<std::string> keys(TrackerCategory category) const;

private:
    MetricsRegistry() = default;

    using Table = std::unordered_map<std::string, TrackerFactory>;

    Table& table(TrackerCategory category);
    const Table& table(TrackerCategory category) const;

    mutable std::mutex mutex_;
    Table classTrackers_;
    Table mechanicTrackers_;
};

namespace detail {

/// RAII helper that registers a factory on construction.
struct TrackerRegistrar {
    TrackerRegistrar(TrackerCategory category, const char* key, TrackerFactory factory) {
        MetricsRegistry::instance().registerTracker(category, key, std::move(factory));
    }
};

} // namespace detail
} // namespace wbs::metrics

/// Register a tracker type under a registry key.
///
/// Usage (in the tracker's .cpp):
/// @code
///   WBS_REGISTER_TRACKER(HemorrhageTracker, Mechanic, "bleed");
/// @endcode
#define WBS_REGISTER_TRACKER(TrackerClass, Category, Key)                                       \
    static ::wbs::metrics::detail::TrackerRegistrar                                             \
    wbs_tracker_##TrackerClass##_registrar(::wbs::metrics::TrackerCategory::Category, Key,      \
                                           []() -> std::unique_ptr<::wbs::metrics::ITracker> { \
                                               return std::make_unique<TrackerClass>();         \
                                           })
