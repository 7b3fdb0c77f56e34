#pragma once

/// @file tracker.hpp
/// @brief Metrics tracker plugin interface and the value types it produces.

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "wbs/combat/combat_types.hpp"
#include "wbs/model/mechanics.hpp"

namespace wbs::metrics {

/// A single metric value: counter, ratio or label.
using MetricValue = std::variant<int64_t, double, std::string>;

/// Metric name -> value, ordered so serialized output is stable.
using MetricMap = std::map<std::string, MetricValue>;

/// Which registry table a tracker lives in.
enum class TrackerCategory : uint8_t {
    Class,     ///< Keyed by lower-case character class ("rogue")
    Mechanic   ///< Keyed by weapon mechanic type ("bleed")
};

constexpr std::string_view trackerCategoryName(TrackerCategory category) {
    switch (category) {
        case TrackerCategory::Class:    return "class";
        case TrackerCategory::Mechanic: return "mechanic";
    }
    return "unknown";
}

/// Static facts about one combat handed to every tracker at start.
struct CombatContext {
    int combatId = 0;
    std::string weaponName;
    std::string characterName;
    std::string className;
    int level = 1;
    int proficiencyBonus = 2;
    double advantageRate = 0.0;
    int targetArmorClass = 15;
    std::string targetSize = "medium";
    bool bleedImmune = false;
    /// Thresholds of the weapon's bleed effect, when it has one.
    model::SizeThresholds bleedThresholds = model::kDefaultBleedThresholds;
    int rounds = 0;
    int attacksPerRound = 1;
    std::vector<std::string> mechanicTypes;
};

/// Per-combat metrics tracker.
///
/// A fresh instance is created for every combat, so implementations may
/// keep plain member counters. Trackers read AttackResult::specialEffects
/// by name; they never see the weapon or the random stream.
class ITracker {
public:
    virtual ~ITracker() = default;

    [[nodiscard]] virtual TrackerCategory category() const = 0;
    [[nodiscard]] virtual std::string_view name() const = 0;

    virtual void onStart(const CombatContext& context) = 0;
    virtual void onAttack(const combat::AttackResult& result) = 0;

    /// Metrics for the finished combat.
    [[nodiscard]] virtual MetricMap onEnd() = 0;
};

/// Aggregated metrics of one combat.
struct RawMetrics {
    MetricMap universal;
    /// Tracker name -> metrics, one entry per class tracker.
    std::map<std::string, MetricMap> classSpecific;
    /// Tracker name -> metrics, one entry per mechanic tracker.
    std::map<std::string, MetricMap> mechanicSpecific;
};

/// Typed read of @p key from @p metrics; nullptr when absent or of
/// another alternative.
template <typename T>
[[nodiscard]] const T* findMetric(const MetricMap& metrics, std::string_view key) {
    auto it = metrics.find(std::string(key));
    if (it == metrics.end()) {
        return nullptr;
    }
    return std::get_if<T>(&it->second);
}

} // namespace wbs::metrics
