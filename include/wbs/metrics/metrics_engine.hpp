#pragma once

/// @file metrics_engine.hpp
/// @brief Per-combat aggregation of universal and tracker metrics.

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "wbs/foundation/sim_result.hpp"
#include "wbs/metrics/metrics_registry.hpp"
#include "wbs/metrics/tracker.hpp"

namespace wbs::metrics {

using foundation::SimResult;

/// Names of the universal metrics section.
namespace universal_keys {
inline constexpr std::string_view kCombatId = "combat_id";
inline constexpr std::string_view kWeapon = "weapon";
inline constexpr std::string_view kAdvantage = "advantage";
inline constexpr std::string_view kEnemyAc = "enemy_ac";
inline constexpr std::string_view kEnemySize = "enemy_size";
inline constexpr std::string_view kRoundsSimulated = "rounds_simulated";
inline constexpr std::string_view kAttacksMade = "attacks_made";
inline constexpr std::string_view kHits = "hits";
inline constexpr std::string_view kMisses = "misses";
inline constexpr std::string_view kCritHits = "crit_hits";
inline constexpr std::string_view kNonCritHits = "non_crit_hits";
inline constexpr std::string_view kTotalDamage = "total_damage";
inline constexpr std::string_view kWeaponDamage = "weapon_damage";
inline constexpr std::string_view kCritBonusDamage = "crit_bonus_damage";
inline constexpr std::string_view kRoundsToFirstCrit = "rounds_to_first_crit";
} // namespace universal_keys

/// Lifecycle per combat: start() -> recordAttack()* -> finalize().
///
/// start() instantiates fresh trackers from the registry for the context's
/// class and mechanic types. finalize() without a preceding start() is a
/// MetricsNotStarted error. One engine serves one combat at a time.
class MetricsEngine {
public:
    explicit MetricsEngine(const MetricsRegistry& registry = MetricsRegistry::instance());

    void start(int combatId, const CombatContext& context);

    /// Install an extra tracker for the current combat (after start()).
    void addTracker(std::unique_ptr<ITracker> tracker);

    SimResult<void> recordAttack(const combat::AttackResult& result);

    SimResult<RawMetrics> finalize();

    [[nodiscard]] bool started() const noexcept { return started_; }
    [[nodiscard]] std::size_t trackerCount() const noexcept { return trackers_.size(); }

private:
    struct Counters {
        int64_t attacks = 0;
        int64_t hits = 0;
        int64_t misses = 0;
        int64_t critHits = 0;
        int64_t totalDamage = 0;
        int64_t weaponDamage = 0;
        int64_t critBonusDamage = 0;
        int maxRound = 0;
        std::optional<int> firstCritRound;
    };

    const MetricsRegistry& registry_;
    bool started_ = false;
    int combatId_ = 0;
    CombatContext context_;
    Counters counters_;
    std::vector<std::unique_ptr<ITracker>> trackers_;
};

} // namespace wbs::metrics
