#pragma once

/// @file combat_orchestrator.hpp
/// @brief Drives one combat: rounds x attacks through the resolver, with
///        kill, miss-streak and target-switch bookkeeping.

#include <cstdint>
#include <optional>
#include <vector>

#include "wbs/combat/advantage_scheduler.hpp"
#include "wbs/combat/combat_types.hpp"
#include "wbs/metrics/metrics_registry.hpp"
#include "wbs/metrics/tracker.hpp"

namespace wbs::dice {
class DiceRoller;
} // namespace wbs::dice

namespace wbs::combat {

struct RoundResult {
    int round = 0;
    bool hadAdvantage = false;
    bool targetSwitched = false;
    bool hemorrhageTriggered = false;
    int damage = 0;
    int tempHp = 0;
    std::vector<AttackResult> attacks;
};

/// Outcome of one combat. Immutable once returned.
struct CombatResult {
    int combatId = 0;
    std::vector<RoundResult> rounds;

    int64_t totalDamage = 0;
    int attacks = 0;
    int hits = 0;
    int criticals = 0;
    /// hits / attacks, 0 when no attack was made.
    double hitRate = 0.0;
    /// criticals / attacks, 0 when no attack was made.
    double criticalRate = 0.0;

    /// Closed streaks only; a streak still open at the end is not recorded.
    std::vector<int> missStreaks;
    int64_t wastedDamage = 0;
    int kills = 0;

    int hemorrhageTriggers = 0;
    int64_t hemorrhageDamage = 0;
    /// 1-based ordinal of the attack that first procced, across all rounds.
    std::optional<int> turnsToFirstTrigger;
    int64_t totalTempHp = 0;
    int targetSwitches = 0;

    AdvantageStrategy advantageStrategy;
    metrics::RawMetrics metrics;
};

/// Runs combats of one character under one scenario.
///
/// The scenario is validated and the advantage schedule computed once at
/// creation; every runCombat() call then only needs a weapon instance and
/// a random stream, both owned by the caller and never shared across
/// concurrent combats.
class CombatOrchestrator {
public:
    static SimResult<CombatOrchestrator> create(
        const model::CharacterInstance& character, Scenario scenario,
        const metrics::MetricsRegistry& registry = metrics::MetricsRegistry::instance());

    /// Run one combat. The first resolver or metrics fault aborts it.
    [[nodiscard]] SimResult<CombatResult> runCombat(int combatId, model::WeaponInstance& weapon,
                                                    dice::DiceRoller& roller) const;

    [[nodiscard]] const Scenario& scenario() const noexcept { return scenario_; }
    [[nodiscard]] const AdvantageStrategy& strategy() const noexcept { return strategy_; }

    /// True when the target changes at the start of @p round.
    [[nodiscard]] bool switchesTargetAt(int round) const noexcept;

private:
    CombatOrchestrator(const model::CharacterInstance& character, Scenario scenario,
                       const metrics::MetricsRegistry& registry);

    const model::CharacterInstance* character_;
    Scenario scenario_;
    AdvantageStrategy strategy_;
    const metrics::MetricsRegistry* registry_;
};

} // namespace wbs::combat
