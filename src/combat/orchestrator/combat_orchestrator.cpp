/// @file combat_orchestrator.cpp
/// @brief CombatOrchestrator implementation.
///
/// Per combat:
///   1. Fresh resolver on the caller's stream, seeded with the schedule
///   2. Fresh trackers through the metrics engine
///   3. Rounds x attacks, with target switching, kills and miss streaks
///   4. Metrics finalization

#include "wbs/combat/combat_orchestrator.hpp"

#include <string>
#include <utility>

#include "wbs/combat/attack_resolver.hpp"
#include "wbs/combat/bleed_effect.hpp"
#include "wbs/dice/dice_roller.hpp"
#include "wbs/foundation/sim_logger.hpp"
#include "wbs/metrics/metrics_engine.hpp"
#include "wbs/model/character.hpp"
#include "wbs/model/weapon.hpp"

namespace wbs::combat {

using foundation::LogCategory;

CombatOrchestrator::CombatOrchestrator(const model::CharacterInstance& character,
                                       Scenario scenario,
                                       const metrics::MetricsRegistry& registry)
    : character_(&character),
      scenario_(std::move(scenario)),
      strategy_(computeStrategy(scenario_.rounds, scenario_.advantageRate)),
      registry_(&registry) {}

SimResult<CombatOrchestrator> CombatOrchestrator::create(const model::CharacterInstance& character,
                                                         Scenario scenario,
                                                         const metrics::MetricsRegistry& registry) {
    auto valid = scenario.validate();
    if (!valid) {
        return SimResult<CombatOrchestrator>::err(std::move(valid).error());
    }
    return SimResult<CombatOrchestrator>::ok(
        CombatOrchestrator(character, std::move(scenario), registry));
}

bool CombatOrchestrator::switchesTargetAt(int round) const noexcept {
    return scenario_.targetSwitching && scenario_.switchInterval > 0 && round > 1 &&
           (round - 1) % scenario_.switchInterval == 0;
}

SimResult<CombatResult> CombatOrchestrator::runCombat(int combatId, model::WeaponInstance& weapon,
                                                      dice::DiceRoller& roller) const {
    CombatResult outcome;
    outcome.combatId = combatId;
    outcome.advantageStrategy = strategy_;
    outcome.rounds.reserve(static_cast<std::size_t>(scenario_.rounds));

    AttackResolver resolver(roller);
    resolver.beginCombat(strategy_);

    metrics::CombatContext context;
    context.combatId = combatId;
    context.weaponName = weapon.name();
    context.characterName = character_->name();
    context.className = character_->className();
    context.level = character_->level();
    context.proficiencyBonus = character_->proficiencyBonus();
    context.advantageRate = scenario_.advantageRate;
    context.targetArmorClass = scenario_.targetArmorClass;
    context.targetSize = scenario_.targetSize;
    context.bleedImmune = scenario_.bleedImmune;
    if (const auto* bleed = dynamic_cast<const BleedEffect*>(
            weapon.findEffect(model::mechanicTypeName(model::MechanicType::Bleed)))) {
        context.bleedThresholds = bleed->state().thresholds();
    }
    context.rounds = scenario_.rounds;
    context.attacksPerRound = scenario_.attacksPerRound;
    context.mechanicTypes = weapon.definition().mechanicTypes();

    metrics::MetricsEngine engine(*registry_);
    engine.start(combatId, context);

    const int targetHp = scenario_.effectiveTargetHp();
    int remainingHp = targetHp;
    int consecutiveMisses = 0;
    int attackOrdinal = 0;

    for (int round = 1; round <= scenario_.rounds; ++round) {
        RoundResult roundResult;
        roundResult.round = round;
        roundResult.hadAdvantage = hasAdvantage(round, strategy_);

        if (switchesTargetAt(round)) {
            weapon.switchTarget();
            remainingHp = targetHp;
            roundResult.targetSwitched = true;
            ++outcome.targetSwitches;
        }

        for (int a = 0; a < scenario_.attacksPerRound; ++a) {
            AttackContext ctx;
            ctx.attacker = character_;
            ctx.weapon = &weapon;
            ctx.hasAdvantage = roundResult.hadAdvantage;
            ctx.targetArmorClass = scenario_.targetArmorClass;
            ctx.targetSize = scenario_.targetSize;
            ctx.bleedImmune = scenario_.bleedImmune;
            ctx.round = round;
            ctx.attackIndex = a;
            ctx.scenario = &scenario_;

            auto resolved = resolver.resolveAttack(ctx);
            if (!resolved) {
                return SimResult<CombatResult>::err(std::move(resolved).error());
            }
            AttackResult attack = std::move(resolved).value();
            attack.targetSwitched = roundResult.targetSwitched && a == 0;
            ++attackOrdinal;
            ++outcome.attacks;

            if (attack.hit) {
                ++outcome.hits;
                if (attack.critical) {
                    ++outcome.criticals;
                }
                if (consecutiveMisses > 0) {
                    outcome.missStreaks.push_back(consecutiveMisses);
                    consecutiveMisses = 0;
                }

                // Killing blow: the excess is wasted and a fresh target steps in.
                // A hit that lands exactly on the remaining HP leaves the target
                // at 0, so the next hit is wasted in full.
                if (attack.totalDamage > remainingHp) {
                    attack.wastedDamage = attack.totalDamage - remainingHp;
                    outcome.wastedDamage += attack.wastedDamage;
                    ++outcome.kills;
                    remainingHp = targetHp;
                } else {
                    remainingHp -= attack.totalDamage;
                }
            } else {
                ++consecutiveMisses;
            }

            if (attack.hemorrhageTriggered) {
                ++outcome.hemorrhageTriggers;
                outcome.hemorrhageDamage += attack.hemorrhageDamage;
                roundResult.hemorrhageTriggered = true;
                if (!outcome.turnsToFirstTrigger) {
                    outcome.turnsToFirstTrigger = attackOrdinal;
                }
            }

            outcome.totalDamage += attack.totalDamage;
            outcome.totalTempHp += attack.tempHpGained;
            roundResult.damage += attack.totalDamage;
            roundResult.tempHp += attack.tempHpGained;

            auto recorded = engine.recordAttack(attack);
            if (!recorded) {
                return SimResult<CombatResult>::err(std::move(recorded).error());
            }
            roundResult.attacks.push_back(std::move(attack));
        }

        outcome.rounds.push_back(std::move(roundResult));
    }

    if (outcome.attacks > 0) {
        outcome.hitRate = static_cast<double>(outcome.hits) / outcome.attacks;
        outcome.criticalRate = static_cast<double>(outcome.criticals) / outcome.attacks;
    }

    auto finalized = engine.finalize();
    if (!finalized) {
        return SimResult<CombatResult>::err(std::move(finalized).error());
    }
    outcome.metrics = std::move(finalized).value();

    WBS_LOG_TRACE(LogCategory::Combat,
                  "Combat " + std::to_string(combatId) + ": " +
                      std::to_string(outcome.totalDamage) + " damage, " +
                      std::to_string(outcome.hemorrhageTriggers) + " hemorrhage(s)");

    return SimResult<CombatResult>::ok(std::move(outcome));
}

} // namespace wbs::combat
