/// @file attack_resolver.cpp
/// @brief AttackResolver implementation.

#include "wbs/combat/attack_resolver.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "wbs/dice/dice_roller.hpp"
#include "wbs/foundation/sim_logger.hpp"
#include "wbs/model/character.hpp"
#include "wbs/model/weapon.hpp"

namespace wbs::combat {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SimError;

AttackResolver::AttackResolver(dice::DiceRoller& roller) : roller_(roller) {}

void AttackResolver::beginCombat(AdvantageStrategy strategy) {
    strategy_ = std::move(strategy);
}

bool AttackResolver::effectiveAdvantage(const AttackContext& ctx) {
    if (ctx.hasAdvantage) {
        return *ctx.hasAdvantage;
    }
    if (!strategy_) {
        if (ctx.scenario == nullptr) {
            return false;
        }
        strategy_ = computeStrategy(ctx.scenario->rounds, ctx.scenario->advantageRate);
    }
    return hasAdvantage(ctx.round, *strategy_);
}

SimResult<dice::DiceExpression> AttackResolver::parseCached(const std::string& text) {
    auto it = diceCache_.find(text);
    if (it != diceCache_.end()) {
        return SimResult<dice::DiceExpression>::ok(it->second);
    }
    auto parsed = dice::parseDiceExpression(text);
    if (parsed) {
        diceCache_.emplace(text, parsed.value());
    }
    return parsed;
}

// ── Attack pipeline ─────────────────────────────────────────────────────

SimResult<AttackResult> AttackResolver::resolveAttack(const AttackContext& ctx) {
    if (ctx.attacker == nullptr || ctx.weapon == nullptr) {
        return SimResult<AttackResult>::err(
            SimError(ErrorCode::InvalidArgument, "attack context needs an attacker and a weapon"));
    }

    const auto& attacker = *ctx.attacker;
    auto& weapon = *ctx.weapon;

    AttackResult result;
    result.round = ctx.round;
    result.attackIndex = ctx.attackIndex;
    result.hadAdvantage = effectiveAdvantage(ctx);

    // To-hit.
    auto d20 = roller_.rollD20(result.hadAdvantage, ctx.hasDisadvantage);
    result.naturalRoll = d20.natural;
    result.attackTotal = d20.natural + attacker.attackBonus() + weapon.magicBonus();
    result.critical = d20.natural >= attacker.critRange();
    result.hit = result.critical || result.attackTotal >= ctx.targetArmorClass;

    if (!result.hit) {
        return SimResult<AttackResult>::ok(std::move(result));
    }

    // Base damage.
    auto base = weapon.resolveBaseDamage(result.critical, roller_);
    result.baseDamage = base.total;
    result.critDamage = base.criticalExtra;
    result.bonusDamage = attacker.flatDamageBonus() + weapon.magicBonus();
    result.totalDamage = result.baseDamage + result.bonusDamage;

    // Weapon status effects.
    for (auto& effect : weapon.statusEffects()) {
        auto applied = effect->applyOnHit(ctx, result, roller_);
        if (!applied) {
            return SimResult<AttackResult>::err(std::move(applied).error());
        }
    }

    auto modified = applyCharacterModifiers(ctx, result);
    if (!modified) {
        return SimResult<AttackResult>::err(std::move(modified).error());
    }

    WBS_LOG_TRACE(LogCategory::Combat,
                  "Round " + std::to_string(ctx.round) + " attack " +
                      std::to_string(ctx.attackIndex) + ": d20=" +
                      std::to_string(result.naturalRoll) +
                      (result.critical ? " crit" : "") + " dmg=" +
                      std::to_string(result.totalDamage));

    return SimResult<AttackResult>::ok(std::move(result));
}

// ── Character modifiers and class features ──────────────────────────────

SimResult<void> AttackResolver::applyModifier(const model::DamageModifier& modifier,
                                              std::string_view suffix, AttackResult& result) {
    int amount = modifier.flat;
    if (modifier.dice) {
        auto expr = parseCached(*modifier.dice);
        if (!expr) {
            return SimResult<void>::err(expr.error());
        }
        amount += roller_.roll(expr.value()).total;
    }

    std::string name = modifier.name;
    name += suffix;
    result.bonusDamage += amount;
    result.appendEffect(name, amount, effect_categories::kModifier, true, true);
    return SimResult<void>::ok();
}

SimResult<void> AttackResolver::applyFeature(const model::ClassFeature& feature,
                                             const AttackContext& ctx, AttackResult& result) {
    if (feature.eligibility &&
        !feature.eligibility->isSatisfied(result.hadAdvantage, ctx.weapon->definition())) {
        return SimResult<void>::ok();
    }

    int amount = feature.value;
    if (feature.dice) {
        auto expr = parseCached(*feature.dice);
        if (!expr) {
            return SimResult<void>::err(expr.error());
        }
        amount += roller_.roll(dice::criticalAdjust(expr.value(), result.critical)).total;
    }

    result.bonusDamage += amount;
    result.appendEffect(feature.name, amount, effect_categories::kClassFeature, true, true);
    return SimResult<void>::ok();
}

SimResult<void> AttackResolver::applyCharacterModifiers(const AttackContext& ctx,
                                                        AttackResult& result) {
    const auto& attacker = *ctx.attacker;

    auto applyAll = [&](model::ModifierTrigger trigger, std::string_view suffix) -> SimResult<void> {
        for (const auto* modifier : attacker.getDamageModifiers(trigger)) {
            auto applied = applyModifier(*modifier, suffix, result);
            if (!applied) {
                return applied;
            }
        }
        return SimResult<void>::ok();
    };

    auto fireAll = [&](model::FeatureTrigger trigger) -> SimResult<void> {
        for (const auto* feature : attacker.getTriggeredFeatures(trigger)) {
            auto applied = applyFeature(*feature, ctx, result);
            if (!applied) {
                return applied;
            }
        }
        return SimResult<void>::ok();
    };

    if (auto r = applyAll(model::ModifierTrigger::Hit, ""); !r) {
        return r;
    }
    if (result.critical) {
        if (auto r = applyAll(model::ModifierTrigger::Critical, effect_names::kCriticalSuffix); !r) {
            return r;
        }
    }
    if (result.hemorrhageTriggered) {
        if (auto r = applyAll(model::ModifierTrigger::Hemorrhage, effect_names::kHemorrhageSuffix); !r) {
            return r;
        }
    }

    if (auto r = fireAll(model::FeatureTrigger::Hit); !r) {
        return r;
    }
    if (result.critical) {
        if (auto r = fireAll(model::FeatureTrigger::Critical); !r) {
            return r;
        }
    }
    if (result.hemorrhageTriggered) {
        if (auto r = fireAll(model::FeatureTrigger::Hemorrhage); !r) {
            return r;
        }
    }
    return SimResult<void>::ok();
}

} // namespace wbs::combat
