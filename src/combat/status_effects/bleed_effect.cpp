/// @file bleed_effect.cpp
/// @brief Bleed/hemorrhage and temporary HP status effects.

#include "wbs/combat/bleed_effect.hpp"

#include <algorithm>
#include <utility>

#include "wbs/dice/dice_roller.hpp"
#include "wbs/foundation/sim_logger.hpp"
#include "wbs/model/character.hpp"
#include "wbs/model/target_size.hpp"

namespace wbs::combat {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SimError;

// ---------------------------------------------------------------------------
// BleedEffect
// ---------------------------------------------------------------------------

BleedEffect::BleedEffect(std::string name, dice::DiceExpression normalDice,
                         dice::DiceExpression advantageDice,
                         const model::BleedParameters& params)
    : name_(std::move(name)),
      normalDice_(normalDice),
      advantageDice_(advantageDice),
      criticalDoublesCounter_(params.criticalDoublesCounter),
      hemorrhageBaseDice_(params.hemorrhageBaseDice),
      state_(params.thresholds) {}

SimResult<std::unique_ptr<BleedEffect>> BleedEffect::create(
    std::string name, const model::BleedParameters& params)
{
    using Out = SimResult<std::unique_ptr<BleedEffect>>;

    auto normal = dice::parseDiceExpression(params.normalCounterDice);
    if (!normal) {
        return Out::err(normal.error());
    }
    auto advantage = dice::parseDiceExpression(params.advantageCounterDice);
    if (!advantage) {
        return Out::err(advantage.error());
    }
    if (params.hemorrhageBaseDice < 0) {
        return Out::err(SimError(ErrorCode::InvalidWeaponDefinition,
                                 "bleed '" + name + "': hemorrhage base dice must not be negative"));
    }
    if (std::any_of(params.thresholds.begin(), params.thresholds.end(),
                    [](int t) { return t < 1; })) {
        return Out::err(SimError(ErrorCode::InvalidWeaponDefinition,
                                 "bleed '" + name + "': thresholds must be positive"));
    }

    return Out::ok(std::unique_ptr<BleedEffect>(
        new BleedEffect(std::move(name), normal.value(), advantage.value(), params)));
}

dice::DiceExpression BleedEffect::hemorrhageDice(int baseDice, int proficiencyBonus) noexcept {
    return dice::makeDice(std::max(1, baseDice + proficiencyBonus), 6);
}

SimResult<void> BleedEffect::applyOnHit(const AttackContext& ctx, AttackResult& result,
                                        dice::DiceRoller& roller) {
    // 1. Immunity is evaluated per attack and never mutates the counter.
    if (ctx.bleedImmune || model::hasBleedImmunityMarker(ctx.targetSize)) {
        result.appendEffect(effect_names::kBleedImmunity, 0,
                            effect_categories::kImmunity, true, false);
        return SimResult<void>::ok();
    }

    auto size = model::parseSizeClass(ctx.targetSize);
    if (!size) {
        return SimResult<void>::err(size.error());
    }

    // 2. Counter roll.
    const auto& base = result.hadAdvantage ? advantageDice_ : normalDice_;
    auto counterDice = dice::criticalAdjust(base, result.critical && criticalDoublesCounter_);
    int added = std::max(0, roller.roll(counterDice).total);
    state_.add(added);
    result.appendEffect(effect_names::kBleedCounter, added,
                        effect_categories::kCounter, true, false);

    // 3. Threshold check.
    if (state_.counter() < state_.thresholdFor(size.value())) {
        return SimResult<void>::ok();
    }

    int proficiency = ctx.attacker != nullptr ? ctx.attacker->proficiencyBonus() : 0;
    int damage = roller.roll(hemorrhageDice(hemorrhageBaseDice_, proficiency)).total;

    WBS_LOG_DEBUG(LogCategory::Combat,
                  "Hemorrhage on round " + std::to_string(ctx.round) + ": counter " +
                      std::to_string(state_.counter()) + " reached " +
                      std::to_string(state_.thresholdFor(size.value())) + ", " +
                      std::to_string(damage) + " necrotic");

    state_.reset();
    result.hemorrhageTriggered = true;
    result.hemorrhageDamage += damage;
    result.appendEffect(effect_names::kHemorrhage, damage,
                        effect_categories::kNecrotic, true, true);
    return SimResult<void>::ok();
}

// ---------------------------------------------------------------------------
// TempHpEffect
// ---------------------------------------------------------------------------

SimResult<std::unique_ptr<TempHpEffect>> TempHpEffect::create(
    std::string name, const model::HealingParameters& params)
{
    using Out = SimResult<std::unique_ptr<TempHpEffect>>;

    std::optional<dice::DiceExpression> dice;
    if (!params.tempHpDice.empty()) {
        auto parsed = dice::parseDiceExpression(params.tempHpDice);
        if (!parsed) {
            return Out::err(parsed.error());
        }
        dice = parsed.value();
    } else if (params.trigger != model::HealingTrigger::Hemorrhage) {
        return Out::err(SimError(ErrorCode::InvalidWeaponDefinition,
                                 "healing '" + name +
                                     "': temp HP must be dice unless triggered by hemorrhage"));
    }

    return Out::ok(std::unique_ptr<TempHpEffect>(
        new TempHpEffect(std::move(name), params.trigger, dice)));
}

SimResult<void> TempHpEffect::applyOnHit(const AttackContext& /*ctx*/, AttackResult& result,
                                         dice::DiceRoller& roller) {
    bool fires = false;
    switch (trigger_) {
        case model::HealingTrigger::Hit:        fires = true; break;
        case model::HealingTrigger::Critical:   fires = result.critical; break;
        case model::HealingTrigger::Hemorrhage: fires = result.hemorrhageTriggered; break;
    }
    if (!fires) {
        return SimResult<void>::ok();
    }

    int amount = dice_ ? roller.roll(*dice_).total : result.hemorrhageDamage;
    amount = std::max(0, amount);
    result.tempHpGained += amount;
    result.appendEffect(name_, amount, effect_categories::kTempHp, true, false);
    return SimResult<void>::ok();
}

} // namespace wbs::combat
