#pragma once

/// @file bleed_effect.hpp
/// @brief Bleed/hemorrhage state machine.
///
/// States: ACCUMULATING (0 <= counter < threshold), PROCCED (instantaneous,
/// counter returns to 0) and IMMUNE (decided per attack from the target,
/// never stored). Only resolved hits drive transitions.

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "wbs/combat/status_effect.hpp"
#include "wbs/dice/dice_expression.hpp"
#include "wbs/model/mechanics.hpp"

namespace wbs::combat {

/// Counter and size-threshold table owned by one weapon instance.
///
/// The counter never goes negative and only decreases through reset().
class BleedState {
public:
    explicit BleedState(model::SizeThresholds thresholds = model::kDefaultBleedThresholds)
        : thresholds_(thresholds) {}

    [[nodiscard]] int counter() const noexcept { return counter_; }

    [[nodiscard]] int thresholdFor(model::SizeClass size) const noexcept {
        return thresholds_[static_cast<std::size_t>(size)];
    }

    [[nodiscard]] const model::SizeThresholds& thresholds() const noexcept { return thresholds_; }

    /// Add a non-negative amount; negative input is ignored.
    void add(int amount) noexcept {
        if (amount > 0) {
            counter_ += amount;
        }
    }

    void reset() noexcept { counter_ = 0; }

private:
    int counter_ = 0;
    model::SizeThresholds thresholds_;
};

/// Bleed status effect.
///
/// Per hit:
///  1. Immune target (explicit flag, or construct/undead/elemental in the
///     size string): emit a zero "Bleed Immunity" effect and stop.
///  2. Roll the counter die (d4, d8 with advantage; a critical doubles the
///     count) and emit "Bleed Counter".
///  3. At or above the size threshold, roll (base + proficiency)d6 necrotic,
///     emit "Hemorrhage", add it to the attack and reset the counter.
class BleedEffect : public IStatusEffect {
public:
    static SimResult<std::unique_ptr<BleedEffect>> create(std::string name,
                                                          const model::BleedParameters& params);

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] std::string_view mechanicType() const override {
        return model::mechanicTypeName(model::MechanicType::Bleed);
    }

    SimResult<void> applyOnHit(const AttackContext& ctx, AttackResult& result,
                               dice::DiceRoller& roller) override;

    void switchTarget() override { state_.reset(); }

    [[nodiscard]] const BleedState& state() const noexcept { return state_; }

    /// Proc damage dice for a given base and attacker proficiency.
    [[nodiscard]] static dice::DiceExpression hemorrhageDice(int baseDice, int proficiencyBonus) noexcept;

private:
    BleedEffect(std::string name, dice::DiceExpression normalDice,
                dice::DiceExpression advantageDice, const model::BleedParameters& params);

    std::string name_;
    dice::DiceExpression normalDice_;
    dice::DiceExpression advantageDice_;
    bool criticalDoublesCounter_;
    int hemorrhageBaseDice_;
    BleedState state_;
};

/// Temporary hit points granted by a healing mechanic ("Reaver's Feast").
///
/// With no dice configured the grant mirrors the hemorrhage damage of the
/// same attack, which requires the Hemorrhage trigger.
class TempHpEffect : public IStatusEffect {
public:
    static SimResult<std::unique_ptr<TempHpEffect>> create(std::string name,
                                                           const model::HealingParameters& params);

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] std::string_view mechanicType() const override {
        return model::mechanicTypeName(model::MechanicType::Healing);
    }

    SimResult<void> applyOnHit(const AttackContext& ctx, AttackResult& result,
                               dice::DiceRoller& roller) override;

    void switchTarget() override {}

private:
    TempHpEffect(std::string name, model::HealingTrigger trigger,
                 std::optional<dice::DiceExpression> dice)
        : name_(std::move(name)), trigger_(trigger), dice_(dice) {}

    std::string name_;
    model::HealingTrigger trigger_;
    std::optional<dice::DiceExpression> dice_;
};

} // namespace wbs::combat
