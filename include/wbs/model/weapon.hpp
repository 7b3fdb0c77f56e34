#pragma once

/// @file weapon.hpp
/// @brief Weapon definitions and the per-combat weapon instance that owns
///        mutable status-effect state.

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "wbs/combat/status_effect.hpp"
#include "wbs/dice/dice_expression.hpp"
#include "wbs/model/mechanics.hpp"

namespace wbs::dice {
class DiceRoller;
} // namespace wbs::dice

namespace wbs::model {

using foundation::SimResult;

/// Static description of a weapon. Copyable and shareable across threads.
struct WeaponDefinition {
    std::string name;
    std::string rarity = "common";
    std::string baseDamage = "1d8";
    std::string damageType = "slashing";
    std::vector<std::string> properties;
    int magicBonus = 0;
    std::vector<MechanicDefinition> mechanics;

    /// Case-insensitive property lookup ("finesse", "ranged", ...).
    [[nodiscard]] bool hasProperty(std::string_view property) const;

    /// Mechanic type strings in definition order, without duplicates.
    [[nodiscard]] std::vector<std::string> mechanicTypes() const;
};

/// Dice outcome of a weapon's base damage roll.
struct BaseDamageRoll {
    /// All weapon dice plus the expression's flat bonus.
    int total = 0;
    /// Sum of the dice added by the critical.
    int criticalExtra = 0;
};

/// A weapon in the hands of one combat.
///
/// Owns its status effects, so every worker of a parallel batch must create
/// its own instance. Move-only.
class WeaponInstance {
public:
    /// Validate @p definition and build its status effects.
    /// MalformedDiceExpression / UnsupportedDieSize on bad dice strings.
    static SimResult<WeaponInstance> create(const WeaponDefinition& definition);

    WeaponInstance(WeaponInstance&&) noexcept = default;
    WeaponInstance& operator=(WeaponInstance&&) noexcept = default;
    WeaponInstance(const WeaponInstance&) = delete;
    WeaponInstance& operator=(const WeaponInstance&) = delete;
    ~WeaponInstance() = default;

    [[nodiscard]] const std::string& name() const noexcept { return definition_.name; }
    [[nodiscard]] int magicBonus() const noexcept { return definition_.magicBonus; }
    [[nodiscard]] const WeaponDefinition& definition() const noexcept { return definition_; }
    [[nodiscard]] const dice::DiceExpression& damageDice() const noexcept { return damageDice_; }

    /// Roll base damage; a critical doubles the dice count only.
    BaseDamageRoll resolveBaseDamage(bool isCritical, dice::DiceRoller& roller) const;

    [[nodiscard]] std::vector<std::unique_ptr<combat::IStatusEffect>>& statusEffects() noexcept {
        return effects_;
    }
    [[nodiscard]] const std::vector<std::unique_ptr<combat::IStatusEffect>>& statusEffects() const noexcept {
        return effects_;
    }

    /// First status effect whose mechanic type is @p type, or nullptr.
    [[nodiscard]] combat::IStatusEffect* findEffect(std::string_view type) const;

    /// Forward a target change to every status effect.
    void switchTarget();

private:
    WeaponInstance(WeaponDefinition definition, dice::DiceExpression damageDice);

    WeaponDefinition definition_;
    dice::DiceExpression damageDice_;
    std::vector<std::unique_ptr<combat::IStatusEffect>> effects_;
};

} // namespace wbs::model
