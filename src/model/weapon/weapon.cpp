/// @file weapon.cpp
/// @brief WeaponDefinition helpers and WeaponInstance construction.

#include "wbs/model/weapon.hpp"

#include <algorithm>
#include <utility>

#include "wbs/combat/bleed_effect.hpp"
#include "wbs/dice/dice_roller.hpp"
#include "wbs/model/target_size.hpp"

namespace wbs::model {

using foundation::ErrorCode;
using foundation::SimError;

bool WeaponDefinition::hasProperty(std::string_view property) const {
    const std::string wanted = toLower(property);
    return std::any_of(properties.begin(), properties.end(),
                       [&](const std::string& p) { return toLower(p) == wanted; });
}

std::vector<std::string> WeaponDefinition::mechanicTypes() const {
    std::vector<std::string> types;
    for (const auto& mechanic : mechanics) {
        std::string type(mechanicTypeName(mechanic.type));
        if (std::find(types.begin(), types.end(), type) == types.end()) {
            types.push_back(std::move(type));
        }
    }
    return types;
}

WeaponInstance::WeaponInstance(WeaponDefinition definition, dice::DiceExpression damageDice)
    : definition_(std::move(definition)), damageDice_(damageDice) {}

SimResult<WeaponInstance> WeaponInstance::create(const WeaponDefinition& definition) {
    if (definition.name.empty()) {
        return SimResult<WeaponInstance>::err(
            SimError(ErrorCode::InvalidWeaponDefinition, "weapon name must not be empty"));
    }

    auto damage = dice::parseDiceExpression(definition.baseDamage);
    if (!damage) {
        return SimResult<WeaponInstance>::err(damage.error());
    }

    WeaponInstance instance(definition, damage.value());
    for (const auto& mechanic : definition.mechanics) {
        switch (mechanic.type) {
            case MechanicType::Bleed: {
                auto effect = combat::BleedEffect::create(mechanic.name, mechanic.bleed);
                if (!effect) {
                    return SimResult<WeaponInstance>::err(effect.error());
                }
                instance.effects_.push_back(std::move(effect).value());
                break;
            }
            case MechanicType::Healing: {
                auto effect = combat::TempHpEffect::create(mechanic.name, mechanic.healing);
                if (!effect) {
                    return SimResult<WeaponInstance>::err(effect.error());
                }
                instance.effects_.push_back(std::move(effect).value());
                break;
            }
        }
    }
    return SimResult<WeaponInstance>::ok(std::move(instance));
}

BaseDamageRoll WeaponInstance::resolveBaseDamage(bool isCritical, dice::DiceRoller& roller) const {
    auto roll = roller.roll(dice::criticalAdjust(damageDice_, isCritical));

    BaseDamageRoll out;
    out.total = roll.total;
    if (isCritical) {
        for (std::size_t i = static_cast<std::size_t>(damageDice_.count); i < roll.dice.size(); ++i) {
            out.criticalExtra += roll.dice[i];
        }
    }
    return out;
}

combat::IStatusEffect* WeaponInstance::findEffect(std::string_view type) const {
    for (const auto& effect : effects_) {
        if (effect->mechanicType() == type) {
            return effect.get();
        }
    }
    return nullptr;
}

void WeaponInstance::switchTarget() {
    for (auto& effect : effects_) {
        effect->switchTarget();
    }
}

} // namespace wbs::model
