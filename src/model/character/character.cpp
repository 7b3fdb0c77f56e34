/// @file character.cpp
/// @brief CharacterInstance and class feature eligibility.

#include "wbs/model/character.hpp"

#include <algorithm>
#include <utility>

#include "wbs/model/target_size.hpp"
#include "wbs/model/weapon.hpp"

namespace wbs::model {

using foundation::ErrorCode;
using foundation::SimError;

bool FeatureEligibility::isSatisfied(bool hasAdvantage, const WeaponDefinition& weapon) const {
    if (requiresAdvantage && !hasAdvantage) {
        return false;
    }
    if (anyWeaponProperty.empty()) {
        return true;
    }
    return std::any_of(anyWeaponProperty.begin(), anyWeaponProperty.end(),
                       [&](const std::string& p) { return weapon.hasProperty(p); });
}

CharacterInstance::CharacterInstance(CharacterDefinition definition)
    : definition_(std::move(definition))
{
    for (const auto& mod : definition_.attackModifiers) {
        attackBonus_ += mod.hitBonus;
        if (mod.critRange) {
            critRange_ = std::min(critRange_, *mod.critRange);
        }
    }
    for (const auto& mod : definition_.damageModifiers) {
        if (mod.trigger == ModifierTrigger::Always) {
            flatDamageBonus_ += mod.flat;
        }
    }
    for (const auto& feature : definition_.features) {
        if (feature.effectType == FeatureEffectType::HitBonus) {
            attackBonus_ += feature.value;
        } else if (feature.effectType == FeatureEffectType::CritRange) {
            critRange_ = std::min(critRange_, feature.value);
        }
    }
}

SimResult<CharacterInstance> CharacterInstance::create(CharacterDefinition definition) {
    if (definition.level < 1 || definition.level > 20) {
        return SimResult<CharacterInstance>::err(
            SimError(ErrorCode::InvalidCharacter,
                     "character '" + definition.name + "': level must be 1..20"));
    }
    if (definition.proficiencyBonus < 0) {
        return SimResult<CharacterInstance>::err(
            SimError(ErrorCode::InvalidCharacter,
                     "character '" + definition.name + "': negative proficiency bonus"));
    }
    CharacterInstance instance(std::move(definition));
    if (instance.critRange_ < 2 || instance.critRange_ > 20) {
        return SimResult<CharacterInstance>::err(
            SimError(ErrorCode::InvalidCharacter,
                     "character '" + instance.name() + "': crit range must be 2..20"));
    }
    return SimResult<CharacterInstance>::ok(std::move(instance));
}

std::vector<const ClassFeature*> CharacterInstance::getTriggeredFeatures(FeatureTrigger trigger) const {
    std::vector<const ClassFeature*> out;
    for (const auto& feature : definition_.features) {
        if (feature.trigger == trigger && feature.effectType == FeatureEffectType::Damage) {
            out.push_back(&feature);
        }
    }
    return out;
}

std::vector<const DamageModifier*> CharacterInstance::getDamageModifiers(ModifierTrigger trigger) const {
    std::vector<const DamageModifier*> out;
    for (const auto& mod : definition_.damageModifiers) {
        if (mod.trigger == trigger) {
            out.push_back(&mod);
        }
    }
    return out;
}

std::string CharacterInstance::trackerKey() const {
    return toLower(definition_.className);
}

} // namespace wbs::model
