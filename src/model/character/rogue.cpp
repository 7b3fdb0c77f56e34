/// @file rogue.cpp
/// @brief Rogue progression: proficiency and Sneak Attack by level.

#include "wbs/model/rogue.hpp"

#include <string>
#include <utility>

#include "wbs/combat/combat_types.hpp"

namespace wbs::model {

using foundation::ErrorCode;
using foundation::SimError;

ClassFeature makeSneakAttackFeature(int level) {
    ClassFeature feature;
    feature.name = std::string(combat::effect_names::kSneakAttack);
    feature.trigger = FeatureTrigger::Hit;
    feature.effectType = FeatureEffectType::Damage;
    feature.dice = sneakAttackDice(level).toString();
    feature.eligibility = FeatureEligibility{true, {"finesse", "ranged", "thrown"}};
    return feature;
}

SimResult<CharacterInstance> makeRogue(int level, int dexterityModifier) {
    if (level < kMinCharacterLevel || level > kMaxCharacterLevel) {
        return SimResult<CharacterInstance>::err(
            SimError(ErrorCode::InvalidCharacter,
                     "rogue level " + std::to_string(level) + " is outside 1..20"));
    }

    const int proficiency = rogueProficiencyBonus(level);

    CharacterDefinition def;
    def.name = "Rogue " + std::to_string(level);
    def.className = "Rogue";
    def.level = level;
    def.proficiencyBonus = proficiency;
    def.attackModifiers.push_back(AttackModifier{"Dexterity", dexterityModifier, std::nullopt});
    def.attackModifiers.push_back(AttackModifier{"Proficiency", proficiency, std::nullopt});
    def.damageModifiers.push_back(
        DamageModifier{"Dexterity", ModifierTrigger::Always, dexterityModifier, std::nullopt});
    def.features.push_back(makeSneakAttackFeature(level));

    return CharacterInstance::create(std::move(def));
}

} // namespace wbs::model
