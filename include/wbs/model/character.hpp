#pragma once

/// @file character.hpp
/// @brief Character definitions: modifiers, class features and the
///        read-only instance consulted by the attack resolver.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wbs/foundation/sim_result.hpp"

namespace wbs::model {

struct WeaponDefinition;

using foundation::SimResult;

/// When a damage modifier applies.
enum class ModifierTrigger : uint8_t {
    Always,      ///< Folded into the flat damage bonus of every hit
    Hit,         ///< Rolled on every hit and listed as an effect
    Critical,    ///< Only on critical hits
    Hemorrhage   ///< Only on the attack whose bleed procced
};

/// Flat or dice damage from equipment, feats or ability scores.
struct DamageModifier {
    std::string name;
    ModifierTrigger trigger = ModifierTrigger::Always;
    int flat = 0;
    /// Dice expression rolled in addition to @c flat.
    std::optional<std::string> dice;
};

/// To-hit contribution, optionally widening the critical range.
struct AttackModifier {
    std::string name;
    int hitBonus = 0;
    /// Lowest natural roll that counts as critical (20 = normal).
    std::optional<int> critRange;
};

enum class FeatureTrigger : uint8_t {
    Hit,
    Critical,
    Hemorrhage
};

enum class FeatureEffectType : uint8_t {
    Damage,     ///< Roll dice (doubled on a critical) and add as damage
    HitBonus,   ///< Passive: adds @c value to the attack bonus
    CritRange   ///< Passive: lowers the critical range to @c value
};

/// Conditions that must all hold for a triggered feature to fire.
///
/// Sneak Attack is { requiresAdvantage = true,
/// anyWeaponProperty = {"finesse", "ranged", "thrown"} }: advantage AND
/// at least one of the listed properties.
struct FeatureEligibility {
    bool requiresAdvantage = false;
    std::vector<std::string> anyWeaponProperty;

    [[nodiscard]] bool isSatisfied(bool hasAdvantage, const WeaponDefinition& weapon) const;
};

struct ClassFeature {
    std::string name;
    FeatureTrigger trigger = FeatureTrigger::Hit;
    FeatureEffectType effectType = FeatureEffectType::Damage;
    std::optional<std::string> dice;
    int value = 0;
    std::optional<FeatureEligibility> eligibility;
};

/// Static description of a character. Copyable and shareable.
struct CharacterDefinition {
    std::string name;
    std::string className;
    int level = 1;
    int proficiencyBonus = 2;
    std::vector<AttackModifier> attackModifiers;
    std::vector<DamageModifier> damageModifiers;
    std::vector<ClassFeature> features;
};

/// Read-only view of a character used during combat.
///
/// Derived numbers are computed once at construction; the instance is
/// immutable and may be shared across parallel combats.
class CharacterInstance {
public:
    /// InvalidCharacter for a level outside 1..20 or a crit range outside 2..20.
    static SimResult<CharacterInstance> create(CharacterDefinition definition);

    [[nodiscard]] const std::string& name() const noexcept { return definition_.name; }
    [[nodiscard]] const std::string& className() const noexcept { return definition_.className; }
    [[nodiscard]] int level() const noexcept { return definition_.level; }
    [[nodiscard]] int proficiencyBonus() const noexcept { return definition_.proficiencyBonus; }
    [[nodiscard]] const CharacterDefinition& definition() const noexcept { return definition_; }

    /// Sum of attack-modifier hit bonuses and HitBonus features.
    [[nodiscard]] int attackBonus() const noexcept { return attackBonus_; }

    /// Sum of Always damage modifiers.
    [[nodiscard]] int flatDamageBonus() const noexcept { return flatDamageBonus_; }

    /// Lowest natural d20 that is a critical; 20 unless widened.
    [[nodiscard]] int critRange() const noexcept { return critRange_; }

    /// Damage features fired by @p trigger, in definition order.
    [[nodiscard]] std::vector<const ClassFeature*> getTriggeredFeatures(FeatureTrigger trigger) const;

    /// Damage modifiers with the given trigger, in definition order.
    [[nodiscard]] std::vector<const DamageModifier*> getDamageModifiers(ModifierTrigger trigger) const;

    /// Lower-case class name used to pick class metrics trackers.
    [[nodiscard]] std::string trackerKey() const;

private:
    explicit CharacterInstance(CharacterDefinition definition);

    CharacterDefinition definition_;
    int attackBonus_ = 0;
    int flatDamageBonus_ = 0;
    int critRange_ = 20;
};

} // namespace wbs::model
