#pragma once

/// @file combat_types.hpp
/// @brief Value types exchanged between the combat orchestrator, the attack
///        resolver, status effects and metrics trackers.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wbs/foundation/sim_result.hpp"

namespace wbs::model {
class CharacterInstance;
class WeaponInstance;
} // namespace wbs::model

namespace wbs::combat {

using foundation::SimResult;

/// Names of effects that trackers and analyzers look up by string.
namespace effect_names {
inline constexpr std::string_view kBleedCounter = "Bleed Counter";
inline constexpr std::string_view kHemorrhage = "Hemorrhage";
inline constexpr std::string_view kBleedImmunity = "Bleed Immunity";
inline constexpr std::string_view kSneakAttack = "Sneak Attack";
inline constexpr std::string_view kCriticalSuffix = " (Critical)";
inline constexpr std::string_view kHemorrhageSuffix = " (Hemorrhage)";
} // namespace effect_names

/// Effect categories.
namespace effect_categories {
inline constexpr std::string_view kCounter = "counter";
inline constexpr std::string_view kNecrotic = "necrotic";
inline constexpr std::string_view kImmunity = "immunity";
inline constexpr std::string_view kTempHp = "temp_hp";
inline constexpr std::string_view kModifier = "modifier";
inline constexpr std::string_view kClassFeature = "class_feature";
} // namespace effect_categories

/// One entry of AttackResult::specialEffects.
struct SpecialEffect {
    std::string name;
    int magnitude = 0;
    std::string category;
    bool triggered = false;
};

/// Encounter parameters shared by every combat of a batch.
struct Scenario {
    static constexpr int kDefaultTargetHp = 100;
    static constexpr int kDefaultSwitchInterval = 5;

    std::string name = "default";
    int rounds = 10;
    int targetArmorClass = 15;
    std::string targetSize = "medium";
    double advantageRate = 0.0;
    int attacksPerRound = 1;
    std::optional<int> targetHp;
    bool bleedImmune = false;
    bool targetSwitching = false;
    int switchInterval = kDefaultSwitchInterval;

    [[nodiscard]] int effectiveTargetHp() const noexcept {
        return targetHp.value_or(kDefaultTargetHp);
    }

    /// InvalidScenario for out-of-range numbers, UnknownSizeClass for an
    /// unrecognized size unless the size string marks an immune creature.
    [[nodiscard]] SimResult<void> validate() const;
};

/// Input to a single attack. Built fresh by the orchestrator per attack.
///
/// The weapon is non-const because resolving a hit advances its status
/// effects (bleed counter).
struct AttackContext {
    const model::CharacterInstance* attacker = nullptr;
    model::WeaponInstance* weapon = nullptr;
    /// Explicit advantage; when unset the resolver consults the schedule.
    std::optional<bool> hasAdvantage;
    bool hasDisadvantage = false;
    int targetArmorClass = 10;
    std::string targetSize = "medium";
    bool bleedImmune = false;
    int round = 1;
    int attackIndex = 0;
    const Scenario* scenario = nullptr;
};

/// Outcome of one attack. Damage totals and the effect list only grow
/// while status effects and character modifiers are applied.
struct AttackResult {
    bool hit = false;
    bool critical = false;
    bool hadAdvantage = false;
    int naturalRoll = 0;
    int attackTotal = 0;
    int baseDamage = 0;
    /// Portion of baseDamage that came from the extra critical dice.
    int critDamage = 0;
    int bonusDamage = 0;
    int totalDamage = 0;
    std::vector<SpecialEffect> specialEffects;
    bool hemorrhageTriggered = false;
    int hemorrhageDamage = 0;
    int tempHpGained = 0;
    int wastedDamage = 0;
    bool targetSwitched = false;
    int round = 0;
    int attackIndex = 0;

    /// Append an effect and add its magnitude to totalDamage when it deals damage.
    void appendEffect(std::string_view name, int magnitude, std::string_view category,
                      bool triggered, bool dealsDamage);

    /// First effect with @p name, or nullptr.
    [[nodiscard]] const SpecialEffect* findEffect(std::string_view name) const;

    /// Number of effects named @p name.
    [[nodiscard]] std::size_t countEffects(std::string_view name) const;
};

} // namespace wbs::combat
