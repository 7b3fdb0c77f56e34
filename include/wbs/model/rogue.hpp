#pragma once

/// @file rogue.hpp
/// @brief Rogue level progression and a ready-made Rogue character.

#include "wbs/model/character.hpp"
#include "wbs/dice/dice_expression.hpp"

namespace wbs::model {

inline constexpr int kMinCharacterLevel = 1;
inline constexpr int kMaxCharacterLevel = 20;

/// Proficiency bonus by level: +2 at 1-4, rising by one every four levels.
[[nodiscard]] constexpr int rogueProficiencyBonus(int level) noexcept {
    if (level < kMinCharacterLevel) {
        level = kMinCharacterLevel;
    }
    if (level > kMaxCharacterLevel) {
        level = kMaxCharacterLevel;
    }
    return 2 + (level - 1) / 4;
}

/// Sneak Attack dice: ceil(level / 2) d6.
[[nodiscard]] constexpr dice::DiceExpression sneakAttackDice(int level) noexcept {
    return dice::makeDice((level + 1) / 2, 6);
}

/// The Sneak Attack feature for @p level: fires on a hit made with
/// advantage using a finesse, ranged or thrown weapon.
[[nodiscard]] ClassFeature makeSneakAttackFeature(int level);

/// A Rogue of @p level with the given Dexterity modifier applied to hit and
/// damage, plus proficiency to hit and Sneak Attack.
///
/// InvalidCharacter when @p level is outside 1..20.
[[nodiscard]] SimResult<CharacterInstance> makeRogue(int level, int dexterityModifier = 4);

} // namespace wbs::model
