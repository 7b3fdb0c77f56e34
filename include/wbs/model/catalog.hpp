#pragma once

/// @file catalog.hpp
/// @brief Built-in weapon definitions: level-banded baselines and sample
///        mechanic weapons.

#include <string_view>
#include <vector>

#include "wbs/model/weapon.hpp"

namespace wbs::model {

/// A mundane reference weapon and the character levels it represents.
struct BaselineTemplate {
    WeaponDefinition weapon;
    int minLevel = 1;
    int maxLevel = 20;

    [[nodiscard]] bool covers(int level) const noexcept {
        return level >= minLevel && level <= maxLevel;
    }
};

/// Every baseline in catalog order.
[[nodiscard]] const std::vector<BaselineTemplate>& baselineTemplates();

/// Baselines whose level range contains @p level, in catalog order.
[[nodiscard]] std::vector<WeaponDefinition> baselinesForLevel(int level);

/// Very rare +1 messer: 1d8 slashing, finesse and versatile, with bleed and
/// Reaver's Feast (temporary HP equal to hemorrhage damage).
[[nodiscard]] WeaponDefinition sanguineMesser();

/// Look up a built-in weapon (sample or baseline) by case-insensitive name.
/// NotFound when no entry matches.
[[nodiscard]] SimResult<WeaponDefinition> findCatalogWeapon(std::string_view name);

} // namespace wbs::model
