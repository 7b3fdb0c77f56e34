/// @file catalog.cpp
/// @brief Built-in baseline and sample weapons.

#include "wbs/model/catalog.hpp"

#include <string>
#include <utility>

#include "wbs/model/target_size.hpp"

namespace wbs::model {

using foundation::ErrorCode;
using foundation::SimError;

namespace {

const char* rarityFor(int magicBonus) {
    switch (magicBonus) {
        case 0:  return "common";
        case 1:  return "uncommon";
        case 2:  return "rare";
        default: return "very-rare";
    }
}

BaselineTemplate baseline(std::string name, int magicBonus, std::string dice,
                          std::string damageType, std::vector<std::string> properties,
                          int minLevel, int maxLevel) {
    BaselineTemplate t;
    t.weapon.name = std::move(name);
    t.weapon.rarity = rarityFor(magicBonus);
    t.weapon.baseDamage = std::move(dice);
    t.weapon.damageType = std::move(damageType);
    t.weapon.properties = std::move(properties);
    t.weapon.magicBonus = magicBonus;
    t.minLevel = minLevel;
    t.maxLevel = maxLevel;
    return t;
}

} // namespace

const std::vector<BaselineTemplate>& baselineTemplates() {
    static const std::vector<BaselineTemplate> templates = {
        baseline("Baseline Rapier",       0, "1d8", "piercing", {"finesse"},          1,  4),
        baseline("Baseline Rapier +1",    1, "1d8", "piercing", {"finesse"},          5,  7),
        baseline("Baseline Rapier +2",    2, "1d8", "piercing", {"finesse"},          8, 10),
        baseline("Baseline Rapier +3",    3, "1d8", "piercing", {"finesse"},         11, 20),
        baseline("Baseline Longsword +1", 1, "1d8", "slashing", {"versatile"},        5,  7),
        baseline("Baseline Longsword +2", 2, "1d8", "slashing", {"versatile"},        8, 10),
        baseline("Baseline Scimitar +1",  1, "1d6", "slashing", {"finesse", "light"}, 5,  7),
        baseline("Baseline Scimitar +2",  2, "1d6", "slashing", {"finesse", "light"}, 8, 10),
    };
    return templates;
}

std::vector<WeaponDefinition> baselinesForLevel(int level) {
    std::vector<WeaponDefinition> out;
    for (const auto& t : baselineTemplates()) {
        if (t.covers(level)) {
            out.push_back(t.weapon);
        }
    }
    return out;
}

WeaponDefinition sanguineMesser() {
    WeaponDefinition def;
    def.name = "Sanguine Messer";
    def.rarity = "very-rare";
    def.baseDamage = "1d8";
    def.damageType = "slashing";
    def.properties = {"finesse", "versatile"};
    def.magicBonus = 1;

    MechanicDefinition bleed;
    bleed.name = "Hemorrhage";
    bleed.type = MechanicType::Bleed;
    def.mechanics.push_back(bleed);

    MechanicDefinition feast;
    feast.name = "Reaver's Feast";
    feast.type = MechanicType::Healing;
    feast.healing.trigger = HealingTrigger::Hemorrhage;
    def.mechanics.push_back(feast);

    return def;
}

SimResult<WeaponDefinition> findCatalogWeapon(std::string_view name) {
    const std::string wanted = toLower(name);

    auto messer = sanguineMesser();
    if (toLower(messer.name) == wanted) {
        return SimResult<WeaponDefinition>::ok(std::move(messer));
    }
    for (const auto& t : baselineTemplates()) {
        if (toLower(t.weapon.name) == wanted) {
            return SimResult<WeaponDefinition>::ok(t.weapon);
        }
    }
    return SimResult<WeaponDefinition>::err(
        SimError(ErrorCode::NotFound, "no catalog weapon named '" + std::string(name) + "'",
                 std::string(name)));
}

} // namespace wbs::model
