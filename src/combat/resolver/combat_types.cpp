/// @file combat_types.cpp
/// @brief Scenario validation and AttackResult effect helpers.

#include "wbs/combat/combat_types.hpp"

#include <algorithm>

#include "wbs/model/target_size.hpp"

namespace wbs::combat {

using foundation::ErrorCode;
using foundation::SimError;

namespace {

SimResult<void> invalid(const Scenario& scenario, const std::string& what) {
    return SimResult<void>::err(
        SimError(ErrorCode::InvalidScenario,
                 "scenario '" + scenario.name + "': " + what));
}

} // namespace

SimResult<void> Scenario::validate() const {
    if (rounds < 1) {
        return invalid(*this, "rounds must be at least 1");
    }
    if (attacksPerRound < 1) {
        return invalid(*this, "attacks_per_round must be at least 1");
    }
    if (advantageRate < 0.0 || advantageRate > 1.0) {
        return invalid(*this, "advantage_rate must be within [0, 1]");
    }
    if (targetHp && *targetHp < 1) {
        return invalid(*this, "target_hp must be positive");
    }
    if (targetSwitching && switchInterval < 1) {
        return invalid(*this, "switch_interval must be at least 1");
    }
    // Creatures that never bleed skip the size lookup entirely.
    if (!model::hasBleedImmunityMarker(targetSize)) {
        auto size = model::parseSizeClass(targetSize);
        if (!size) {
            return SimResult<void>::err(size.error());
        }
    }
    return SimResult<void>::ok();
}

void AttackResult::appendEffect(std::string_view name, int magnitude,
                                std::string_view category, bool triggered,
                                bool dealsDamage) {
    specialEffects.push_back(
        SpecialEffect{std::string(name), magnitude, std::string(category), triggered});
    if (dealsDamage) {
        totalDamage += magnitude;
    }
}

const SpecialEffect* AttackResult::findEffect(std::string_view name) const {
    auto it = std::find_if(specialEffects.begin(), specialEffects.end(),
                           [&](const SpecialEffect& e) { return e.name == name; });
    return it == specialEffects.end() ? nullptr : &*it;
}

std::size_t AttackResult::countEffects(std::string_view name) const {
    return static_cast<std::size_t>(
        std::count_if(specialEffects.begin(), specialEffects.end(),
                      [&](const SpecialEffect& e) { return e.name == name; }));
}

} // namespace wbs::combat
