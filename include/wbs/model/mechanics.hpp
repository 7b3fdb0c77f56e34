#pragma once

/// @file mechanics.hpp
/// @brief Declarative parameters of weapon special mechanics.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "wbs/model/target_size.hpp"

namespace wbs::model {

/// Mechanic kinds a weapon definition may carry. The string form selects
/// the matching metrics tracker.
enum class MechanicType : uint8_t {
    Bleed,
    Healing
};

constexpr std::string_view mechanicTypeName(MechanicType type) {
    switch (type) {
        case MechanicType::Bleed:   return "bleed";
        case MechanicType::Healing: return "healing";
    }
    return "unknown";
}

/// Bleed counter value at which a hemorrhage procs, per size class.
using SizeThresholds = std::array<int, kSizeClassCount>;

inline constexpr SizeThresholds kDefaultBleedThresholds = {
    12,  // tiny
    12,  // small
    12,  // medium
    16,  // large
    20,  // huge
    24   // gargantuan
};

/// Parameters of the bleed/hemorrhage status effect.
struct BleedParameters {
    std::string normalCounterDice = "1d4";
    std::string advantageCounterDice = "1d8";
    bool criticalDoublesCounter = true;
    SizeThresholds thresholds = kDefaultBleedThresholds;
    /// Hemorrhage deals (hemorrhageBaseDice + proficiency)d6.
    int hemorrhageBaseDice = 3;
};

/// What a healing mechanic reacts to.
enum class HealingTrigger : uint8_t {
    Hit,
    Critical,
    Hemorrhage
};

/// Parameters of a temporary-HP granting mechanic.
struct HealingParameters {
    HealingTrigger trigger = HealingTrigger::Hemorrhage;
    /// A dice expression, or empty to mirror the hemorrhage damage dealt.
    std::string tempHpDice;
};

struct MechanicDefinition {
    std::string name;
    MechanicType type = MechanicType::Bleed;
    BleedParameters bleed;
    HealingParameters healing;
};

} // namespace wbs::model
