#pragma once

/// @file status_effect.hpp
/// @brief Interface for stateful weapon effects applied on every hit.

#include <string_view>

#include "wbs/combat/combat_types.hpp"

namespace wbs::dice {
class DiceRoller;
} // namespace wbs::dice

namespace wbs::combat {

/// A status effect owned by exactly one weapon instance.
///
/// Effects run in definition order after base damage is rolled, so a later
/// effect may react to what an earlier one recorded on the result.
class IStatusEffect {
public:
    virtual ~IStatusEffect() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Mechanic type string ("bleed", "healing") used for tracker lookup.
    [[nodiscard]] virtual std::string_view mechanicType() const = 0;

    /// Apply the effect to a resolved hit. Misses are never passed in.
    virtual SimResult<void> applyOnHit(const AttackContext& ctx, AttackResult& result,
                                       dice::DiceRoller& roller) = 0;

    /// The simulated target changed; drop any per-target state.
    virtual void switchTarget() = 0;
};

} // namespace wbs::combat
