#pragma once

/// @file dice_expression.hpp
/// @brief The single "NdM+K" parser shared by weapon dice, class features,
///        bleed counters and hemorrhage procs.

#include <array>
#include <string>
#include <string_view>

#include "wbs/foundation/sim_result.hpp"

namespace wbs::dice {

using foundation::SimResult;

/// Die sizes a dice expression may name.
inline constexpr std::array<int, 6> kSupportedDieSizes = {4, 6, 8, 10, 12, 20};

[[nodiscard]] constexpr bool isSupportedDieSize(int sides) noexcept {
    for (int s : kSupportedDieSizes) {
        if (s == sides) {
            return true;
        }
    }
    return false;
}

/// A parsed dice term: count x d(sides), plus a flat bonus.
struct DiceExpression {
    int count = 1;
    int sides = 6;
    int flatBonus = 0;

    [[nodiscard]] constexpr int minimum() const noexcept { return count + flatBonus; }
    [[nodiscard]] constexpr int maximum() const noexcept { return count * sides + flatBonus; }

    /// Canonical form, e.g. "2d6+1", "1d8", "3d4-2".
    [[nodiscard]] std::string toString() const;

    friend constexpr bool operator==(const DiceExpression&, const DiceExpression&) = default;
};

/// Parse "[N]dM[+K|-K]". Whitespace around the expression is ignored and
/// the 'd' is case-insensitive. N defaults to 1 and must be positive.
///
/// @return MalformedDiceExpression for syntax errors,
///         UnsupportedDieSize when M is not a standard die.
[[nodiscard]] SimResult<DiceExpression> parseDiceExpression(std::string_view text);

/// Critical-hit policy: the die count doubles, the flat bonus does not.
[[nodiscard]] constexpr DiceExpression criticalAdjust(DiceExpression expr, bool isCritical) noexcept {
    if (isCritical) {
        expr.count *= 2;
    }
    return expr;
}

/// Convenience constructor for "<count>d<sides>".
[[nodiscard]] constexpr DiceExpression makeDice(int count, int sides, int flatBonus = 0) noexcept {
    return DiceExpression{count, sides, flatBonus};
}

} // namespace wbs::dice
