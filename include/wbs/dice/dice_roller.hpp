#pragma once

/// @file dice_roller.hpp
/// @brief Seeded random stream for all dice rolls of one combat.

#include <cstdint>
#include <deque>
#include <optional>
#include <random>
#include <unordered_map>
#include <vector>

#include "wbs/dice/dice_expression.hpp"

namespace wbs::dice {

/// Deterministic roll controls used by tests and what-if runs.
///
/// Precedence: a queued fixed roll for the die size, then alwaysCrit (d20
/// only), then alwaysMaxRoll, then the random stream.
struct DiceOverrides {
    bool alwaysMaxRoll = false;
    bool alwaysCrit = false;
    std::unordered_map<int, std::deque<int>> fixedRolls;
};

/// Outcome of rolling a DiceExpression.
struct DiceRoll {
    std::vector<int> dice;
    int flatBonus = 0;
    int total = 0;

    [[nodiscard]] int diceTotal() const noexcept { return total - flatBonus; }
};

/// Outcome of an attack roll. @c second is set when two d20s were rolled.
struct D20Roll {
    int natural = 1;
    int first = 1;
    std::optional<int> second;
};

/// Random stream owned by exactly one combat at a time.
///
/// Not thread-safe: parallel batches give every combat its own roller seeded
/// with deriveStreamSeed(batchSeed, combatIndex).
class DiceRoller {
public:
    explicit DiceRoller(uint64_t seed);

    /// Roll one die with @p sides faces, 1..sides.
    int rollDie(int sides);

    /// Roll every die of @p expr and add its flat bonus.
    DiceRoll roll(const DiceExpression& expr);

    /// Roll an attack die. Advantage keeps the higher of two d20s,
    /// disadvantage the lower; both together cancel to a single roll.
    D20Roll rollD20(bool advantage, bool disadvantage = false);

    void setOverrides(DiceOverrides overrides);
    void clearOverrides();

    /// Queue @p value as the next result for a die with @p sides faces.
    void queueFixedRoll(int sides, int value);

    [[nodiscard]] const DiceOverrides& overrides() const noexcept { return overrides_; }
    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
    DiceOverrides overrides_;
};

/// SplitMix64 mix of (batchSeed, index): an independent, reproducible
/// stream seed per combat.
[[nodiscard]] uint64_t deriveStreamSeed(uint64_t batchSeed, uint64_t index) noexcept;

} // namespace wbs::dice
