/// @file dice_roller.cpp
/// @brief DiceRoller implementation.

#include "wbs/dice/dice_roller.hpp"

#include <algorithm>
#include <utility>

namespace wbs::dice {

DiceRoller::DiceRoller(uint64_t seed) : seed_(seed), engine_(seed) {}

int DiceRoller::rollDie(int sides) {
    auto fixed = overrides_.fixedRolls.find(sides);
    if (fixed != overrides_.fixedRolls.end() && !fixed->second.empty()) {
        int value = fixed->second.front();
        fixed->second.pop_front();
        return value;
    }
    if (overrides_.alwaysCrit && sides == 20) {
        return 20;
    }
    if (overrides_.alwaysMaxRoll) {
        return sides;
    }
    std::uniform_int_distribution<int> dist(1, sides);
    return dist(engine_);
}

DiceRoll DiceRoller::roll(const DiceExpression& expr) {
    DiceRoll out;
    out.dice.reserve(static_cast<std::size_t>(std::max(0, expr.count)));
    out.flatBonus = expr.flatBonus;
    out.total = expr.flatBonus;
    for (int i = 0; i < expr.count; ++i) {
        int value = rollDie(expr.sides);
        out.dice.push_back(value);
        out.total += value;
    }
    return out;
}

D20Roll DiceRoller::rollD20(bool advantage, bool disadvantage) {
    D20Roll out;
    out.first = rollDie(20);
    out.natural = out.first;
    if (advantage == disadvantage) {
        return out;
    }
    int second = rollDie(20);
    out.second = second;
    out.natural = advantage ? std::max(out.first, second) : std::min(out.first, second);
    return out;
}

void DiceRoller::setOverrides(DiceOverrides overrides) {
    overrides_ = std::move(overrides);
}

void DiceRoller::clearOverrides() {
    overrides_ = DiceOverrides{};
}

void DiceRoller::queueFixedRoll(int sides, int value) {
    overrides_.fixedRolls[sides].push_back(value);
}

uint64_t deriveStreamSeed(uint64_t batchSeed, uint64_t index) noexcept {
    uint64_t z = batchSeed + (index + 1) * 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

} // namespace wbs::dice
