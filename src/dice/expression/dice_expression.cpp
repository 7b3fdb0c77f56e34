/// @file dice_expression.cpp
/// @brief Dice expression parsing and formatting.

#include "wbs/dice/dice_expression.hpp"

#include <cctype>
#include <charconv>
#include <string>

namespace wbs::dice {

using foundation::ErrorCode;
using foundation::SimError;

namespace {

// Upper bound keeps count * sides well inside int even after crit doubling.
constexpr int kMaxDiceCount = 1000;

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool allDigits(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool toInt(std::string_view digits, int& out) {
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    return ec == std::errc() && ptr == digits.data() + digits.size();
}

SimResult<DiceExpression> malformed(std::string_view text, std::string_view reason) {
    return SimResult<DiceExpression>::err(
        SimError(ErrorCode::MalformedDiceExpression,
                 "malformed dice expression '" + std::string(text) + "': " + std::string(reason),
                 std::string(text)));
}

} // namespace

std::string DiceExpression::toString() const {
    std::string out = std::to_string(count) + "d" + std::to_string(sides);
    if (flatBonus > 0) {
        out += "+" + std::to_string(flatBonus);
    } else if (flatBonus < 0) {
        out += std::to_string(flatBonus);
    }
    return out;
}

SimResult<DiceExpression> parseDiceExpression(std::string_view text) {
    auto expr = trim(text);

    auto dPos = expr.find_first_of("dD");
    if (dPos == std::string_view::npos) {
        return malformed(text, "missing 'd'");
    }

    DiceExpression result;

    auto countPart = expr.substr(0, dPos);
    if (!countPart.empty()) {
        if (!allDigits(countPart) || !toInt(countPart, result.count)) {
            return malformed(text, "invalid dice count");
        }
        if (result.count <= 0 || result.count > kMaxDiceCount) {
            return malformed(text, "dice count out of range");
        }
    }

    auto rest = expr.substr(dPos + 1);
    auto signPos = rest.find_first_of("+-");
    auto sidesPart = rest.substr(0, signPos);
    if (!allDigits(sidesPart) || !toInt(sidesPart, result.sides)) {
        return malformed(text, "invalid die size");
    }

    if (signPos != std::string_view::npos) {
        auto bonusPart = rest.substr(signPos + 1);
        int magnitude = 0;
        if (!allDigits(bonusPart) || !toInt(bonusPart, magnitude)) {
            return malformed(text, "invalid flat bonus");
        }
        result.flatBonus = rest[signPos] == '-' ? -magnitude : magnitude;
    }

    if (!isSupportedDieSize(result.sides)) {
        return SimResult<DiceExpression>::err(
            SimError(ErrorCode::UnsupportedDieSize,
                     "unsupported die size d" + std::to_string(result.sides) +
                         " in '" + std::string(text) + "'",
                     std::string(text)));
    }

    return SimResult<DiceExpression>::ok(result);
}

} // namespace wbs::dice
