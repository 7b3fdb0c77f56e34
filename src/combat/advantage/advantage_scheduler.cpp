/// @file advantage_scheduler.cpp
/// @brief Evenly spaced advantage rounds for a combat.

#include "wbs/combat/advantage_scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace wbs::combat {

namespace {

std::vector<int> allRounds(int totalRounds) {
    std::vector<int> rounds(static_cast<std::size_t>(totalRounds));
    for (int i = 0; i < totalRounds; ++i) {
        rounds[static_cast<std::size_t>(i)] = i + 1;
    }
    return rounds;
}

} // namespace

AdvantageStrategy computeStrategy(int totalRounds, double rate) {
    AdvantageStrategy strategy;
    strategy.totalRounds = totalRounds;
    strategy.rate = rate;

    if (rate <= 0.0 || totalRounds <= 0) {
        return strategy;
    }
    if (rate >= 1.0) {
        strategy.advantageRounds = allRounds(totalRounds);
        strategy.advantageCount = totalRounds;
        return strategy;
    }

    int count = static_cast<int>(std::ceil(totalRounds * rate));
    count = std::clamp(count, 1, totalRounds);

    if (count >= totalRounds) {
        strategy.advantageRounds = allRounds(totalRounds);
    } else {
        // Gaps are q or q+1; the remainder is spread over the schedule
        // instead of piling up after the last advantage round.
        const int q = totalRounds / count;
        const int r = totalRounds % count;
        strategy.advantageRounds.reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i) {
            strategy.advantageRounds.push_back((i + 1) * q + (i * r) / count);
        }
    }
    strategy.advantageCount = count;
    return strategy;
}

bool hasAdvantage(int round, const AdvantageStrategy& strategy) {
    return std::binary_search(strategy.advantageRounds.begin(),
                              strategy.advantageRounds.end(), round);
}

std::string describeStrategy(const AdvantageStrategy& strategy) {
    char head[64];
    double pct = strategy.totalRounds > 0
        ? 100.0 * strategy.advantageCount / strategy.totalRounds
        : 0.0;
    std::snprintf(head, sizeof(head), "%d/%d rounds (%.1f%%)",
                  strategy.advantageCount, strategy.totalRounds, pct);

    std::string out(head);
    if (!strategy.advantageRounds.empty()) {
        out += ": ";
        for (std::size_t i = 0; i < strategy.advantageRounds.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += std::to_string(strategy.advantageRounds[i]);
        }
    }
    return out;
}

} // namespace wbs::combat
