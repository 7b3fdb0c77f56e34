#pragma once

/// @file advantage_scheduler.hpp
/// @brief Deterministic mapping from an advantage rate to the rounds that
///        receive advantage.
///
/// The schedule depends only on (totalRounds, rate), never on the random
/// stream, so two weapons compared under the same scenario see their
/// favorable rolls in the same rounds.

#include <string>
#include <vector>

namespace wbs::combat {

struct AdvantageStrategy {
    int totalRounds = 0;
    double rate = 0.0;
    /// Strictly increasing, each within [1, totalRounds].
    std::vector<int> advantageRounds;
    int advantageCount = 0;
};

/// Compute the schedule.
///
/// - rate <= 0 or totalRounds <= 0: no rounds.
/// - rate >= 1: every round.
/// - otherwise ceil(totalRounds * rate) rounds spaced by the integer
///   interval totalRounds / count, i.e. rounds interval, 2*interval, ...
///   (10 rounds at 0.25 gives 3, 6, 9).
[[nodiscard]] AdvantageStrategy computeStrategy(int totalRounds, double rate);

/// Membership test on the strategy's round set.
[[nodiscard]] bool hasAdvantage(int round, const AdvantageStrategy& strategy);

/// "3/10 rounds (30.0%): 3, 6, 9" style summary for logs.
[[nodiscard]] std::string describeStrategy(const AdvantageStrategy& strategy);

} // namespace wbs::combat
