#pragma once

/// @file statistical_analyzer.hpp
/// @brief Distribution statistics over a batch of combat results.

#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

#include "wbs/combat/combat_orchestrator.hpp"
#include "wbs/foundation/sim_result.hpp"

namespace wbs::analysis {

using foundation::SimResult;

struct Percentiles {
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
};

struct DamageStatistics {
    double mean = 0.0;
    double median = 0.0;
    /// Population variance (divided by N).
    double variance = 0.0;
    double standardDeviation = 0.0;
    double min = 0.0;
    double max = 0.0;
    double range = 0.0;
    Percentiles percentiles;
    double interquartileRange = 0.0;
    /// stddev / mean, or 0 when the mean is not positive.
    double coefficientOfVariation = 0.0;
};

/// Consistency classes by coefficient of variation. Ordered: a larger
/// value is never a better rating.
enum class ConsistencyRating : uint8_t {
    VeryConsistent,     ///< CV < 0.1
    Consistent,         ///< CV < 0.2
    Moderate,           ///< CV < 0.4
    Inconsistent,       ///< CV < 0.6
    VeryInconsistent    ///< otherwise
};

constexpr std::string_view consistencyRatingName(ConsistencyRating rating) {
    switch (rating) {
        case ConsistencyRating::VeryConsistent:   return "very-consistent";
        case ConsistencyRating::Consistent:       return "consistent";
        case ConsistencyRating::Moderate:         return "moderate";
        case ConsistencyRating::Inconsistent:     return "inconsistent";
        case ConsistencyRating::VeryInconsistent: return "very-inconsistent";
    }
    return "unknown";
}

struct ConsistencyMetrics {
    double coefficientOfVariation = 0.0;
    /// CV expressed in percent.
    double relativeStandardDeviation = 0.0;
    ConsistencyRating rating = ConsistencyRating::VeryConsistent;
    /// Values more than two standard deviations from the mean.
    int outlierCount = 0;
    double outlierPercentage = 0.0;
    /// 1 / (1 + CV), capped at 1.
    double stabilityIndex = 1.0;
};

/// Present only when at least one combat recorded a hemorrhage.
struct HemorrhageStatistics {
    /// Total triggers / combats.
    double triggerFrequency = 0.0;
    /// Combats with a trigger / combats.
    double triggerRate = 0.0;
    /// Mean attack ordinal of the first trigger, over triggering combats only.
    double averageTurnsToTrigger = 0.0;
    double averageDamagePerTrigger = 0.0;
    int64_t totalHemorrhageDamage = 0;
    int maxTriggersInSingleCombat = 0;
    /// Triggers in one combat -> number of combats with that count.
    std::map<int, int> triggerDistribution;
};

struct StatisticalAnalysis {
    std::size_t sampleSize = 0;
    DamageStatistics damageStats;
    ConsistencyMetrics consistencyMetrics;
    std::optional<HemorrhageStatistics> hemorrhageStats;
};

enum class OverallAssessment : uint8_t {
    SignificantlyBetter,
    Better,
    Similar,
    Worse,
    SignificantlyWorse
};

constexpr std::string_view overallAssessmentName(OverallAssessment assessment) {
    switch (assessment) {
        case OverallAssessment::SignificantlyBetter: return "significantly-better";
        case OverallAssessment::Better:              return "better";
        case OverallAssessment::Similar:             return "similar";
        case OverallAssessment::Worse:               return "worse";
        case OverallAssessment::SignificantlyWorse:  return "significantly-worse";
    }
    return "unknown";
}

struct HemorrhageComparison {
    double triggerFrequencyDifference = 0.0;
    double triggerRateDifference = 0.0;
    double averageDamageDifference = 0.0;
};

/// First analysis minus second.
struct AnalysisComparison {
    double meanDifference = 0.0;
    /// Relative to the second mean; 0 when that mean is not positive.
    double meanPercentageDifference = 0.0;
    double coefficientOfVariationDifference = 0.0;
    double stabilityDifference = 0.0;
    /// Set only when both sides carry hemorrhage statistics.
    std::optional<HemorrhageComparison> hemorrhage;
    OverallAssessment overallAssessment = OverallAssessment::Similar;
};

class StatisticalAnalyzer {
public:
    /// EmptyInput when @p results is empty.
    [[nodiscard]] static SimResult<StatisticalAnalysis> analyze(
        const std::vector<combat::CombatResult>& results);

    /// Damage and consistency statistics of raw per-combat totals.
    /// EmptyInput when @p values is empty.
    [[nodiscard]] static SimResult<DamageStatistics> describe(const std::vector<double>& values);

    [[nodiscard]] static ConsistencyMetrics consistency(const std::vector<double>& values,
                                                        const DamageStatistics& stats);

    [[nodiscard]] static ConsistencyRating rateConsistency(double coefficientOfVariation) noexcept;

    /// Linear interpolation at index p * (n - 1) of an ascending array.
    [[nodiscard]] static double percentile(const std::vector<double>& sorted, double p);

    [[nodiscard]] static AnalysisComparison compare(const StatisticalAnalysis& first,
                                                    const StatisticalAnalysis& second);
};

} // namespace wbs::analysis
