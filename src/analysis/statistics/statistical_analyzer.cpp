/// @file statistical_analyzer.cpp
/// @brief StatisticalAnalyzer implementation.

#include "wbs/analysis/statistical_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <utility>

#include "wbs/foundation/sim_logger.hpp"

namespace wbs::analysis {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SimError;

namespace {

constexpr double kOutlierSigmas = 2.0;

std::optional<HemorrhageStatistics> hemorrhageStatistics(
    const std::vector<combat::CombatResult>& results)
{
    const bool any = std::any_of(results.begin(), results.end(),
                                 [](const auto& r) { return r.hemorrhageTriggers > 0; });
    if (!any) {
        return std::nullopt;
    }

    HemorrhageStatistics stats;
    int64_t totalTriggers = 0;
    int combatsWithTriggers = 0;
    int64_t turnsSum = 0;
    int turnsCount = 0;

    for (const auto& r : results) {
        totalTriggers += r.hemorrhageTriggers;
        stats.totalHemorrhageDamage += r.hemorrhageDamage;
        stats.maxTriggersInSingleCombat = std::max(stats.maxTriggersInSingleCombat, r.hemorrhageTriggers);
        ++stats.triggerDistribution[r.hemorrhageTriggers];
        if (r.hemorrhageTriggers > 0) {
            ++combatsWithTriggers;
            if (r.turnsToFirstTrigger) {
                turnsSum += *r.turnsToFirstTrigger;
                ++turnsCount;
            }
        }
    }

    const auto n = static_cast<double>(results.size());
    stats.triggerFrequency = static_cast<double>(totalTriggers) / n;
    stats.triggerRate = combatsWithTriggers / n;
    stats.averageTurnsToTrigger =
        turnsCount > 0 ? static_cast<double>(turnsSum) / turnsCount : 0.0;
    stats.averageDamagePerTrigger =
        static_cast<double>(stats.totalHemorrhageDamage) / static_cast<double>(totalTriggers);
    return stats;
}

} // namespace

double StatisticalAnalyzer::percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }
    const double index = p * static_cast<double>(sorted.size() - 1);
    const auto lower = static_cast<std::size_t>(std::floor(index));
    const auto upper = static_cast<std::size_t>(std::ceil(index));
    if (lower == upper) {
        return sorted[lower];
    }
    const double weight = index - static_cast<double>(lower);
    return sorted[lower] * (1.0 - weight) + sorted[upper] * weight;
}

ConsistencyRating StatisticalAnalyzer::rateConsistency(double cv) noexcept {
    if (cv < 0.1) {
        return ConsistencyRating::VeryConsistent;
    }
    if (cv < 0.2) {
        return ConsistencyRating::Consistent;
    }
    if (cv < 0.4) {
        return ConsistencyRating::Moderate;
    }
    if (cv < 0.6) {
        return ConsistencyRating::Inconsistent;
    }
    return ConsistencyRating::VeryInconsistent;
}

SimResult<DamageStatistics> StatisticalAnalyzer::describe(const std::vector<double>& values) {
    if (values.empty()) {
        return SimResult<DamageStatistics>::err(
            SimError(ErrorCode::EmptyInput, "cannot describe an empty sample"));
    }

    std::vector<double> sorted(values);
    std::sort(sorted.begin(), sorted.end());

    const auto n = static_cast<double>(sorted.size());
    DamageStatistics s;
    s.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / n;
    double squares = 0.0;
    for (double v : sorted) {
        squares += (v - s.mean) * (v - s.mean);
    }
    s.variance = squares / n;
    s.standardDeviation = std::sqrt(s.variance);
    s.min = sorted.front();
    s.max = sorted.back();
    s.range = s.max - s.min;

    s.percentiles.p25 = percentile(sorted, 0.25);
    s.percentiles.p50 = percentile(sorted, 0.50);
    s.percentiles.p75 = percentile(sorted, 0.75);
    s.percentiles.p90 = percentile(sorted, 0.90);
    s.percentiles.p95 = percentile(sorted, 0.95);
    s.percentiles.p99 = percentile(sorted, 0.99);
    s.median = s.percentiles.p50;
    s.interquartileRange = s.percentiles.p75 - s.percentiles.p25;
    s.coefficientOfVariation = s.mean > 0.0 ? s.standardDeviation / s.mean : 0.0;
    return SimResult<DamageStatistics>::ok(s);
}

ConsistencyMetrics StatisticalAnalyzer::consistency(const std::vector<double>& values,
                                                    const DamageStatistics& stats) {
    ConsistencyMetrics c;
    c.coefficientOfVariation = stats.coefficientOfVariation;
    c.relativeStandardDeviation = stats.coefficientOfVariation * 100.0;
    c.rating = rateConsistency(stats.coefficientOfVariation);
    c.stabilityIndex = std::min(1.0, 1.0 / (1.0 + stats.coefficientOfVariation));

    const double limit = kOutlierSigmas * stats.standardDeviation;
    c.outlierCount = static_cast<int>(std::count_if(
        values.begin(), values.end(),
        [&](double v) { return std::abs(v - stats.mean) > limit; }));
    if (!values.empty()) {
        c.outlierPercentage = 100.0 * c.outlierCount / static_cast<double>(values.size());
    }
    return c;
}

SimResult<StatisticalAnalysis> StatisticalAnalyzer::analyze(
    const std::vector<combat::CombatResult>& results)
{
    if (results.empty()) {
        return SimResult<StatisticalAnalysis>::err(
            SimError(ErrorCode::EmptyInput, "cannot analyze zero combat results"));
    }

    std::vector<double> damages;
    damages.reserve(results.size());
    for (const auto& r : results) {
        damages.push_back(static_cast<double>(r.totalDamage));
    }

    auto stats = describe(damages);
    if (!stats) {
        return SimResult<StatisticalAnalysis>::err(stats.error());
    }

    StatisticalAnalysis analysis;
    analysis.sampleSize = results.size();
    analysis.damageStats = stats.value();
    analysis.consistencyMetrics = consistency(damages, analysis.damageStats);
    analysis.hemorrhageStats = hemorrhageStatistics(results);

    WBS_LOG_DEBUG(LogCategory::Analysis,
                  "Analyzed " + std::to_string(results.size()) + " combats, mean " +
                      std::to_string(analysis.damageStats.mean) + ", " +
                      std::string(consistencyRatingName(analysis.consistencyMetrics.rating)));

    return SimResult<StatisticalAnalysis>::ok(std::move(analysis));
}

AnalysisComparison StatisticalAnalyzer::compare(const StatisticalAnalysis& first,
                                                const StatisticalAnalysis& second) {
    AnalysisComparison c;
    const double a = first.damageStats.mean;
    const double b = second.damageStats.mean;
    c.meanDifference = a - b;
    c.meanPercentageDifference = b > 0.0 ? (a - b) / b * 100.0 : 0.0;
    c.coefficientOfVariationDifference =
        first.consistencyMetrics.coefficientOfVariation - second.consistencyMetrics.coefficientOfVariation;
    c.stabilityDifference =
        first.consistencyMetrics.stabilityIndex - second.consistencyMetrics.stabilityIndex;

    if (first.hemorrhageStats && second.hemorrhageStats) {
        c.hemorrhage = HemorrhageComparison{
            first.hemorrhageStats->triggerFrequency - second.hemorrhageStats->triggerFrequency,
            first.hemorrhageStats->triggerRate - second.hemorrhageStats->triggerRate,
            first.hemorrhageStats->averageDamagePerTrigger - second.hemorrhageStats->averageDamagePerTrigger,
        };
    }

    const double magnitude = std::abs(c.meanPercentageDifference);
    const bool ahead = c.meanPercentageDifference > 0.0;
    if (magnitude < 5.0) {
        c.overallAssessment = OverallAssessment::Similar;
    } else if (magnitude < 15.0) {
        c.overallAssessment = ahead ? OverallAssessment::Better : OverallAssessment::Worse;
    } else {
        c.overallAssessment = ahead ? OverallAssessment::SignificantlyBetter
                                    : OverallAssessment::SignificantlyWorse;
    }
    return c;
}

} // namespace wbs::analysis
