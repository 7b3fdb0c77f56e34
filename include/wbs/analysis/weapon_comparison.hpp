#pragma once

/// @file weapon_comparison.hpp
/// @brief Weapon-versus-baseline balance comparison and ranking.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wbs/analysis/statistical_analyzer.hpp"

namespace wbs::analysis {

/// z for a two-sided 95% confidence interval.
inline constexpr double kConfidenceZ95 = 1.96;

/// |CV difference| below this counts as equally consistent.
inline constexpr double kConsistencyTolerance = 0.05;

enum class ConsistencyComparison : uint8_t { MoreConsistent, Similar, LessConsistent };

enum class BalanceRating : uint8_t { Underpowered, Balanced, Overpowered, SignificantlyOverpowered };

enum class RiskLevel : uint8_t { Low, Medium, High };

constexpr std::string_view consistencyComparisonName(ConsistencyComparison c) {
    switch (c) {
        case ConsistencyComparison::MoreConsistent: return "more-consistent";
        case ConsistencyComparison::Similar:        return "similar";
        case ConsistencyComparison::LessConsistent: return "less-consistent";
    }
    return "unknown";
}

constexpr std::string_view balanceRatingName(BalanceRating r) {
    switch (r) {
        case BalanceRating::Underpowered:             return "underpowered";
        case BalanceRating::Balanced:                 return "balanced";
        case BalanceRating::Overpowered:              return "overpowered";
        case BalanceRating::SignificantlyOverpowered: return "significantly-overpowered";
    }
    return "unknown";
}

constexpr std::string_view riskLevelName(RiskLevel r) {
    switch (r) {
        case RiskLevel::Low:    return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High:   return "high";
    }
    return "unknown";
}

struct ConfidenceInterval {
    double lower = 0.0;
    double upper = 0.0;
};

/// Hemorrhage contribution of the tested weapon relative to the baseline.
struct SpecialMechanicAdvantage {
    double triggerFrequency = 0.0;
    /// averageDamagePerTrigger * triggerFrequency.
    double damageContribution = 0.0;
    /// damageContribution as a percentage of the baseline mean.
    double advantagePercentage = 0.0;
};

struct BalanceAssessment {
    BalanceRating rating = BalanceRating::Balanced;
    RiskLevel risk = RiskLevel::Low;
    std::string recommendation;
};

struct PerformanceRanking {
    double percentile = 0.0;
    int rank = 0;
    int totalCompared = 1;
};

struct WeaponComparison {
    std::string weaponName;
    std::string baselineName;

    double meanDifference = 0.0;
    double percentageDifference = 0.0;
    ConfidenceInterval confidenceInterval;

    double coefficientOfVariationDifference = 0.0;
    double stabilityIndexDifference = 0.0;
    ConsistencyComparison consistency = ConsistencyComparison::Similar;

    std::optional<SpecialMechanicAdvantage> specialMechanic;
    BalanceAssessment balance;
    PerformanceRanking ranking;
};

/// Per-weapon aggregate across all of its comparisons.
struct OverallRanking {
    std::string weaponName;
    double averagePerformance = 0.0;
    double consistencyScore = 0.0;
    double balanceScore = 0.0;
    int overallRank = 0;
};

struct ComparisonSummary {
    std::vector<std::string> balancedWeapons;
    std::vector<std::string> overpoweredWeapons;
    std::vector<std::string> underpoweredWeapons;
    std::vector<std::string> recommendations;
};

struct ComparisonReport {
    std::vector<std::string> baselineWeapons;
    std::vector<WeaponComparison> comparisons;
    std::vector<OverallRanking> overallRankings;
    ComparisonSummary summary;
};

/// Compare a tested weapon's analysis against a baseline's.
///
/// The confidence interval uses pooled variance (v1 + v2) / 2 with
/// SE = sqrt(pooled * 2 / n), n being the tested sample size.
[[nodiscard]] WeaponComparison compareWeapons(std::string weaponName,
                                              const StatisticalAnalysis& weapon,
                                              std::string baselineName,
                                              const StatisticalAnalysis& baseline);

/// Rate balance on percentage difference plus hemorrhage advantage.
[[nodiscard]] BalanceAssessment assessBalance(
    double percentageDifference, const std::optional<SpecialMechanicAdvantage>& special);

/// Rank every comparison by percentage difference, best first.
void updatePerformanceRankings(std::vector<WeaponComparison>& comparisons);

/// Rankings, per-weapon aggregates and summary lists over @p comparisons.
[[nodiscard]] ComparisonReport buildComparisonReport(std::vector<WeaponComparison> comparisons);

} // namespace wbs::analysis
