/// @file weapon_comparison.cpp
/// @brief Weapon-versus-baseline comparison, balance rating and ranking.

#include "wbs/analysis/weapon_comparison.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <utility>

namespace wbs::analysis {

namespace {

// Preference order when aggregating: balanced first, runaway weapons last.
double balanceScore(BalanceRating rating) {
    switch (rating) {
        case BalanceRating::Balanced:                 return 3.0;
        case BalanceRating::Overpowered:              return 2.0;
        case BalanceRating::Underpowered:             return 1.0;
        case BalanceRating::SignificantlyOverpowered: return 0.0;
    }
    return 1.0;
}

void addUnique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

} // namespace

BalanceAssessment assessBalance(double percentageDifference,
                                const std::optional<SpecialMechanicAdvantage>& special) {
    const double total = percentageDifference + (special ? special->advantagePercentage : 0.0);

    if (total < -15.0) {
        return {BalanceRating::Underpowered, RiskLevel::Medium,
                "Consider increasing base damage or improving special mechanics"};
    }
    if (total < -5.0) {
        return {BalanceRating::Underpowered, RiskLevel::Low,
                "Minor improvements needed to reach baseline performance"};
    }
    if (total <= 15.0) {
        return {BalanceRating::Balanced, RiskLevel::Low,
                "Weapon performance is within acceptable range"};
    }
    if (total <= 30.0) {
        return {BalanceRating::Overpowered, RiskLevel::Medium,
                "Consider reducing damage or special mechanic frequency"};
    }
    return {BalanceRating::SignificantlyOverpowered, RiskLevel::High,
            "Significant rebalancing required - reduce damage and special mechanics"};
}

WeaponComparison compareWeapons(std::string weaponName, const StatisticalAnalysis& weapon,
                                std::string baselineName, const StatisticalAnalysis& baseline) {
    WeaponComparison c;
    c.weaponName = std::move(weaponName);
    c.baselineName = std::move(baselineName);

    const double baselineMean = baseline.damageStats.mean;
    c.meanDifference = weapon.damageStats.mean - baselineMean;
    c.percentageDifference = baselineMean > 0.0 ? c.meanDifference / baselineMean * 100.0 : 0.0;

    const double pooledVariance = (weapon.damageStats.variance + baseline.damageStats.variance) / 2.0;
    const double n = static_cast<double>(std::max<std::size_t>(weapon.sampleSize, 1));
    const double margin = kConfidenceZ95 * std::sqrt(pooledVariance * 2.0 / n);
    c.confidenceInterval = {c.meanDifference - margin, c.meanDifference + margin};

    c.coefficientOfVariationDifference = weapon.consistencyMetrics.coefficientOfVariation -
                                         baseline.consistencyMetrics.coefficientOfVariation;
    c.stabilityIndexDifference =
        weapon.consistencyMetrics.stabilityIndex - baseline.consistencyMetrics.stabilityIndex;
    if (std::abs(c.coefficientOfVariationDifference) < kConsistencyTolerance) {
        c.consistency = ConsistencyComparison::Similar;
    } else if (c.coefficientOfVariationDifference < 0.0) {
        c.consistency = ConsistencyComparison::MoreConsistent;
    } else {
        c.consistency = ConsistencyComparison::LessConsistent;
    }

    if (weapon.hemorrhageStats) {
        SpecialMechanicAdvantage special;
        special.triggerFrequency = weapon.hemorrhageStats->triggerFrequency;
        special.damageContribution =
            weapon.hemorrhageStats->averageDamagePerTrigger * special.triggerFrequency;
        special.advantagePercentage =
            baselineMean > 0.0 ? special.damageContribution / baselineMean * 100.0 : 0.0;
        c.specialMechanic = special;
    }

    c.balance = assessBalance(c.percentageDifference, c.specialMechanic);
    return c;
}

void updatePerformanceRankings(std::vector<WeaponComparison>& comparisons) {
    std::vector<double> ordered;
    ordered.reserve(comparisons.size());
    for (const auto& c : comparisons) {
        ordered.push_back(c.percentageDifference);
    }
    std::sort(ordered.begin(), ordered.end(), std::greater<>());

    const int total = static_cast<int>(ordered.size());
    for (auto& c : comparisons) {
        // Ties share the best rank.
        auto it = std::find(ordered.begin(), ordered.end(), c.percentageDifference);
        const int rank = static_cast<int>(it - ordered.begin()) + 1;
        c.ranking.rank = rank;
        c.ranking.totalCompared = total;
        c.ranking.percentile = static_cast<double>(total - rank + 1) / total * 100.0;
    }
}

ComparisonReport buildComparisonReport(std::vector<WeaponComparison> comparisons) {
    ComparisonReport report;
    updatePerformanceRankings(comparisons);

    struct Totals {
        double performance = 0.0;
        double consistency = 0.0;
        double balance = 0.0;
        int count = 0;
    };
    std::vector<std::string> order;
    std::map<std::string, Totals> totals;

    for (const auto& c : comparisons) {
        addUnique(report.baselineWeapons, c.baselineName);
        if (totals.find(c.weaponName) == totals.end()) {
            order.push_back(c.weaponName);
        }
        auto& t = totals[c.weaponName];
        t.performance += c.percentageDifference;
        t.consistency += c.stabilityIndexDifference;
        t.balance += balanceScore(c.balance.rating);
        ++t.count;

        switch (c.balance.rating) {
            case BalanceRating::Balanced:
                addUnique(report.summary.balancedWeapons, c.weaponName);
                break;
            case BalanceRating::Overpowered:
            case BalanceRating::SignificantlyOverpowered:
                addUnique(report.summary.overpoweredWeapons, c.weaponName);
                break;
            case BalanceRating::Underpowered:
                addUnique(report.summary.underpoweredWeapons, c.weaponName);
                break;
        }
        addUnique(report.summary.recommendations, c.balance.recommendation);
    }

    for (const auto& name : order) {
        const auto& t = totals[name];
        report.overallRankings.push_back(OverallRanking{
            name, t.performance / t.count, t.consistency / t.count, t.balance / t.count, 0});
    }
    std::stable_sort(report.overallRankings.begin(), report.overallRankings.end(),
                     [](const OverallRanking& a, const OverallRanking& b) {
                         return a.averagePerformance > b.averagePerformance;
                     });
    for (std::size_t i = 0; i < report.overallRankings.size(); ++i) {
        report.overallRankings[i].overallRank = static_cast<int>(i) + 1;
    }

    report.comparisons = std::move(comparisons);
    return report;
}

} // namespace wbs::analysis
