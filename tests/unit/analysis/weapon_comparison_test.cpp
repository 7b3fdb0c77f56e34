#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "wbs/analysis/weapon_comparison.hpp"

using namespace wbs::analysis;

namespace {

StatisticalAnalysis sample(double mean, double variance, double cv) {
    StatisticalAnalysis a;
    a.sampleSize = 100;
    a.damageStats.mean = mean;
    a.damageStats.variance = variance;
    a.damageStats.standardDeviation = std::sqrt(variance);
    a.consistencyMetrics.coefficientOfVariation = cv;
    a.consistencyMetrics.stabilityIndex = 1.0 / (1.0 + cv);
    return a;
}

WeaponComparison rated(const std::string& weapon, const std::string& baseline, double pct) {
    WeaponComparison c;
    c.weaponName = weapon;
    c.baselineName = baseline;
    c.percentageDifference = pct;
    c.balance = assessBalance(pct, std::nullopt);
    return c;
}

} // namespace

// ---------------------------------------------------------------------------
// compareWeapons
// ---------------------------------------------------------------------------

TEST(WeaponComparisonTest, DifferencesAndConfidenceInterval) {
    auto c = compareWeapons("Messer", sample(110.0, 100.0, 0.1), "Rapier", sample(100.0, 100.0, 0.2));
    EXPECT_EQ(c.weaponName, "Messer");
    EXPECT_EQ(c.baselineName, "Rapier");
    EXPECT_DOUBLE_EQ(c.meanDifference, 10.0);
    EXPECT_DOUBLE_EQ(c.percentageDifference, 10.0);

    const double margin = kConfidenceZ95 * std::sqrt(2.0);
    EXPECT_NEAR(c.confidenceInterval.lower, 10.0 - margin, 1e-9);
    EXPECT_NEAR(c.confidenceInterval.upper, 10.0 + margin, 1e-9);

    EXPECT_EQ(c.consistency, ConsistencyComparison::MoreConsistent);
    EXPECT_FALSE(c.specialMechanic.has_value());
    EXPECT_EQ(c.balance.rating, BalanceRating::Balanced);
}

TEST(WeaponComparisonTest, ConsistencyWithinToleranceIsSimilar) {
    auto similar = compareWeapons("A", sample(100.0, 25.0, 0.22), "B", sample(100.0, 25.0, 0.20));
    EXPECT_EQ(similar.consistency, ConsistencyComparison::Similar);

    auto worse = compareWeapons("A", sample(100.0, 25.0, 0.40), "B", sample(100.0, 25.0, 0.20));
    EXPECT_EQ(worse.consistency, ConsistencyComparison::LessConsistent);
}

TEST(WeaponComparisonTest, HemorrhageCountsTowardBalance) {
    auto messer = sample(110.0, 100.0, 0.2);
    messer.hemorrhageStats = HemorrhageStatistics{};
    messer.hemorrhageStats->triggerFrequency = 0.5;
    messer.hemorrhageStats->averageDamagePerTrigger = 20.0;

    auto c = compareWeapons("Messer", messer, "Rapier", sample(100.0, 100.0, 0.2));
    ASSERT_TRUE(c.specialMechanic.has_value());
    EXPECT_DOUBLE_EQ(c.specialMechanic->triggerFrequency, 0.5);
    EXPECT_DOUBLE_EQ(c.specialMechanic->damageContribution, 10.0);
    EXPECT_DOUBLE_EQ(c.specialMechanic->advantagePercentage, 10.0);

    // 10% raw plus 10% from hemorrhage.
    EXPECT_EQ(c.balance.rating, BalanceRating::Overpowered);
    EXPECT_EQ(c.balance.risk, RiskLevel::Medium);
}

TEST(WeaponComparisonTest, ZeroBaselineMean) {
    auto c = compareWeapons("A", sample(5.0, 1.0, 0.2), "B", sample(0.0, 0.0, 0.0));
    EXPECT_DOUBLE_EQ(c.percentageDifference, 0.0);
}

// ---------------------------------------------------------------------------
// assessBalance
// ---------------------------------------------------------------------------

TEST(WeaponComparisonTest, BalanceThresholds) {
    auto far = assessBalance(-20.0, std::nullopt);
    EXPECT_EQ(far.rating, BalanceRating::Underpowered);
    EXPECT_EQ(far.risk, RiskLevel::Medium);
    EXPECT_EQ(far.recommendation, "Consider increasing base damage or improving special mechanics");

    auto near = assessBalance(-10.0, std::nullopt);
    EXPECT_EQ(near.rating, BalanceRating::Underpowered);
    EXPECT_EQ(near.risk, RiskLevel::Low);

    EXPECT_EQ(assessBalance(-5.0, std::nullopt).rating, BalanceRating::Balanced);
    EXPECT_EQ(assessBalance(15.0, std::nullopt).rating, BalanceRating::Balanced);
    EXPECT_EQ(assessBalance(15.5, std::nullopt).rating, BalanceRating::Overpowered);
    EXPECT_EQ(assessBalance(30.0, std::nullopt).rating, BalanceRating::Overpowered);

    auto runaway = assessBalance(31.0, std::nullopt);
    EXPECT_EQ(runaway.rating, BalanceRating::SignificantlyOverpowered);
    EXPECT_EQ(runaway.risk, RiskLevel::High);
    EXPECT_EQ(balanceRatingName(runaway.rating), "significantly-overpowered");
}

// ---------------------------------------------------------------------------
// Ranking and report
// ---------------------------------------------------------------------------

TEST(WeaponComparisonTest, TiesShareTheBestRank) {
    std::vector<WeaponComparison> comparisons{
        rated("A", "X", 10.0),
        rated("B", "X", 20.0),
        rated("C", "X", 10.0),
        rated("D", "X", -5.0),
    };
    updatePerformanceRankings(comparisons);

    EXPECT_EQ(comparisons[0].ranking.rank, 2);
    EXPECT_EQ(comparisons[1].ranking.rank, 1);
    EXPECT_EQ(comparisons[2].ranking.rank, 2);
    EXPECT_EQ(comparisons[3].ranking.rank, 4);
    EXPECT_EQ(comparisons[0].ranking.totalCompared, 4);
    EXPECT_DOUBLE_EQ(comparisons[1].ranking.percentile, 100.0);
    EXPECT_DOUBLE_EQ(comparisons[3].ranking.percentile, 25.0);
}

TEST(WeaponComparisonTest, ReportAggregatesPerWeapon) {
    auto report = buildComparisonReport({
        rated("Messer", "Rapier +1", 20.0),
        rated("Messer", "Longsword +1", 10.0),
        rated("Dagger", "Rapier +1", -20.0),
    });

    EXPECT_EQ(report.baselineWeapons, (std::vector<std::string>{"Rapier +1", "Longsword +1"}));
    ASSERT_EQ(report.comparisons.size(), 3u);
    EXPECT_EQ(report.comparisons[0].ranking.rank, 1);

    ASSERT_EQ(report.overallRankings.size(), 2u);
    EXPECT_EQ(report.overallRankings[0].weaponName, "Messer");
    EXPECT_EQ(report.overallRankings[0].overallRank, 1);
    EXPECT_DOUBLE_EQ(report.overallRankings[0].averagePerformance, 15.0);
    EXPECT_DOUBLE_EQ(report.overallRankings[0].balanceScore, 2.5);
    EXPECT_EQ(report.overallRankings[1].weaponName, "Dagger");
    EXPECT_EQ(report.overallRankings[1].overallRank, 2);
    EXPECT_DOUBLE_EQ(report.overallRankings[1].balanceScore, 1.0);

    EXPECT_EQ(report.summary.balancedWeapons, (std::vector<std::string>{"Messer"}));
    EXPECT_EQ(report.summary.overpoweredWeapons, (std::vector<std::string>{"Messer"}));
    EXPECT_EQ(report.summary.underpoweredWeapons, (std::vector<std::string>{"Dagger"}));
    EXPECT_EQ(report.summary.recommendations.size(), 3u);
}

TEST(WeaponComparisonTest, EmptyReport) {
    auto report = buildComparisonReport({});
    EXPECT_TRUE(report.comparisons.empty());
    EXPECT_TRUE(report.overallRankings.empty());
    EXPECT_TRUE(report.baselineWeapons.empty());
}
