#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <vector>

#include "wbs/analysis/weapon_comparison.hpp"
#include "wbs/model/catalog.hpp"
#include "wbs/model/rogue.hpp"
#include "wbs/simulation/simulation_engine.hpp"

using namespace wbs::simulation;
using wbs::combat::CombatResult;
using wbs::combat::Scenario;
using wbs::model::CharacterInstance;

namespace {

class SimulationBatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto rogue = wbs::model::makeRogue(5);
        ASSERT_TRUE(rogue.hasValue());
        rogue_ = std::make_unique<CharacterInstance>(std::move(rogue).value());
    }

    static SimulationConfig config(std::size_t workers, int iterations = 1000) {
        SimulationConfig cfg;
        cfg.iterations = iterations;
        cfg.seed = 20240601;
        cfg.workers = workers;
        cfg.scenario.rounds = 10;
        cfg.scenario.targetArmorClass = 15;
        cfg.scenario.advantageRate = 0.3;
        return cfg;
    }

    static std::vector<int64_t> damages(const SimulationResult& result) {
        std::vector<int64_t> out;
        out.reserve(result.combats.size());
        for (const auto& c : result.combats) {
            out.push_back(c.totalDamage);
        }
        return out;
    }

    std::unique_ptr<CharacterInstance> rogue_;
};

} // namespace

// ---------------------------------------------------------------------------
// Reproducibility
// ---------------------------------------------------------------------------

TEST_F(SimulationBatchTest, SameSeedSameBatch) {
    SimulationEngine first(config(1));
    SimulationEngine second(config(1));
    auto a = first.run(*rogue_, wbs::model::sanguineMesser());
    auto b = second.run(*rogue_, wbs::model::sanguineMesser());
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());

    EXPECT_EQ(a.value().combats.size(), 1000u);
    EXPECT_EQ(damages(a.value()), damages(b.value()));
    EXPECT_DOUBLE_EQ(a.value().analysis.damageStats.mean, b.value().analysis.damageStats.mean);
}

TEST_F(SimulationBatchTest, SerialMatchesParallel) {
    SimulationEngine serial(config(1));
    SimulationEngine parallel(config(4));
    auto a = serial.run(*rogue_, wbs::model::sanguineMesser());
    auto b = parallel.run(*rogue_, wbs::model::sanguineMesser());
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());

    EXPECT_EQ(damages(a.value()), damages(b.value()));
    for (std::size_t i = 0; i < b.value().combats.size(); ++i) {
        EXPECT_EQ(b.value().combats[i].combatId, static_cast<int>(i));
    }
}

TEST_F(SimulationBatchTest, DifferentSeedsDiverge) {
    auto cfg = config(1, 200);
    SimulationEngine first(cfg);
    cfg.seed = 99;
    SimulationEngine second(cfg);
    auto a = first.run(*rogue_, wbs::model::sanguineMesser());
    auto b = second.run(*rogue_, wbs::model::sanguineMesser());
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(damages(a.value()), damages(b.value()));
}

// ---------------------------------------------------------------------------
// Behavior over a full batch
// ---------------------------------------------------------------------------

TEST_F(SimulationBatchTest, MesserTriggersHemorrhage) {
    SimulationEngine engine(config(4));
    auto result = engine.run(*rogue_, wbs::model::sanguineMesser());
    ASSERT_TRUE(result.hasValue());

    const auto& analysis = result.value().analysis;
    ASSERT_TRUE(analysis.hemorrhageStats.has_value());
    EXPECT_GT(analysis.hemorrhageStats->triggerFrequency, 0.0);
    EXPECT_GT(analysis.damageStats.mean, 0.0);

    for (const auto& combat : result.value().combats) {
        EXPECT_EQ(combat.totalTempHp, combat.hemorrhageDamage);
        EXPECT_EQ(combat.attacks, 10);
    }
}

TEST_F(SimulationBatchTest, ConstructNeverBleeds) {
    SimulationEngine engine(config(2));
    Scenario golem = engine.config().scenario;
    golem.targetSize = "medium construct";

    auto result = engine.run(*rogue_, wbs::model::sanguineMesser(), golem);
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().analysis.hemorrhageStats.has_value());
    for (const auto& combat : result.value().combats) {
        EXPECT_EQ(combat.hemorrhageTriggers, 0);
        EXPECT_EQ(combat.totalTempHp, 0);
    }
}

TEST_F(SimulationBatchTest, InvalidScenarioFailsTheBatch) {
    auto cfg = config(1, 10);
    cfg.scenario.advantageRate = 2.0;
    SimulationEngine engine(cfg);
    EXPECT_TRUE(engine.run(*rogue_, wbs::model::sanguineMesser()).hasError());
}

TEST_F(SimulationBatchTest, MesserAgainstLevelBaselines) {
    SimulationEngine engine(config(4, 500));
    auto tested = engine.run(*rogue_, wbs::model::sanguineMesser());
    ASSERT_TRUE(tested.hasValue());

    std::vector<wbs::analysis::WeaponComparison> comparisons;
    for (const auto& baseline : wbs::model::baselinesForLevel(5)) {
        auto reference = engine.run(*rogue_, baseline);
        ASSERT_TRUE(reference.hasValue());
        comparisons.push_back(wbs::analysis::compareWeapons(
            tested.value().weaponName, tested.value().analysis,
            reference.value().weaponName, reference.value().analysis));
    }
    ASSERT_EQ(comparisons.size(), 3u);

    auto report = wbs::analysis::buildComparisonReport(std::move(comparisons));
    ASSERT_EQ(report.overallRankings.size(), 1u);
    EXPECT_EQ(report.overallRankings[0].weaponName, "Sanguine Messer");
    EXPECT_EQ(report.baselineWeapons.size(), 3u);
    // Bleed on top of the same 1d8 +1 profile must beat the mundane +1 rapier.
    EXPECT_GT(report.comparisons[0].meanDifference, 0.0);
}
