#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "wbs/simulation/sim_runner.hpp"

using namespace wbs::simulation;
using wbs::foundation::ConfigManager;
using wbs::foundation::LogLevel;

namespace {

constexpr const char* kRunYaml = R"(
simulation:
  iterations: 250
  seed: 77
  workers: 4
  weapon: "Baseline Rapier +1"
  character_level: 7
  compare_baselines: false
scenario:
  name: ogre-brawl
  rounds: 8
  target_ac: 11
  target_size: large
  advantage_rate: 0.5
  attacks_per_round: 2
  target_hp: 59
  bleed_immune: true
  target_switching: true
  switch_interval: 3
logging:
  level: warn
)";

std::vector<char*> argvOf(std::vector<std::string>& args) {
    std::vector<char*> out;
    for (auto& a : args) {
        out.push_back(a.data());
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// parseConfigArg
// ---------------------------------------------------------------------------

TEST(SimRunnerTest, ParseConfigArgFindsPath) {
    std::vector<std::string> args{"wbs_simulator", "--config", "custom.yaml"};
    auto argv = argvOf(args);
    EXPECT_EQ(parseConfigArg(static_cast<int>(argv.size()), argv.data()),
              std::filesystem::path("custom.yaml"));
}

TEST(SimRunnerTest, ParseConfigArgWithoutValue) {
    std::vector<std::string> args{"wbs_simulator", "--config"};
    auto argv = argvOf(args);
    EXPECT_TRUE(parseConfigArg(static_cast<int>(argv.size()), argv.data()).empty());

    std::vector<std::string> none{"wbs_simulator"};
    auto argvNone = argvOf(none);
    EXPECT_TRUE(parseConfigArg(static_cast<int>(argvNone.size()), argvNone.data()).empty());
}

// ---------------------------------------------------------------------------
// buildSimulationConfig
// ---------------------------------------------------------------------------

TEST(SimRunnerTest, MapsEveryKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kRunYaml).hasValue());
    auto settings = buildSimulationConfig(config);

    EXPECT_EQ(settings.simulation.iterations, 250);
    ASSERT_TRUE(settings.simulation.seed.has_value());
    EXPECT_EQ(*settings.simulation.seed, 77u);
    EXPECT_EQ(settings.simulation.workers, 4u);
    EXPECT_EQ(settings.weapon, "Baseline Rapier +1");
    EXPECT_EQ(settings.characterLevel, 7);
    EXPECT_FALSE(settings.compareBaselines);

    const auto& s = settings.simulation.scenario;
    EXPECT_EQ(s.name, "ogre-brawl");
    EXPECT_EQ(s.rounds, 8);
    EXPECT_EQ(s.targetArmorClass, 11);
    EXPECT_EQ(s.targetSize, "large");
    EXPECT_DOUBLE_EQ(s.advantageRate, 0.5);
    EXPECT_EQ(s.attacksPerRound, 2);
    ASSERT_TRUE(s.targetHp.has_value());
    EXPECT_EQ(*s.targetHp, 59);
    EXPECT_TRUE(s.bleedImmune);
    EXPECT_TRUE(s.targetSwitching);
    EXPECT_EQ(s.switchInterval, 3);

    ASSERT_TRUE(settings.logLevel.has_value());
    EXPECT_EQ(*settings.logLevel, LogLevel::Warning);
}

TEST(SimRunnerTest, MissingKeysKeepDefaults) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("scenario:\n  rounds: 4\n").hasValue());
    auto settings = buildSimulationConfig(config);

    RunSettings defaults;
    EXPECT_EQ(settings.simulation.scenario.rounds, 4);
    EXPECT_EQ(settings.simulation.iterations, defaults.simulation.iterations);
    EXPECT_FALSE(settings.simulation.seed.has_value());
    EXPECT_EQ(settings.weapon, "Sanguine Messer");
    EXPECT_EQ(settings.characterLevel, 5);
    EXPECT_TRUE(settings.compareBaselines);
    EXPECT_EQ(settings.simulation.scenario.targetSize, "medium");
    EXPECT_FALSE(settings.simulation.scenario.targetHp.has_value());
    EXPECT_FALSE(settings.logLevel.has_value());
}

TEST(SimRunnerTest, UnknownLogLevelIsIgnored) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  level: chatty\n").hasValue());
    EXPECT_FALSE(buildSimulationConfig(config).logLevel.has_value());
}

// ---------------------------------------------------------------------------
// loadConfig
// ---------------------------------------------------------------------------

TEST(SimRunnerTest, LoadConfigReadsDefaultPath) {
    auto path = std::filesystem::temp_directory_path() / "wbs_sim_runner_test.yaml";
    {
        std::ofstream out(path);
        out << kRunYaml;
    }

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, path).hasValue());
    EXPECT_EQ(config.get<int>("scenario.rounds").value(), 8);
    std::filesystem::remove(path);
}

TEST(SimRunnerTest, LoadConfigMissingFileFails) {
    ConfigManager config;
    EXPECT_TRUE(loadConfig(config, "/nonexistent/wbs/simulation.yaml").hasError());
}
