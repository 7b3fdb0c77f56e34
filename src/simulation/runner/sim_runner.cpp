/// @file sim_runner.cpp
/// @brief Config loading and CLI helpers for wbs_simulator.

#include "wbs/simulation/sim_runner.hpp"

#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace wbs::simulation {

// -- Configuration loading ---------------------------------------------------

SimResult<void> loadConfig(foundation::ConfigManager& config,
                           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("WBS_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

// -- Key mapping -------------------------------------------------------------

RunSettings buildSimulationConfig(const foundation::ConfigManager& config) {
    RunSettings settings;
    auto& sim = settings.simulation;
    auto& scenario = sim.scenario;

    auto iterations = config.get<int>("simulation.iterations");
    if (iterations) {
        sim.iterations = iterations.value();
    }

    auto seed = config.get<uint64_t>("simulation.seed");
    if (seed) {
        sim.seed = seed.value();
    }

    auto workers = config.get<std::size_t>("simulation.workers");
    if (workers) {
        sim.workers = workers.value();
    }

    auto weapon = config.get<std::string>("simulation.weapon");
    if (weapon) {
        settings.weapon = weapon.value();
    }

    auto level = config.get<int>("simulation.character_level");
    if (level) {
        settings.characterLevel = level.value();
    }

    auto compare = config.get<bool>("simulation.compare_baselines");
    if (compare) {
        settings.compareBaselines = compare.value();
    }

    auto name = config.get<std::string>("scenario.name");
    if (name) {
        scenario.name = name.value();
    }

    auto rounds = config.get<int>("scenario.rounds");
    if (rounds) {
        scenario.rounds = rounds.value();
    }

    auto targetAc = config.get<int>("scenario.target_ac");
    if (targetAc) {
        scenario.targetArmorClass = targetAc.value();
    }

    auto targetSize = config.get<std::string>("scenario.target_size");
    if (targetSize) {
        scenario.targetSize = targetSize.value();
    }

    auto advantageRate = config.get<double>("scenario.advantage_rate");
    if (advantageRate) {
        scenario.advantageRate = advantageRate.value();
    }

    auto attacksPerRound = config.get<int>("scenario.attacks_per_round");
    if (attacksPerRound) {
        scenario.attacksPerRound = attacksPerRound.value();
    }

    auto targetHp = config.get<int>("scenario.target_hp");
    if (targetHp) {
        scenario.targetHp = targetHp.value();
    }

    auto bleedImmune = config.get<bool>("scenario.bleed_immune");
    if (bleedImmune) {
        scenario.bleedImmune = bleedImmune.value();
    }

    auto switching = config.get<bool>("scenario.target_switching");
    if (switching) {
        scenario.targetSwitching = switching.value();
    }

    auto switchInterval = config.get<int>("scenario.switch_interval");
    if (switchInterval) {
        scenario.switchInterval = switchInterval.value();
    }

    auto logLevel = config.get<std::string>("logging.level");
    if (logLevel) {
        settings.logLevel = foundation::parseLogLevel(logLevel.value());
    }

    return settings;
}

} // namespace wbs::simulation
