#pragma once

/// @file sim_runner.hpp
/// @brief Shared utilities for the simulator entry point.
///
/// Configuration loading, CLI argument parsing and the mapping from
/// flattened config keys onto SimulationConfig.

#include <filesystem>
#include <optional>
#include <string>

#include "wbs/foundation/config_manager.hpp"
#include "wbs/foundation/sim_logger.hpp"
#include "wbs/simulation/simulation_engine.hpp"

namespace wbs::simulation {

/// Everything a simulator run needs beyond the batch itself.
struct RunSettings {
    SimulationConfig simulation;
    std::string weapon = "Sanguine Messer";
    int characterLevel = 5;
    bool compareBaselines = true;
    /// Applied to every log category when present.
    std::optional<foundation::LogLevel> logLevel;
};

/// Load configuration from @p defaultPath, or from the path named by the
/// WBS_CONFIG_PATH environment variable when it is set.
SimResult<void> loadConfig(foundation::ConfigManager& config,
                           const std::filesystem::path& defaultPath);

/// Extract the value following "--config", or an empty path.
std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Map the simulation.*, scenario.* and logging.* keys onto RunSettings.
/// Missing keys keep their defaults.
RunSettings buildSimulationConfig(const foundation::ConfigManager& config);

} // namespace wbs::simulation
