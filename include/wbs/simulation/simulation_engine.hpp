#pragma once

/// @file simulation_engine.hpp
/// @brief Batch driver: N independent combats, then statistical analysis.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "wbs/analysis/statistical_analyzer.hpp"
#include "wbs/combat/combat_orchestrator.hpp"
#include "wbs/combat/combat_types.hpp"
#include "wbs/foundation/sim_result.hpp"

namespace wbs::model {
class CharacterInstance;
struct WeaponDefinition;
} // namespace wbs::model

namespace wbs::simulation {

using foundation::SimResult;

struct SimulationConfig {
    int iterations = 1000;
    /// Batch seed; a random one is drawn (and logged) when unset.
    std::optional<uint64_t> seed;
    /// 1 runs serially; more uses a SimJobScheduler pool of that size.
    std::size_t workers = 1;
    combat::Scenario scenario;
};

struct SimulationResult {
    std::string characterName;
    std::string weaponName;
    combat::Scenario scenario;
    int iterations = 0;
    uint64_t seed = 0;
    analysis::StatisticalAnalysis analysis;
    std::vector<combat::CombatResult> combats;
};

/// Runs batches of combats.
///
/// Combat i always uses a fresh WeaponInstance and a DiceRoller seeded with
/// deriveStreamSeed(seed, i), so a batch is identical whether it runs
/// serially or on any number of workers. The first fault aborts the batch.
class SimulationEngine {
public:
    explicit SimulationEngine(SimulationConfig config);

    /// Run a batch under the configured scenario.
    [[nodiscard]] SimResult<SimulationResult> run(const model::CharacterInstance& character,
                                                  const model::WeaponDefinition& weapon) const;

    /// Run a batch under @p scenario.
    [[nodiscard]] SimResult<SimulationResult> run(const model::CharacterInstance& character,
                                                  const model::WeaponDefinition& weapon,
                                                  const combat::Scenario& scenario) const;

    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }

    /// Seed actually used by every batch of this engine.
    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

private:
    SimResult<std::vector<combat::CombatResult>> runSerial(
        const combat::CombatOrchestrator& orchestrator,
        const model::WeaponDefinition& weapon) const;

    SimResult<std::vector<combat::CombatResult>> runParallel(
        const combat::CombatOrchestrator& orchestrator,
        const model::WeaponDefinition& weapon) const;

    SimulationConfig config_;
    uint64_t seed_;
};

} // namespace wbs::simulation
