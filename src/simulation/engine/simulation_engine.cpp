/// @file simulation_engine.cpp
/// @brief SimulationEngine implementation.

#include "wbs/simulation/simulation_engine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <random>
#include <string>
#include <utility>

#include "wbs/dice/dice_roller.hpp"
#include "wbs/foundation/job_scheduler.hpp"
#include "wbs/foundation/sim_logger.hpp"
#include "wbs/foundation/sim_metrics.hpp"
#include "wbs/model/character.hpp"
#include "wbs/model/weapon.hpp"

namespace wbs::simulation {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::SimError;
using foundation::SimLogger;
using foundation::SimMetrics;
namespace metric_names = foundation::metric_names;

namespace {

// Jobs per worker; more chunks than workers keeps the pool busy when
// combats finish unevenly.
constexpr std::size_t kChunksPerWorker = 4;

uint64_t chooseSeed(const std::optional<uint64_t>& configured) {
    if (configured) {
        return *configured;
    }
    std::random_device device;
    uint64_t seed = (static_cast<uint64_t>(device()) << 32) | device();
    WBS_LOG_INFO(LogCategory::Simulation,
                 "No seed configured, using " + std::to_string(seed));
    return seed;
}

SimResult<combat::CombatResult> runOne(const combat::CombatOrchestrator& orchestrator,
                                       const model::WeaponDefinition& weapon,
                                       uint64_t batchSeed, int index) {
    auto instance = model::WeaponInstance::create(weapon);
    if (!instance) {
        return SimResult<combat::CombatResult>::err(std::move(instance).error());
    }
    dice::DiceRoller roller(dice::deriveStreamSeed(batchSeed, static_cast<uint64_t>(index)));
    return orchestrator.runCombat(index, instance.value(), roller);
}

void recordBatchMetrics(const std::vector<combat::CombatResult>& combats, double mean,
                        double elapsedMs) {
    auto& metrics = SimMetrics::instance();
    uint64_t attacks = 0;
    uint64_t hemorrhages = 0;
    for (const auto& c : combats) {
        attacks += static_cast<uint64_t>(c.attacks);
        hemorrhages += static_cast<uint64_t>(c.hemorrhageTriggers);
    }
    metrics.incrementCounter(metric_names::kCombatsTotal, combats.size());
    metrics.incrementCounter(metric_names::kAttacksTotal, attacks);
    metrics.incrementCounter(metric_names::kHemorrhagesTotal, hemorrhages);
    metrics.setGauge(metric_names::kLastBatchMeanDamage, mean);
    metrics.registerHistogram(metric_names::kBatchDurationMs,
                              foundation::HistogramBuckets::batchDuration());
    metrics.recordHistogram(metric_names::kBatchDurationMs, elapsedMs);
}

} // namespace

SimulationEngine::SimulationEngine(SimulationConfig config)
    : config_(std::move(config)), seed_(chooseSeed(config_.seed)) {}

SimResult<SimulationResult> SimulationEngine::run(const model::CharacterInstance& character,
                                                  const model::WeaponDefinition& weapon) const {
    return run(character, weapon, config_.scenario);
}

SimResult<SimulationResult> SimulationEngine::run(const model::CharacterInstance& character,
                                                  const model::WeaponDefinition& weapon,
                                                  const combat::Scenario& scenario) const {
    auto fail = [](SimError error) {
        SimMetrics::instance().incrementCounter(metric_names::kBatchesFailed);
        WBS_LOG_ERROR(LogCategory::Simulation, "Batch aborted: " + error.describe());
        return SimResult<SimulationResult>::err(std::move(error));
    };

    if (config_.iterations < 1) {
        return fail(SimError(ErrorCode::InvalidArgument, "iterations must be at least 1"));
    }

    // Fail fast on a bad weapon before any worker starts.
    auto probe = model::WeaponInstance::create(weapon);
    if (!probe) {
        return fail(std::move(probe).error());
    }

    auto orchestrator = combat::CombatOrchestrator::create(character, scenario);
    if (!orchestrator) {
        return fail(std::move(orchestrator).error());
    }

    LogContext ctx;
    ctx.weapon = weapon.name;
    ctx.character = character.name();
    ctx.seed = seed_;
    ctx.extra["iterations"] = std::to_string(config_.iterations);
    ctx.extra["scenario"] = scenario.name;
    ctx.extra["advantage"] = combat::describeStrategy(orchestrator.value().strategy());
    SimLogger::instance().logWithContext(LogLevel::Info, LogCategory::Simulation,
                                         "Batch started", ctx);

    const auto started = std::chrono::steady_clock::now();
    auto combats = config_.workers > 1 ? runParallel(orchestrator.value(), weapon)
                                       : runSerial(orchestrator.value(), weapon);
    if (!combats) {
        return fail(std::move(combats).error());
    }

    auto analyzed = analysis::StatisticalAnalyzer::analyze(combats.value());
    if (!analyzed) {
        return fail(std::move(analyzed).error());
    }
    const double elapsedMs = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - started).count();

    SimulationResult result;
    result.characterName = character.name();
    result.weaponName = weapon.name;
    result.scenario = scenario;
    result.iterations = config_.iterations;
    result.seed = seed_;
    result.analysis = std::move(analyzed).value();
    result.combats = std::move(combats).value();

    recordBatchMetrics(result.combats, result.analysis.damageStats.mean, elapsedMs);

    WBS_LOG_INFO(LogCategory::Simulation,
                 "Batch finished: " + weapon.name + " mean " +
                     std::to_string(result.analysis.damageStats.mean) + " over " +
                     std::to_string(result.iterations) + " combats");

    return SimResult<SimulationResult>::ok(std::move(result));
}

SimResult<std::vector<combat::CombatResult>> SimulationEngine::runSerial(
    const combat::CombatOrchestrator& orchestrator, const model::WeaponDefinition& weapon) const
{
    std::vector<combat::CombatResult> combats;
    combats.reserve(static_cast<std::size_t>(config_.iterations));
    for (int i = 0; i < config_.iterations; ++i) {
        auto outcome = runOne(orchestrator, weapon, seed_, i);
        if (!outcome) {
            return SimResult<std::vector<combat::CombatResult>>::err(std::move(outcome).error());
        }
        combats.push_back(std::move(outcome).value());
    }
    return SimResult<std::vector<combat::CombatResult>>::ok(std::move(combats));
}

SimResult<std::vector<combat::CombatResult>> SimulationEngine::runParallel(
    const combat::CombatOrchestrator& orchestrator, const model::WeaponDefinition& weapon) const
{
    using Out = SimResult<std::vector<combat::CombatResult>>;

    const auto total = static_cast<std::size_t>(config_.iterations);
    const std::size_t chunks = std::min(total, config_.workers * kChunksPerWorker);
    const std::size_t chunkSize = (total + chunks - 1) / chunks;

    std::vector<std::optional<combat::CombatResult>> slots(total);
    std::vector<std::optional<SimError>> errors(chunks);
    std::atomic<bool> aborted{false};

    std::vector<foundation::SimJobScheduler::JobFunc> jobs;
    jobs.reserve(chunks);
    for (std::size_t c = 0; c < chunks; ++c) {
        const std::size_t begin = c * chunkSize;
        const std::size_t end = std::min(total, begin + chunkSize);
        jobs.emplace_back([&, c, begin, end]() {
            for (std::size_t i = begin; i < end; ++i) {
                if (aborted.load(std::memory_order_relaxed)) {
                    return;
                }
                auto outcome = runOne(orchestrator, weapon, seed_, static_cast<int>(i));
                if (!outcome) {
                    errors[c] = std::move(outcome).error();
                    aborted.store(true, std::memory_order_relaxed);
                    return;
                }
                slots[i] = std::move(outcome).value();
            }
        });
    }

    foundation::SimJobScheduler scheduler(config_.workers);
    auto ids = scheduler.scheduleBatch(std::move(jobs));
    if (!ids) {
        return Out::err(std::move(ids).error());
    }
    auto done = scheduler.waitAll(ids.value());
    if (!done) {
        return Out::err(std::move(done).error());
    }

    for (auto& error : errors) {
        if (error) {
            return Out::err(std::move(*error));
        }
    }

    std::vector<combat::CombatResult> combats;
    combats.reserve(total);
    for (auto& slot : slots) {
        if (!slot) {
            return Out::err(SimError(ErrorCode::ThreadError, "combat slot left empty by worker"));
        }
        combats.push_back(std::move(*slot));
    }
    return Out::ok(std::move(combats));
}

} // namespace wbs::simulation
