/// @file main.cpp
/// @brief Simulator entry point.
///
/// Runs one batch of combats for the configured catalog weapon, optionally
/// compares it with the level-appropriate baselines, and prints a summary.

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "wbs/analysis/weapon_comparison.hpp"
#include "wbs/foundation/config_manager.hpp"
#include "wbs/foundation/sim_logger.hpp"
#include "wbs/foundation/sim_metrics.hpp"
#include "wbs/model/catalog.hpp"
#include "wbs/model/rogue.hpp"
#include "wbs/simulation/sim_runner.hpp"
#include "wbs/simulation/simulation_engine.hpp"
#include "wbs/version.hpp"

namespace {

using wbs::foundation::LogCategory;

void printAnalysis(const wbs::simulation::SimulationResult& result) {
    const auto& d = result.analysis.damageStats;
    const auto& c = result.analysis.consistencyMetrics;
    std::cout << result.weaponName << " (" << result.iterations << " combats, seed "
              << result.seed << ")\n"
              << "  mean " << d.mean << ", median " << d.median << ", sd "
              << d.standardDeviation << ", min " << d.min << ", max " << d.max << "\n"
              << "  p25 " << d.percentiles.p25 << ", p75 " << d.percentiles.p75
              << ", p95 " << d.percentiles.p95 << "\n"
              << "  consistency " << wbs::analysis::consistencyRatingName(c.rating)
              << " (cv " << c.coefficientOfVariation << ")\n";
    if (result.analysis.hemorrhageStats) {
        const auto& h = *result.analysis.hemorrhageStats;
        std::cout << "  hemorrhage " << h.triggerFrequency << " per combat, "
                  << h.averageDamagePerTrigger << " damage per trigger\n";
    }
}

void printReport(const wbs::analysis::ComparisonReport& report) {
    for (const auto& c : report.comparisons) {
        std::cout << "  vs " << c.baselineName << ": " << std::showpos
                  << c.percentageDifference << std::noshowpos << "% ["
                  << c.confidenceInterval.lower << ", " << c.confidenceInterval.upper
                  << "] " << wbs::analysis::balanceRatingName(c.balance.rating) << " ("
                  << wbs::analysis::riskLevelName(c.balance.risk) << " risk), rank "
                  << c.ranking.rank << "/" << c.ranking.totalCompared << "\n";
    }
    for (const auto& r : report.summary.recommendations) {
        std::cout << "  - " << r << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto configPath = wbs::simulation::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/simulation.yaml";
    }

    wbs::foundation::ConfigManager config;
    auto loadResult = wbs::simulation::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto settings = wbs::simulation::buildSimulationConfig(config);
    if (settings.logLevel) {
        wbs::foundation::SimLogger::instance().setAllLevels(*settings.logLevel);
    }
    WBS_LOG_INFO(LogCategory::Core,
                 std::string("wbs_simulator ") + wbs::Version::string + " starting");

    auto rogue = wbs::model::makeRogue(settings.characterLevel);
    if (!rogue) {
        std::cerr << "Invalid character: " << rogue.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto weapon = wbs::model::findCatalogWeapon(settings.weapon);
    if (!weapon) {
        std::cerr << "Unknown weapon: " << weapon.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    wbs::simulation::SimulationEngine engine(settings.simulation);
    auto tested = engine.run(rogue.value(), weapon.value());
    if (!tested) {
        std::cerr << "Simulation failed: " << tested.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << std::fixed << std::setprecision(2);
    std::cout << rogue.value().name() << " vs AC " << settings.simulation.scenario.targetArmorClass
              << " (" << settings.simulation.scenario.targetSize << "), "
              << settings.simulation.scenario.rounds << " rounds\n";
    printAnalysis(tested.value());

    if (settings.compareBaselines) {
        auto baselines = wbs::model::baselinesForLevel(settings.characterLevel);
        if (baselines.empty()) {
            WBS_LOG_WARN(LogCategory::Analysis,
                         "No baseline weapons cover level " +
                             std::to_string(settings.characterLevel));
        }

        std::vector<wbs::analysis::WeaponComparison> comparisons;
        for (const auto& baseline : baselines) {
            auto reference = engine.run(rogue.value(), baseline);
            if (!reference) {
                std::cerr << "Baseline simulation failed: "
                          << reference.error().describe() << "\n";
                return EXIT_FAILURE;
            }
            printAnalysis(reference.value());
            comparisons.push_back(wbs::analysis::compareWeapons(
                tested.value().weaponName, tested.value().analysis,
                reference.value().weaponName, reference.value().analysis));
        }

        if (!comparisons.empty()) {
            std::cout << "Balance vs baselines:\n";
            printReport(wbs::analysis::buildComparisonReport(std::move(comparisons)));
        }
    }

    std::cout << "\n" << wbs::foundation::SimMetrics::instance().scrape();

    auto flushed = wbs::foundation::SimLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().describe() << "\n";
    }
    return EXIT_SUCCESS;
}
