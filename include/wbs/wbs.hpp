#pragma once

/// @file wbs.hpp
/// @brief Umbrella header for the weapon balance simulator.

#include "wbs/version.hpp"

#include "wbs/core/result.hpp"
#include "wbs/foundation/error_code.hpp"
#include "wbs/foundation/sim_error.hpp"
#include "wbs/foundation/sim_result.hpp"

#include "wbs/dice/dice_expression.hpp"
#include "wbs/dice/dice_roller.hpp"

#include "wbs/model/catalog.hpp"
#include "wbs/model/character.hpp"
#include "wbs/model/rogue.hpp"
#include "wbs/model/weapon.hpp"

#include "wbs/combat/advantage_scheduler.hpp"
#include "wbs/combat/attack_resolver.hpp"
#include "wbs/combat/combat_orchestrator.hpp"

#include "wbs/metrics/metrics_engine.hpp"
#include "wbs/metrics/metrics_registry.hpp"

#include "wbs/analysis/statistical_analyzer.hpp"
#include "wbs/analysis/weapon_comparison.hpp"

#include "wbs/simulation/simulation_engine.hpp"
