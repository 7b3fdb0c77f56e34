/// @file hemorrhage_tracker.cpp
/// @brief Bleed counter and hemorrhage accounting.

#include "wbs/metrics/builtin_trackers.hpp"

#include <string>

#include "wbs/metrics/metrics_registry.hpp"
#include "wbs/model/mechanics.hpp"
#include "wbs/model/target_size.hpp"

namespace wbs::metrics {

void HemorrhageTracker::onStart(const CombatContext& context) {
    bleedDamage_ = 0;
    counterAdded_ = 0;
    fromCrits_ = 0;
    fromNonCrits_ = 0;
    hemorrhages_ = 0;
    firstHemorrhageRound_.reset();

    // Immune targets have no threshold.
    threshold_ = 0;
    if (!context.bleedImmune && !model::hasBleedImmunityMarker(context.targetSize)) {
        auto size = model::parseSizeClass(context.targetSize);
        if (size) {
            threshold_ = context.bleedThresholds[static_cast<std::size_t>(size.value())];
        }
    }
}

void HemorrhageTracker::onAttack(const combat::AttackResult& result) {
    for (const auto& effect : result.specialEffects) {
        if (effect.name == combat::effect_names::kBleedCounter) {
            counterAdded_ += effect.magnitude;
            (result.critical ? fromCrits_ : fromNonCrits_) += effect.magnitude;
        } else if (effect.name == combat::effect_names::kHemorrhage) {
            bleedDamage_ += effect.magnitude;
            ++hemorrhages_;
            if (!firstHemorrhageRound_) {
                firstHemorrhageRound_ = result.round;
            }
        }
    }
}

MetricMap HemorrhageTracker::onEnd() {
    MetricMap metrics{
        {"bleed_damage", bleedDamage_},
        {"bleed_counter_added", counterAdded_},
        {"bleed_from_crits", fromCrits_},
        {"bleed_from_non_crits", fromNonCrits_},
        {"bleed_threshold", threshold_},
        {"hemorrhages_triggered", hemorrhages_},
    };
    if (firstHemorrhageRound_) {
        metrics["rounds_to_first_hemorrhage"] = static_cast<int64_t>(*firstHemorrhageRound_);
    }
    return metrics;
}

WBS_REGISTER_TRACKER(HemorrhageTracker, Mechanic, "bleed");

} // namespace wbs::metrics
