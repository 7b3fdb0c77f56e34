/// @file sneak_attack_tracker.cpp
/// @brief Sneak Attack accounting.

#include "wbs/metrics/builtin_trackers.hpp"

#include "wbs/metrics/metrics_registry.hpp"

namespace wbs::metrics {

void SneakAttackTracker::onStart(const CombatContext& /*context*/) {
    damage_ = 0;
    landed_ = 0;
}

void SneakAttackTracker::onAttack(const combat::AttackResult& result) {
    for (const auto& effect : result.specialEffects) {
        if (effect.name == combat::effect_names::kSneakAttack) {
            damage_ += effect.magnitude;
            ++landed_;
        }
    }
}

MetricMap SneakAttackTracker::onEnd() {
    return MetricMap{
        {"sneak_attack_damage", damage_},
        {"sneak_attacks_landed", landed_},
    };
}

WBS_REGISTER_TRACKER(SneakAttackTracker, Class, "rogue");

} // namespace wbs::metrics
