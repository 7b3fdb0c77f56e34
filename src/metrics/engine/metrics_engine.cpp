/// @file metrics_engine.cpp
/// @brief MetricsEngine implementation.

#include "wbs/metrics/metrics_engine.hpp"

#include <string>
#include <utility>

#include "wbs/foundation/sim_logger.hpp"
#include "wbs/model/target_size.hpp"

namespace wbs::metrics {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SimError;

MetricsEngine::MetricsEngine(const MetricsRegistry& registry) : registry_(registry) {}

void MetricsEngine::start(int combatId, const CombatContext& context) {
    started_ = true;
    combatId_ = combatId;
    context_ = context;
    counters_ = Counters{};

    trackers_ = registry_.createForCombat(model::toLower(context.className), context.mechanicTypes);
    for (auto& tracker : trackers_) {
        tracker->onStart(context_);
    }
}

void MetricsEngine::addTracker(std::unique_ptr<ITracker> tracker) {
    if (!tracker) {
        return;
    }
    if (started_) {
        tracker->onStart(context_);
    }
    trackers_.push_back(std::move(tracker));
}

SimResult<void> MetricsEngine::recordAttack(const combat::AttackResult& result) {
    if (!started_) {
        return SimResult<void>::err(
            SimError(ErrorCode::MetricsNotStarted, "recordAttack() called before start()"));
    }

    ++counters_.attacks;
    if (result.round > counters_.maxRound) {
        counters_.maxRound = result.round;
    }

    if (result.hit) {
        ++counters_.hits;
        counters_.totalDamage += result.totalDamage;
        counters_.weaponDamage += result.baseDamage;
        if (result.critical) {
            ++counters_.critHits;
            counters_.critBonusDamage += result.critDamage;
            if (!counters_.firstCritRound) {
                counters_.firstCritRound = result.round;
            }
        }
    } else {
        ++counters_.misses;
    }

    for (auto& tracker : trackers_) {
        tracker->onAttack(result);
    }
    return SimResult<void>::ok();
}

SimResult<RawMetrics> MetricsEngine::finalize() {
    if (!started_) {
        return SimResult<RawMetrics>::err(
            SimError(ErrorCode::MetricsNotStarted, "finalize() called before start()"));
    }

    namespace k = universal_keys;
    RawMetrics out;
    auto& u = out.universal;
    u[std::string(k::kCombatId)] = static_cast<int64_t>(combatId_);
    u[std::string(k::kWeapon)] = context_.weaponName;
    u[std::string(k::kAdvantage)] = context_.advantageRate;
    u[std::string(k::kEnemyAc)] = static_cast<int64_t>(context_.targetArmorClass);
    u[std::string(k::kEnemySize)] = context_.targetSize;
    u[std::string(k::kRoundsSimulated)] = static_cast<int64_t>(counters_.maxRound);
    u[std::string(k::kAttacksMade)] = counters_.attacks;
    u[std::string(k::kHits)] = counters_.hits;
    u[std::string(k::kMisses)] = counters_.misses;
    u[std::string(k::kCritHits)] = counters_.critHits;
    u[std::string(k::kNonCritHits)] = counters_.hits - counters_.critHits;
    u[std::string(k::kTotalDamage)] = counters_.totalDamage;
    u[std::string(k::kWeaponDamage)] = counters_.weaponDamage;
    u[std::string(k::kCritBonusDamage)] = counters_.critBonusDamage;
    if (counters_.firstCritRound) {
        u[std::string(k::kRoundsToFirstCrit)] = static_cast<int64_t>(*counters_.firstCritRound);
    }

    for (auto& tracker : trackers_) {
        auto& section = tracker->category() == TrackerCategory::Class
            ? out.classSpecific
            : out.mechanicSpecific;
        section[std::string(tracker->name())] = tracker->onEnd();
    }

    WBS_LOG_TRACE(LogCategory::Metrics,
                  "Combat " + std::to_string(combatId_) + " finalized with " +
                      std::to_string(trackers_.size()) + " tracker(s)");

    started_ = false;
    trackers_.clear();
    return SimResult<RawMetrics>::ok(std::move(out));
}

} // namespace wbs::metrics
