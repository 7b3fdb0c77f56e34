#pragma once

/// @file builtin_trackers.hpp
/// @brief Trackers shipped with the simulator. Both self-register, so
///        including this header is only needed to use them directly.

#include <cstdint>
#include <optional>
#include <string_view>

#include "wbs/metrics/tracker.hpp"

namespace wbs::metrics {

/// Bleed/hemorrhage accounting; registered for mechanic "bleed".
class HemorrhageTracker final : public ITracker {
public:
    static constexpr std::string_view kName = "bleed";

    [[nodiscard]] TrackerCategory category() const override { return TrackerCategory::Mechanic; }
    [[nodiscard]] std::string_view name() const override { return kName; }

    void onStart(const CombatContext& context) override;
    void onAttack(const combat::AttackResult& result) override;

    /// bleed_damage, bleed_counter_added, bleed_from_crits,
    /// bleed_from_non_crits, bleed_threshold, hemorrhages_triggered and,
    /// when one occurred, rounds_to_first_hemorrhage.
    [[nodiscard]] MetricMap onEnd() override;

private:
    int64_t bleedDamage_ = 0;
    int64_t counterAdded_ = 0;
    int64_t fromCrits_ = 0;
    int64_t fromNonCrits_ = 0;
    int64_t threshold_ = 0;
    int64_t hemorrhages_ = 0;
    std::optional<int> firstHemorrhageRound_;
};

/// Sneak Attack accounting; registered for class "rogue".
class SneakAttackTracker final : public ITracker {
public:
    static constexpr std::string_view kName = "rogue";

    [[nodiscard]] TrackerCategory category() const override { return TrackerCategory::Class; }
    [[nodiscard]] std::string_view name() const override { return kName; }

    void onStart(const CombatContext& context) override;
    void onAttack(const combat::AttackResult& result) override;
    [[nodiscard]] MetricMap onEnd() override;

private:
    int64_t damage_ = 0;
    int64_t landed_ = 0;
};

} // namespace wbs::metrics
