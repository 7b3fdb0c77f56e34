#pragma once

/// @file attack_resolver.hpp
/// @brief Resolves one attack into an AttackResult.
///
/// Pipeline for a single attack:
///   1. Effective advantage (explicit flag, else the combat's schedule)
///   2. To-hit: d20 + attack bonus + magic bonus against AC
///   3. Base damage (dice doubled on a critical) + flat bonuses
///   4. Weapon status effects, in definition order
///   5. Character damage modifiers, then triggered class features

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "wbs/combat/advantage_scheduler.hpp"
#include "wbs/combat/combat_types.hpp"
#include "wbs/dice/dice_expression.hpp"

namespace wbs::dice {
class DiceRoller;
} // namespace wbs::dice

namespace wbs::model {
struct DamageModifier;
struct ClassFeature;
} // namespace wbs::model

namespace wbs::combat {

/// Attack resolver bound to one combat's random stream.
///
/// Not thread-safe; one resolver per combat (or per worker).
class AttackResolver {
public:
    explicit AttackResolver(dice::DiceRoller& roller);

    /// Memoize the advantage schedule for a new combat.
    void beginCombat(AdvantageStrategy strategy);

    /// Resolve one attack.
    ///
    /// Mutates the weapon's status-effect state on a hit. Malformed dice
    /// strings in modifiers or features and an unknown target size are
    /// returned as errors.
    SimResult<AttackResult> resolveAttack(const AttackContext& ctx);

    /// Schedule memoized by beginCombat() or by the first attack that
    /// needed it; empty before either.
    [[nodiscard]] const std::optional<AdvantageStrategy>& strategy() const noexcept {
        return strategy_;
    }

private:
    bool effectiveAdvantage(const AttackContext& ctx);

    SimResult<dice::DiceExpression> parseCached(const std::string& text);

    SimResult<void> applyModifier(const model::DamageModifier& modifier,
                                  std::string_view suffix, AttackResult& result);

    SimResult<void> applyFeature(const model::ClassFeature& feature,
                                 const AttackContext& ctx, AttackResult& result);

    SimResult<void> applyCharacterModifiers(const AttackContext& ctx, AttackResult& result);

    dice::DiceRoller& roller_;
    std::optional<AdvantageStrategy> strategy_;
    std::unordered_map<std::string, dice::DiceExpression> diceCache_;
};

} // namespace wbs::combat
