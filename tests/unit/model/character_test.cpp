#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "wbs/model/character.hpp"
#include "wbs/model/rogue.hpp"
#include "wbs/model/weapon.hpp"

using namespace wbs::model;
using wbs::foundation::ErrorCode;

namespace {

CharacterDefinition fighter() {
    CharacterDefinition def;
    def.name = "Test Fighter";
    def.className = "Fighter";
    def.level = 5;
    def.proficiencyBonus = 3;
    def.attackModifiers.push_back(AttackModifier{"Strength", 4, std::nullopt});
    def.attackModifiers.push_back(AttackModifier{"Proficiency", 3, std::nullopt});
    def.damageModifiers.push_back(DamageModifier{"Strength", ModifierTrigger::Always, 4, std::nullopt});
    def.damageModifiers.push_back(DamageModifier{"Dueling", ModifierTrigger::Always, 2, std::nullopt});
    def.damageModifiers.push_back(DamageModifier{"Hex", ModifierTrigger::Hit, 0, std::string("1d6")});
    return def;
}

WeaponDefinition weaponWith(std::vector<std::string> properties) {
    WeaponDefinition w;
    w.name = "Test Blade";
    w.properties = std::move(properties);
    return w;
}

} // namespace

// ---------------------------------------------------------------------------
// CharacterInstance
// ---------------------------------------------------------------------------

TEST(CharacterInstanceTest, DerivedBonuses) {
    auto character = CharacterInstance::create(fighter());
    ASSERT_TRUE(character.hasValue());
    EXPECT_EQ(character.value().attackBonus(), 7);
    EXPECT_EQ(character.value().flatDamageBonus(), 6);
    EXPECT_EQ(character.value().critRange(), 20);
    EXPECT_EQ(character.value().trackerKey(), "fighter");
}

TEST(CharacterInstanceTest, CritRangeIsMinimumAcrossSources) {
    auto def = fighter();
    def.attackModifiers.push_back(AttackModifier{"Keen", 0, 19});
    ClassFeature champion;
    champion.name = "Improved Critical";
    champion.effectType = FeatureEffectType::CritRange;
    champion.value = 18;
    def.features.push_back(champion);

    auto character = CharacterInstance::create(def);
    ASSERT_TRUE(character.hasValue());
    EXPECT_EQ(character.value().critRange(), 18);
}

TEST(CharacterInstanceTest, PassiveHitBonusFeature) {
    auto def = fighter();
    ClassFeature archery;
    archery.name = "Archery";
    archery.effectType = FeatureEffectType::HitBonus;
    archery.value = 2;
    def.features.push_back(archery);

    auto character = CharacterInstance::create(def);
    ASSERT_TRUE(character.hasValue());
    EXPECT_EQ(character.value().attackBonus(), 9);
    EXPECT_TRUE(character.value().getTriggeredFeatures(FeatureTrigger::Hit).empty());
}

TEST(CharacterInstanceTest, DamageModifiersByTrigger) {
    auto character = CharacterInstance::create(fighter());
    ASSERT_TRUE(character.hasValue());
    auto onHit = character.value().getDamageModifiers(ModifierTrigger::Hit);
    ASSERT_EQ(onHit.size(), 1u);
    EXPECT_EQ(onHit[0]->name, "Hex");
    EXPECT_EQ(character.value().getDamageModifiers(ModifierTrigger::Always).size(), 2u);
    EXPECT_TRUE(character.value().getDamageModifiers(ModifierTrigger::Critical).empty());
}

TEST(CharacterInstanceTest, InvalidDefinitionsRejected) {
    auto lowLevel = fighter();
    lowLevel.level = 0;
    EXPECT_EQ(CharacterInstance::create(lowLevel).error().code(), ErrorCode::InvalidCharacter);

    auto highLevel = fighter();
    highLevel.level = 21;
    EXPECT_EQ(CharacterInstance::create(highLevel).error().code(), ErrorCode::InvalidCharacter);

    auto negativeProficiency = fighter();
    negativeProficiency.proficiencyBonus = -1;
    EXPECT_TRUE(CharacterInstance::create(negativeProficiency).hasError());

    auto badCrit = fighter();
    badCrit.attackModifiers.push_back(AttackModifier{"Broken", 0, 1});
    EXPECT_EQ(CharacterInstance::create(badCrit).error().code(), ErrorCode::InvalidCharacter);
}

// ---------------------------------------------------------------------------
// FeatureEligibility
// ---------------------------------------------------------------------------

TEST(FeatureEligibilityTest, AdvantageAndAnyProperty) {
    FeatureEligibility sneak{true, {"finesse", "ranged", "thrown"}};

    EXPECT_TRUE(sneak.isSatisfied(true, weaponWith({"finesse"})));
    EXPECT_TRUE(sneak.isSatisfied(true, weaponWith({"Thrown", "light"})));
    EXPECT_FALSE(sneak.isSatisfied(false, weaponWith({"finesse"})));
    EXPECT_FALSE(sneak.isSatisfied(true, weaponWith({"heavy"})));
}

TEST(FeatureEligibilityTest, EmptyPropertyListMatchesAnyWeapon) {
    FeatureEligibility anyWeapon{false, {}};
    EXPECT_TRUE(anyWeapon.isSatisfied(false, weaponWith({})));
}

// ---------------------------------------------------------------------------
// Rogue progression
// ---------------------------------------------------------------------------

TEST(RogueTest, ProficiencyByLevel) {
    EXPECT_EQ(rogueProficiencyBonus(1), 2);
    EXPECT_EQ(rogueProficiencyBonus(4), 2);
    EXPECT_EQ(rogueProficiencyBonus(5), 3);
    EXPECT_EQ(rogueProficiencyBonus(9), 4);
    EXPECT_EQ(rogueProficiencyBonus(13), 5);
    EXPECT_EQ(rogueProficiencyBonus(17), 6);
    EXPECT_EQ(rogueProficiencyBonus(20), 6);
}

TEST(RogueTest, SneakAttackDiceByLevel) {
    EXPECT_EQ(sneakAttackDice(1).count, 1);
    EXPECT_EQ(sneakAttackDice(2).count, 1);
    EXPECT_EQ(sneakAttackDice(5).count, 3);
    EXPECT_EQ(sneakAttackDice(20).count, 10);
    EXPECT_EQ(sneakAttackDice(5).sides, 6);
}

TEST(RogueTest, MakeRogue) {
    auto rogue = makeRogue(5);
    ASSERT_TRUE(rogue.hasValue());
    const auto& r = rogue.value();
    EXPECT_EQ(r.name(), "Rogue 5");
    EXPECT_EQ(r.className(), "Rogue");
    EXPECT_EQ(r.trackerKey(), "rogue");
    EXPECT_EQ(r.proficiencyBonus(), 3);
    EXPECT_EQ(r.attackBonus(), 7);
    EXPECT_EQ(r.flatDamageBonus(), 4);

    auto features = r.getTriggeredFeatures(FeatureTrigger::Hit);
    ASSERT_EQ(features.size(), 1u);
    EXPECT_EQ(features[0]->name, "Sneak Attack");
    ASSERT_TRUE(features[0]->dice.has_value());
    EXPECT_EQ(*features[0]->dice, "3d6");
    ASSERT_TRUE(features[0]->eligibility.has_value());
    EXPECT_TRUE(features[0]->eligibility->requiresAdvantage);
}

TEST(RogueTest, LevelOutOfRangeRejected) {
    EXPECT_EQ(makeRogue(0).error().code(), ErrorCode::InvalidCharacter);
    EXPECT_EQ(makeRogue(21).error().code(), ErrorCode::InvalidCharacter);
}
