#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

#include "tts/game/vitality.hpp"

using namespace tts::game;
using tts::foundation::ErrorCode;

namespace {

Character makePc(int32_t hp, int32_t maxHp = 20) {
    Character c;
    c.id = "elara";
    c.name = "Elara";
    c.type = CharacterType::PC;
    c.maxHp = maxHp;
    c.currentHp = hp;
    return c;
}

Character makeEnemy(int32_t hp, int32_t maxHp = 10) {
    Character c;
    c.id = "goblin-1";
    c.name = "Goblin";
    c.type = CharacterType::Enemy;
    c.maxHp = maxHp;
    c.currentHp = hp;
    return c;
}

/// PC already at 0 hp with Unconscious, as left by a knockdown.
Character makeDying() {
    auto c = makePc(1);
    EXPECT_TRUE(Vitality::setHp(c, 0).hasValue());
    return c;
}

}  // namespace

// ===========================================================================
// Hit points
// ===========================================================================

TEST(VitalityTest, DroppingToZeroMakesPcUnconscious) {
    auto c = makePc(3);
    ASSERT_TRUE(Vitality::setHp(c, 0).hasValue());

    EXPECT_EQ(c.currentHp, 0);
    EXPECT_EQ(c.conditions, std::vector<std::string>{"Unconscious"});
    EXPECT_EQ(c.deathSaveSuccesses, 0);
    EXPECT_EQ(c.deathSaveFailures, 0);
    EXPECT_EQ(Vitality::state(c), VitalityState::Unconscious);
    EXPECT_EQ(Vitality::combatStatus(c), CombatStatus::Unconscious);
}

TEST(VitalityTest, KnockdownStartsFreshDeathSaveClock) {
    auto c = makePc(5);
    c.deathSaveSuccesses = 2;
    c.deathSaveFailures = 1;
    ASSERT_TRUE(Vitality::setHp(c, 0).hasValue());
    EXPECT_EQ(c.deathSaveSuccesses, 0);
    EXPECT_EQ(c.deathSaveFailures, 0);
}

TEST(VitalityTest, SetHpClampsToRange) {
    auto c = makePc(10, 20);
    ASSERT_TRUE(Vitality::setHp(c, 50).hasValue());
    EXPECT_EQ(c.currentHp, 20);

    ASSERT_TRUE(Vitality::setHp(c, -4).hasValue());
    EXPECT_EQ(c.currentHp, 0);
    EXPECT_TRUE(c.hasCondition(kConditionUnconscious));
}

TEST(VitalityTest, HealingFromZeroClearsDyingState) {
    auto c = makeDying();
    ASSERT_TRUE(Vitality::recordDeathSaveFailure(c, 2).hasValue());

    ASSERT_TRUE(Vitality::heal(c, 4).hasValue());
    EXPECT_EQ(c.currentHp, 4);
    EXPECT_TRUE(c.conditions.empty());
    EXPECT_EQ(c.deathSaveSuccesses, 0);
    EXPECT_EQ(c.deathSaveFailures, 0);
    EXPECT_EQ(Vitality::state(c), VitalityState::Alive);
}

TEST(VitalityTest, HugeHealCapsAtMaxHp) {
    auto c = makePc(15, 20);
    ASSERT_TRUE(Vitality::heal(c, std::numeric_limits<int32_t>::max()).hasValue());
    EXPECT_EQ(c.currentHp, 20);

    auto dying = makeDying();
    ASSERT_TRUE(Vitality::heal(dying, std::numeric_limits<int32_t>::max()).hasValue());
    EXPECT_EQ(dying.currentHp, 20);
    EXPECT_EQ(Vitality::state(dying), VitalityState::Alive);
}

TEST(VitalityTest, HealingStableCharacterClearsStable) {
    auto c = makeDying();
    ASSERT_TRUE(Vitality::stabilize(c).hasValue());
    ASSERT_TRUE(Vitality::setHp(c, 1).hasValue());
    EXPECT_FALSE(c.isStable());
    EXPECT_EQ(c.deathSaveSuccesses, 0);
}

TEST(VitalityTest, OtherConditionsSurviveKnockdownAndRecovery) {
    auto c = makePc(6);
    c.addCondition("Poisoned");
    ASSERT_TRUE(Vitality::setHp(c, 0).hasValue());
    EXPECT_EQ(c.conditions, (std::vector<std::string>{"Poisoned", "Unconscious"}));
    ASSERT_TRUE(Vitality::setHp(c, 2).hasValue());
    EXPECT_EQ(c.conditions, std::vector<std::string>{"Poisoned"});
}

TEST(VitalityTest, NegativeAmountsAreRejected) {
    auto c = makePc(10);
    auto damage = Vitality::applyDamage(c, -1);
    ASSERT_TRUE(damage.hasError());
    EXPECT_EQ(damage.error().code(), ErrorCode::InvalidHitPoints);

    auto heal = Vitality::heal(c, -1);
    ASSERT_TRUE(heal.hasError());
    EXPECT_EQ(heal.error().code(), ErrorCode::InvalidHitPoints);

    auto temp = Vitality::setTemporaryHp(c, -1);
    ASSERT_TRUE(temp.hasError());
    EXPECT_EQ(c.currentHp, 10);
    EXPECT_EQ(c.temporaryHp, 0);
}

// ===========================================================================
// Damage
// ===========================================================================

TEST(VitalityTest, TemporaryHpAbsorbsFirst) {
    auto c = makePc(10);
    ASSERT_TRUE(Vitality::setTemporaryHp(c, 5).hasValue());

    ASSERT_TRUE(Vitality::applyDamage(c, 3).hasValue());
    EXPECT_EQ(c.temporaryHp, 2);
    EXPECT_EQ(c.currentHp, 10);

    ASSERT_TRUE(Vitality::applyDamage(c, 6).hasValue());
    EXPECT_EQ(c.temporaryHp, 0);
    EXPECT_EQ(c.currentHp, 6);
}

TEST(VitalityTest, MassiveDamageKillsOutright) {
    // 5 hp, max 20: 25 damage leaves an overflow of 20.
    auto c = makePc(5, 20);
    ASSERT_TRUE(Vitality::applyDamage(c, 25).hasValue());
    EXPECT_EQ(c.currentHp, 0);
    EXPECT_EQ(c.conditions, std::vector<std::string>{"Dead"});
    EXPECT_EQ(Vitality::state(c), VitalityState::Dead);
    EXPECT_EQ(Vitality::combatStatus(c), CombatStatus::Dead);
}

TEST(VitalityTest, OverflowBelowMaxOnlyKnocksDown) {
    auto c = makePc(5, 20);
    ASSERT_TRUE(Vitality::applyDamage(c, 24).hasValue());
    EXPECT_EQ(Vitality::state(c), VitalityState::Unconscious);
}

TEST(VitalityTest, DamageAtZeroDoesNotRecordFailures) {
    auto c = makeDying();
    ASSERT_TRUE(Vitality::applyDamage(c, 4).hasValue());
    EXPECT_EQ(c.deathSaveFailures, 0);
    EXPECT_EQ(Vitality::state(c), VitalityState::Unconscious);
}

TEST(VitalityTest, EnemyAtZeroIsDefeated) {
    auto goblin = makeEnemy(4);
    ASSERT_TRUE(Vitality::applyDamage(goblin, 4).hasValue());
    EXPECT_EQ(goblin.currentHp, 0);
    EXPECT_TRUE(goblin.conditions.empty());
    EXPECT_EQ(Vitality::combatStatus(goblin), CombatStatus::Defeated);
}

// ===========================================================================
// Death saves
// ===========================================================================

TEST(VitalityTest, ThreeFailuresKill) {
    auto c = makeDying();
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(Vitality::recordDeathSaveFailure(c, 1).hasValue());
    }
    EXPECT_EQ(c.deathSaveFailures, 3);
    EXPECT_EQ(c.conditions, std::vector<std::string>{"Dead"});
    EXPECT_FALSE(c.isStable());
    EXPECT_EQ(Vitality::state(c), VitalityState::Dead);
}

TEST(VitalityTest, CriticalFailureCountsTwice) {
    auto c = makeDying();
    ASSERT_TRUE(Vitality::recordDeathSaveFailure(c, 2).hasValue());
    EXPECT_EQ(c.deathSaveFailures, 2);
    ASSERT_TRUE(Vitality::recordDeathSaveFailure(c, 2).hasValue());
    EXPECT_EQ(c.deathSaveFailures, 3);
    EXPECT_TRUE(c.isDead());
}

TEST(VitalityTest, ThreeSuccessesStabilize) {
    auto c = makeDying();
    ASSERT_TRUE(Vitality::recordDeathSaveSuccess(c, 2).hasValue());
    EXPECT_EQ(Vitality::state(c), VitalityState::Unconscious);
    ASSERT_TRUE(Vitality::recordDeathSaveSuccess(c, 5).hasValue());
    EXPECT_EQ(c.deathSaveSuccesses, 3);
    EXPECT_EQ(c.conditions, std::vector<std::string>{"Stable"});
    EXPECT_EQ(Vitality::combatStatus(c), CombatStatus::Stable);
}

TEST(VitalityTest, StabilizeJumpsStraightToThreeSuccesses) {
    auto c = makeDying();
    c.deathSaveSuccesses = 1;
    c.deathSaveFailures = 2;

    ASSERT_TRUE(Vitality::stabilize(c).hasValue());
    EXPECT_EQ(c.deathSaveSuccesses, 3);
    EXPECT_EQ(c.conditions, std::vector<std::string>{"Stable"});
    EXPECT_TRUE(c.isStable());
}

TEST(VitalityTest, FailureWhileStableReopensDeathSaves) {
    auto c = makeDying();
    ASSERT_TRUE(Vitality::stabilize(c).hasValue());

    ASSERT_TRUE(Vitality::recordDeathSaveFailure(c, 1).hasValue());
    EXPECT_FALSE(c.isStable());
    EXPECT_TRUE(c.hasCondition(kConditionUnconscious));
    EXPECT_EQ(c.deathSaveSuccesses, 0);
    EXPECT_EQ(c.deathSaveFailures, 1);
}

TEST(VitalityTest, HugeFailureCountSaturates) {
    auto c = makeDying();
    ASSERT_TRUE(Vitality::recordDeathSaveFailure(c, 1).hasValue());
    ASSERT_TRUE(
        Vitality::recordDeathSaveFailure(c, std::numeric_limits<int32_t>::max()).hasValue());
    EXPECT_EQ(c.deathSaveFailures, 3);
    EXPECT_EQ(Vitality::state(c), VitalityState::Dead);
}

TEST(VitalityTest, HugeSuccessCountSaturates) {
    auto c = makeDying();
    ASSERT_TRUE(Vitality::recordDeathSaveSuccess(c, 2).hasValue());
    ASSERT_TRUE(
        Vitality::recordDeathSaveSuccess(c, std::numeric_limits<int32_t>::max()).hasValue());
    EXPECT_EQ(c.deathSaveSuccesses, 3);
    EXPECT_EQ(Vitality::state(c), VitalityState::Stable);
}

TEST(VitalityTest, DeathSavesRequireZeroHp) {
    auto c = makePc(7);
    auto result = Vitality::recordDeathSaveSuccess(c, 1);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CharacterNotDying);
    EXPECT_EQ(c.deathSaveSuccesses, 0);

    auto stab = Vitality::stabilize(c);
    ASSERT_TRUE(stab.hasError());
    EXPECT_EQ(stab.error().code(), ErrorCode::CharacterNotDying);
}

TEST(VitalityTest, DeathSavesOnlyForPlayers) {
    auto goblin = makeEnemy(0);
    auto result = Vitality::recordDeathSaveFailure(goblin, 1);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DeathSaveNotApplicable);
}

TEST(VitalityTest, NegativeDeathSaveCountRejected) {
    auto c = makeDying();
    auto result = Vitality::recordDeathSaveFailure(c, -1);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidDeathSaveCount);
    EXPECT_EQ(c.deathSaveFailures, 0);
}

// ===========================================================================
// Death is sticky
// ===========================================================================

TEST(VitalityTest, HealingDeadCharacterFails) {
    auto c = makeDying();
    Vitality::markDead(c);

    auto result = Vitality::heal(c, 10);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CharacterIsDead);
    EXPECT_EQ(c.currentHp, 0);
    EXPECT_TRUE(c.isDead());
}

TEST(VitalityTest, DeathSavesOnDeadCharacterFail) {
    auto c = makeDying();
    Vitality::markDead(c);
    auto result = Vitality::recordDeathSaveSuccess(c, 1);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CharacterIsDead);
}

TEST(VitalityTest, ReplacingConditionsRevives) {
    auto c = makeDying();
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(Vitality::recordDeathSaveFailure(c, 1).hasValue());
    }
    ASSERT_EQ(Vitality::state(c), VitalityState::Dead);

    // Back to dying at 0 hp with a fresh clock, not one failure from death.
    Vitality::setConditions(c, {});
    EXPECT_EQ(Vitality::state(c), VitalityState::Unconscious);
    EXPECT_EQ(c.conditions, std::vector<std::string>{"Unconscious"});
    EXPECT_EQ(c.deathSaveFailures, 0);
    EXPECT_EQ(c.deathSaveSuccesses, 0);

    ASSERT_TRUE(Vitality::recordDeathSaveFailure(c, 1).hasValue());
    EXPECT_EQ(Vitality::state(c), VitalityState::Unconscious);

    ASSERT_TRUE(Vitality::setHp(c, 5).hasValue());
    EXPECT_EQ(Vitality::state(c), VitalityState::Alive);
}

TEST(VitalityTest, ReplacingConditionsDropsStable) {
    auto c = makeDying();
    ASSERT_TRUE(Vitality::stabilize(c).hasValue());
    ASSERT_EQ(c.deathSaveSuccesses, 3);

    Vitality::setConditions(c, {"Prone"});
    EXPECT_EQ(Vitality::state(c), VitalityState::Unconscious);
    EXPECT_EQ(c.conditions, (std::vector<std::string>{"Prone", "Unconscious"}));
    EXPECT_EQ(c.deathSaveSuccesses, 0);
    EXPECT_EQ(c.deathSaveFailures, 0);
}

TEST(VitalityTest, ReplacingConditionsWithStableSetsSuccesses) {
    auto c = makeDying();
    ASSERT_TRUE(Vitality::recordDeathSaveFailure(c, 1).hasValue());

    Vitality::setConditions(c, {"Stable"});
    EXPECT_EQ(Vitality::state(c), VitalityState::Stable);
    EXPECT_FALSE(c.hasCondition(kConditionUnconscious));
    EXPECT_EQ(c.deathSaveSuccesses, 3);
}

// ===========================================================================
// Conditions
// ===========================================================================

TEST(VitalityTest, AddingDeadConditionMarksDead) {
    auto c = makePc(12);
    Vitality::addCondition(c, "Dead");
    EXPECT_EQ(c.currentHp, 0);
    EXPECT_EQ(Vitality::state(c), VitalityState::Dead);
}

TEST(VitalityTest, SetConditionsDropsDuplicates) {
    auto c = makePc(12);
    Vitality::setConditions(c, {"Prone", "Blinded", "Prone"});
    EXPECT_EQ(c.conditions, (std::vector<std::string>{"Prone", "Blinded"}));

    Vitality::removeCondition(c, "Prone");
    EXPECT_EQ(c.conditions, std::vector<std::string>{"Blinded"});
}
