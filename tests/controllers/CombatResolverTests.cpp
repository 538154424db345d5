/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file CombatResolverTests.cpp
 * @brief Tests for attack resolution, armor and disengage math
 *
 * Tests cover:
 * - Modifier penalties and clamping of accuracy/avoidance
 * - The opposed d100 contest
 * - Critical, glancing and normal hits with scripted dice
 * - Maneuver bonuses and multipliers
 * - Armor absorption, secondary damage types and durability breakage
 * - Weapon wear, extra wear and breakage
 * - Disengage chance, initiative and attack interval
 * - Combatant views over entity payloads
 */

#define BOOST_TEST_MODULE CombatResolverTests
#include <boost/test/unit_test.hpp>

#include "controllers/combat/CombatResolver.hpp"
#include "mocks/MockDiceRoller.hpp"

using namespace AnchorMud;

namespace {

CombatStats fighterStats()
{
    CombatStats stats;
    stats.hpMax = 20;
    stats.hpCurrent = 20;
    stats.staminaMax = 10;
    stats.staminaCurrent = 10;
    stats.accuracy = 55;
    stats.avoidance = 40;
    return stats;
}

CombatStats ratStats()
{
    CombatStats stats;
    stats.hpMax = 6;
    stats.hpCurrent = 6;
    stats.accuracy = 40;
    stats.avoidance = 20;
    stats.hasNaturalAttack = true;
    stats.naturalAttack.verb = "bite";
    stats.naturalAttack.minDamage = 1;
    stats.naturalAttack.maxDamage = 2;
    stats.naturalAttack.damageType = DamageType::Piercing;
    stats.naturalAttack.critChance = 0.0f;
    return stats;
}

WeaponState ironSword(int durability)
{
    WeaponState weapon;
    weapon.templateId = "sword";
    weapon.name = "an iron sword";
    weapon.profile.verb = "slash";
    weapon.profile.minDamage = 3;
    weapon.profile.maxDamage = 5;
    weapon.profile.damageType = DamageType::Slashing;
    weapon.profile.critChance = 0.0f;
    weapon.durability = durability;
    weapon.maxDurability = 20;
    return weapon;
}

ArmorPiece leatherCap(int durability)
{
    ArmorPiece piece;
    piece.templateId = "cap";
    piece.name = "a leather cap";
    piece.stats.slot = ArmorSlot::Head;
    piece.stats.reduction = 2;
    piece.stats.primaryTypes = damageBit(DamageType::Slashing);
    piece.stats.secondaryTypes = damageBit(DamageType::Piercing);
    piece.stats.maxDurability = 5;
    piece.durability = durability;
    return piece;
}

EntityInstance playerInstance(const CombatStats& stats)
{
    PlayerData data;
    data.combat = stats;
    return EntityInstance("player", "Ayla", std::move(data));
}

EntityInstance creatureInstance(const CombatStats& stats)
{
    return EntityInstance("rat", "a giant rat", CreatureData{stats});
}

const EntityHandle PLAYER_HANDLE(1, EntityKind::Player, 1);
const EntityHandle RAT_HANDLE(2, EntityKind::Creature, 1);

} // namespace

struct ResolverFixture
{
    RuntimeSettings settings;
    CombatResolver resolver{settings};
    MockDiceRoller dice;
};

// ============================================================================
// MODIFIERS AND CONTEST
// ============================================================================

BOOST_AUTO_TEST_SUITE(ContestTests)

BOOST_AUTO_TEST_CASE(TestEffectiveAccuracy)
{
    BOOST_CHECK_EQUAL(CombatResolver::effectiveAccuracy(55, CombatModifier::NONE, 10), 65);
    BOOST_CHECK_EQUAL(CombatResolver::effectiveAccuracy(55, CombatModifier::STAGGERED, 10), 50);
    BOOST_CHECK_EQUAL(CombatResolver::effectiveAccuracy(5, CombatModifier::STAGGERED, 0), 1);
    BOOST_CHECK_EQUAL(CombatResolver::effectiveAccuracy(120, CombatModifier::NONE, 0), 99);
}

BOOST_AUTO_TEST_CASE(TestEffectiveAvoidance)
{
    BOOST_CHECK_EQUAL(CombatResolver::effectiveAvoidance(40, CombatModifier::NONE), 40);
    BOOST_CHECK_EQUAL(CombatResolver::effectiveAvoidance(40, CombatModifier::EXPOSED), 25);
    BOOST_CHECK_EQUAL(CombatResolver::effectiveAvoidance(40, CombatModifier::PINNED), 15);
    BOOST_CHECK_EQUAL(
        CombatResolver::effectiveAvoidance(40, CombatModifier::EXPOSED | CombatModifier::PINNED), 1);
}

BOOST_AUTO_TEST_CASE(TestContestHits)
{
    // Attacker makes the roll and beats the defender's roll
    BOOST_CHECK(CombatResolver::contestHits(30, 55, 60, 40));
    // Attacker misses outright
    BOOST_CHECK(!CombatResolver::contestHits(60, 55, 90, 40));
    // Both succeed, defender rolled lower: parried
    BOOST_CHECK(!CombatResolver::contestHits(30, 55, 20, 40));
    // Both succeed on paper but the defender failed its own roll
    BOOST_CHECK(CombatResolver::contestHits(50, 55, 45, 40));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ATTACK RESOLUTION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ResolveAttackTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestMissLeavesEverythingUntouched)
{
    CombatStats attackerStats = fighterStats();
    attackerStats.weapon = ironSword(10);
    auto attackerInstance = playerInstance(attackerStats);
    auto defenderInstance = creatureInstance(ratStats());
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    dice.queueRolls({70, 10});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, AttackContext{}, dice);

    BOOST_CHECK(!outcome.hit);
    BOOST_CHECK_EQUAL(outcome.attackRoll, 70);
    BOOST_CHECK_EQUAL(outcome.defenseRoll, 10);
    BOOST_CHECK_EQUAL(outcome.finalDamage, 0);
    BOOST_CHECK_EQUAL(defender->getHitPoints(), 6);
    BOOST_CHECK_EQUAL(attackerInstance.combat()->weapon->durability, 10);
    BOOST_CHECK_EQUAL(dice.getUnitCalls(), 0);
}

BOOST_AUTO_TEST_CASE(TestNormalHitWithWeapon)
{
    CombatStats attackerStats = fighterStats();
    attackerStats.weapon = ironSword(20);
    auto attackerInstance = playerInstance(attackerStats);
    auto defenderInstance = creatureInstance(ratStats());
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    dice.queueRolls({30, 60, 4});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, AttackContext{}, dice);

    BOOST_CHECK(outcome.hit);
    BOOST_CHECK(!outcome.critical);
    BOOST_CHECK(!outcome.glancing);
    BOOST_CHECK_EQUAL(outcome.verb, "slash");
    BOOST_CHECK_EQUAL(outcome.effectiveAccuracy, 55);
    BOOST_CHECK_EQUAL(outcome.effectiveAvoidance, 20);
    BOOST_CHECK_EQUAL(outcome.rawDamage, 4);
    BOOST_CHECK_EQUAL(outcome.finalDamage, 4);
    BOOST_CHECK_EQUAL(outcome.remainingHitPoints, 2);
    BOOST_CHECK(!outcome.killed);
    BOOST_CHECK_EQUAL(defenderInstance.combat()->hpCurrent, 2);
    BOOST_CHECK_EQUAL(attackerInstance.combat()->weapon->durability, 19);
}

BOOST_AUTO_TEST_CASE(TestLowRollIsCritical)
{
    CombatStats attackerStats = fighterStats();
    attackerStats.weapon = ironSword(20);
    auto attackerInstance = playerInstance(attackerStats);
    auto defenderInstance = creatureInstance(ratStats());
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    // 3 <= 55 / 10
    dice.queueRolls({3, 50, 4});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, AttackContext{}, dice);

    BOOST_CHECK(outcome.critical);
    BOOST_CHECK_EQUAL(outcome.rawDamage, 8);
    BOOST_CHECK(outcome.killed);
    BOOST_CHECK_EQUAL(outcome.remainingHitPoints, 0);
    BOOST_CHECK(!defender->isAlive());
}

BOOST_AUTO_TEST_CASE(TestCritChanceRollIsCritical)
{
    auto attackerInstance = playerInstance(fighterStats());
    auto defenderInstance = creatureInstance(ratStats());
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    dice.queueRolls({30, 60});
    dice.queueUnits({0.005f});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, AttackContext{}, dice);

    BOOST_CHECK(outcome.critical);
    BOOST_CHECK_EQUAL(outcome.verb, "punch");
    BOOST_CHECK_EQUAL(outcome.rawDamage, 2);
    BOOST_CHECK_EQUAL(defender->getHitPoints(), 4);
}

BOOST_AUTO_TEST_CASE(TestGlancingHitHalvesDamage)
{
    CombatStats attackerStats = fighterStats();
    attackerStats.weapon = ironSword(20);
    CombatStats defenderStats = fighterStats();
    auto attackerInstance = playerInstance(attackerStats);
    auto defenderInstance = creatureInstance(defenderStats);
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    // Defense 35 sits in [ceil(0.8 * 40), 40]
    dice.queueRolls({20, 35, 5});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, AttackContext{}, dice);

    BOOST_CHECK(outcome.hit);
    BOOST_CHECK(outcome.glancing);
    BOOST_CHECK_EQUAL(outcome.rawDamage, 2);
    BOOST_CHECK_EQUAL(defender->getHitPoints(), 18);
}

BOOST_AUTO_TEST_CASE(TestGlancingNeverDropsBelowOne)
{
    auto attackerInstance = playerInstance(fighterStats());
    auto defenderInstance = creatureInstance(fighterStats());
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    dice.queueRolls({20, 38});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, AttackContext{}, dice);

    BOOST_CHECK(outcome.glancing);
    BOOST_CHECK_EQUAL(outcome.rawDamage, 1);
}

BOOST_AUTO_TEST_CASE(TestManeuverBonusesApply)
{
    CombatStats attackerStats = fighterStats();
    attackerStats.weapon = ironSword(20);
    auto attackerInstance = playerInstance(attackerStats);
    auto defenderInstance = creatureInstance(fighterStats());
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    AttackContext context;
    context.accuracyBonus = 10;
    context.damageBonus = 2;
    context.damageMultiplier = 1.5f;

    // 62 would miss at 55 but lands at 65
    dice.queueRolls({62, 90, 4});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, context, dice);

    BOOST_CHECK_EQUAL(outcome.effectiveAccuracy, 65);
    BOOST_CHECK(outcome.hit);
    BOOST_CHECK_EQUAL(outcome.rawDamage, 9);
    BOOST_CHECK_EQUAL(defender->getHitPoints(), 11);
}

BOOST_AUTO_TEST_CASE(TestExposedDefenderIsEasierToHit)
{
    auto attackerInstance = playerInstance(fighterStats());
    auto defenderInstance = creatureInstance(fighterStats());
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    AttackContext context;
    context.defenderModifiers = CombatModifier::EXPOSED;

    // Defender rolls 30: a success at 40, a failure at 25
    dice.queueRolls({40, 30});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, context, dice);

    BOOST_CHECK_EQUAL(outcome.effectiveAvoidance, 25);
    BOOST_CHECK(outcome.hit);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ARMOR
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ArmorTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestPrimaryAndSecondaryReduction)
{
    ArmorPiece cap = leatherCap(5);
    BOOST_CHECK_EQUAL(resolver.reductionFor(cap, DamageType::Slashing), 2);
    BOOST_CHECK_EQUAL(resolver.reductionFor(cap, DamageType::Piercing), 1);
    BOOST_CHECK_EQUAL(resolver.reductionFor(cap, DamageType::Fire), 0);
}

BOOST_AUTO_TEST_CASE(TestArmorAbsorbsAndWears)
{
    std::vector<ArmorPiece> armor{leatherCap(5)};
    std::vector<ArmorAbsorption> absorptions;

    int remaining = resolver.applyArmor(4, DamageType::Slashing, armor, absorptions);

    BOOST_CHECK_EQUAL(remaining, 2);
    BOOST_CHECK_EQUAL(armor[0].durability, 3);
    BOOST_REQUIRE_EQUAL(absorptions.size(), 1u);
    BOOST_CHECK_EQUAL(absorptions[0].absorbed, 2);
    BOOST_CHECK(!absorptions[0].broke);
}

BOOST_AUTO_TEST_CASE(TestArmorBreaksOnceAndIsThenIgnored)
{
    std::vector<ArmorPiece> armor{leatherCap(1)};
    std::vector<ArmorAbsorption> absorptions;

    int remaining = resolver.applyArmor(5, DamageType::Slashing, armor, absorptions);
    BOOST_CHECK_EQUAL(remaining, 4);
    BOOST_REQUIRE_EQUAL(absorptions.size(), 1u);
    BOOST_CHECK(absorptions[0].broke);
    BOOST_CHECK(armor[0].isBroken());

    absorptions.clear();
    remaining = resolver.applyArmor(5, DamageType::Slashing, armor, absorptions);
    BOOST_CHECK_EQUAL(remaining, 5);
    BOOST_CHECK(absorptions.empty());
}

BOOST_AUTO_TEST_CASE(TestArmorPiecesStack)
{
    std::vector<ArmorPiece> armor{leatherCap(5), leatherCap(5)};
    armor[1].name = "a leather vest";
    std::vector<ArmorAbsorption> absorptions;

    int remaining = resolver.applyArmor(3, DamageType::Slashing, armor, absorptions);

    BOOST_CHECK_EQUAL(remaining, 0);
    BOOST_REQUIRE_EQUAL(absorptions.size(), 2u);
    BOOST_CHECK_EQUAL(absorptions[0].absorbed, 2);
    BOOST_CHECK_EQUAL(absorptions[1].absorbed, 1);
    BOOST_CHECK_EQUAL(absorptions[1].pieceName, "a leather vest");
}

BOOST_AUTO_TEST_CASE(TestSecondaryRateFromSettings)
{
    RuntimeSettings fullRate;
    fullRate.secondaryArmorRate = 1.0f;
    CombatResolver strict(fullRate);
    BOOST_CHECK_EQUAL(strict.reductionFor(leatherCap(5), DamageType::Piercing), 2);
}

BOOST_AUTO_TEST_CASE(TestResolveAttackRunsThroughArmor)
{
    CombatStats attackerStats = fighterStats();
    attackerStats.weapon = ironSword(20);
    CombatStats defenderStats = ratStats();
    defenderStats.armor.push_back(leatherCap(5));
    auto attackerInstance = playerInstance(attackerStats);
    auto defenderInstance = creatureInstance(defenderStats);
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    dice.queueRolls({30, 60, 4});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, AttackContext{}, dice);

    BOOST_CHECK_EQUAL(outcome.rawDamage, 4);
    BOOST_CHECK_EQUAL(outcome.finalDamage, 2);
    BOOST_CHECK_EQUAL(defenderInstance.combat()->armor[0].durability, 3);
    BOOST_CHECK_EQUAL(defender->getHitPoints(), 4);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// WEAPON WEAR
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(WeaponWearTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestWeaponBreaksAtZero)
{
    CombatStats attackerStats = fighterStats();
    attackerStats.weapon = ironSword(1);
    auto attackerInstance = playerInstance(attackerStats);
    auto defenderInstance = creatureInstance(fighterStats());
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    dice.queueRolls({30, 90, 3});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, AttackContext{}, dice);

    BOOST_CHECK(outcome.weaponBroke);
    BOOST_CHECK_EQUAL(outcome.weaponName, "an iron sword");
    BOOST_CHECK(!attacker->hasWeapon());
    BOOST_CHECK_EQUAL(attacker->getAttackProfile().verb, "punch");
}

BOOST_AUTO_TEST_CASE(TestExtraWearChance)
{
    CombatStats attackerStats = fighterStats();
    attackerStats.weapon = ironSword(5);
    auto attackerInstance = playerInstance(attackerStats);
    auto defenderInstance = creatureInstance(fighterStats());
    auto attacker = makeCombatant(PLAYER_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(RAT_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    AttackContext context;
    context.extraWearChance = 0.5f;

    dice.queueRolls({30, 90, 3});
    dice.queueUnits({0.99f, 0.1f});
    resolver.resolveAttack(*attacker, *defender, context, dice);

    BOOST_CHECK_EQUAL(attackerInstance.combat()->weapon->durability, 3);
}

BOOST_AUTO_TEST_CASE(TestNaturalAttacksNeverWear)
{
    auto attackerInstance = creatureInstance(ratStats());
    auto defenderInstance = playerInstance(fighterStats());
    auto attacker = makeCombatant(RAT_HANDLE, attackerInstance, resolver.getUnarmedProfile());
    auto defender = makeCombatant(PLAYER_HANDLE, defenderInstance, resolver.getUnarmedProfile());

    dice.queueRolls({10, 90, 2});
    AttackOutcome outcome = resolver.resolveAttack(*attacker, *defender, AttackContext{}, dice);

    BOOST_CHECK(outcome.hit);
    BOOST_CHECK_EQUAL(outcome.verb, "bite");
    BOOST_CHECK(!outcome.weaponBroke);
    BOOST_CHECK(outcome.weaponName.empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// DISENGAGE, INITIATIVE, PACING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(PacingTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestDisengageChance)
{
    BOOST_CHECK_EQUAL(resolver.disengageChance(40, 30, 0), 40);
    BOOST_CHECK_EQUAL(resolver.disengageChance(40, 70, 0), 20);
    BOOST_CHECK_EQUAL(resolver.disengageChance(40, 70, 30), 5);
    BOOST_CHECK_EQUAL(resolver.disengageChance(99, 0, 0), 95);
}

BOOST_AUTO_TEST_CASE(TestResolveDisengage)
{
    dice.queueRolls({40, 41});
    BOOST_CHECK(resolver.resolveDisengage(40, 30, 0, dice));
    BOOST_CHECK(!resolver.resolveDisengage(40, 30, 0, dice));
}

BOOST_AUTO_TEST_CASE(TestRollInitiative)
{
    CombatStats stats = fighterStats();
    stats.initiativeBonus = 3;
    auto instance = playerInstance(stats);
    auto view = makeCombatant(PLAYER_HANDLE, instance, resolver.getUnarmedProfile());

    dice.queueRolls({12});
    BOOST_CHECK_EQUAL(resolver.rollInitiative(*view, dice), 15);
}

BOOST_AUTO_TEST_CASE(TestAttackInterval)
{
    BOOST_CHECK_CLOSE(resolver.attackInterval(1.0f), 3.0, 0.001);
    BOOST_CHECK_CLOSE(resolver.attackInterval(0.5f), 1.5, 0.001);
    BOOST_CHECK_CLOSE(resolver.attackInterval(0.01f), 0.2, 0.01);
}

BOOST_AUTO_TEST_CASE(TestUnarmedProfile)
{
    const AttackProfile& unarmed = resolver.getUnarmedProfile();
    BOOST_CHECK_EQUAL(unarmed.verb, "punch");
    BOOST_CHECK_EQUAL(unarmed.minDamage, 1);
    BOOST_CHECK_EQUAL(unarmed.maxDamage, 1);
    BOOST_CHECK(unarmed.damageType == DamageType::Bludgeoning);
    BOOST_CHECK_CLOSE(unarmed.critChance, 0.01f, 0.001);

    RuntimeSettings inverted;
    inverted.unarmedMinDamage = 2;
    inverted.unarmedMaxDamage = 1;
    CombatResolver other(inverted);
    BOOST_CHECK_EQUAL(other.getUnarmedProfile().maxDamage, 2);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// COMBATANT VIEWS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(CombatantTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestProfilePrecedence)
{
    CombatStats stats = ratStats();
    auto natural = creatureInstance(stats);
    auto view = makeCombatant(RAT_HANDLE, natural, resolver.getUnarmedProfile());
    BOOST_CHECK_EQUAL(view->getAttackProfile().verb, "bite");

    stats.weapon = ironSword(5);
    stats.weapon->profile.accuracyBonus = 5;
    auto armed = creatureInstance(stats);
    auto armedView = makeCombatant(RAT_HANDLE, armed, resolver.getUnarmedProfile());
    BOOST_CHECK_EQUAL(armedView->getAttackProfile().verb, "slash");
    BOOST_CHECK_EQUAL(armedView->getAccuracy(), 45);

    auto bare = playerInstance(fighterStats());
    auto bareView = makeCombatant(PLAYER_HANDLE, bare, resolver.getUnarmedProfile());
    BOOST_CHECK_EQUAL(bareView->getAttackProfile().verb, "punch");
}

BOOST_AUTO_TEST_CASE(TestSidesAndDeathRules)
{
    auto player = playerInstance(fighterStats());
    auto rat = creatureInstance(ratStats());
    auto playerView = makeCombatant(PLAYER_HANDLE, player, resolver.getUnarmedProfile());
    auto ratView = makeCombatant(RAT_HANDLE, rat, resolver.getUnarmedProfile());

    BOOST_CHECK(playerView->getSide() == CombatSide::Players);
    BOOST_CHECK(ratView->getSide() == CombatSide::World);
    BOOST_CHECK(!playerView->isRemovedOnDeath());
    BOOST_CHECK(ratView->isRemovedOnDeath());
    BOOST_CHECK(playerView->canTarget(*ratView));
    BOOST_CHECK(!playerView->canTarget(*playerView));

    EntityInstance item("coin", "a copper coin", ItemData{});
    BOOST_CHECK(makeCombatant(EntityHandle(3, EntityKind::Item, 1), item,
                              resolver.getUnarmedProfile()) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestStaminaAndHealing)
{
    auto player = playerInstance(fighterStats());
    auto view = makeCombatant(PLAYER_HANDLE, player, resolver.getUnarmedProfile());

    BOOST_CHECK(view->spendStamina(4));
    BOOST_CHECK_EQUAL(view->getStamina(), 6);
    BOOST_CHECK(!view->spendStamina(7));
    BOOST_CHECK_EQUAL(view->getStamina(), 6);
    view->regainStamina(50);
    BOOST_CHECK_EQUAL(view->getStamina(), 10);

    view->applyDamage(25);
    BOOST_CHECK_EQUAL(view->getHitPoints(), 0);
    BOOST_CHECK(!view->isAlive());
    view->restoreHitPoints(50);
    BOOST_CHECK_EQUAL(view->getHitPoints(), 20);
}

BOOST_AUTO_TEST_SUITE_END()
