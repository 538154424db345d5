/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/CombatResolver.hpp"
#include "core/Logger.hpp"
#include "utils/DiceRoller.hpp"
#include <algorithm>
#include <cmath>

using AnchorMud::CombatModifier::EXPOSED;
using AnchorMud::CombatModifier::PINNED;
using AnchorMud::CombatModifier::STAGGERED;
using AnchorMud::DamageType;

CombatResolver::CombatResolver(const AnchorMud::RuntimeSettings& settings)
    : m_settings(settings)
{
    m_unarmed.verb = "punch";
    m_unarmed.speed = 1.0f;
    m_unarmed.minDamage = settings.unarmedMinDamage;
    m_unarmed.maxDamage = std::max(settings.unarmedMinDamage, settings.unarmedMaxDamage);
    m_unarmed.damageType = DamageType::Bludgeoning;
    m_unarmed.critChance = settings.unarmedCritChance;
}

int CombatResolver::effectiveAccuracy(int accuracy, uint8_t attackerModifiers, int bonus)
{
    int value = accuracy + bonus;
    if (attackerModifiers & STAGGERED) {
        value -= STAGGERED_PENALTY;
    }
    return std::clamp(value, 1, 99);
}

int CombatResolver::effectiveAvoidance(int avoidance, uint8_t defenderModifiers)
{
    int value = avoidance;
    if (defenderModifiers & EXPOSED) {
        value -= EXPOSED_PENALTY;
    }
    if (defenderModifiers & PINNED) {
        value -= PINNED_PENALTY;
    }
    return std::clamp(value, 1, 99);
}

bool CombatResolver::contestHits(int attackRoll, int attackTarget, int defenseRoll,
                                 int defenseTarget)
{
    if (attackRoll > attackTarget) {
        return false;
    }
    return attackRoll < defenseRoll || defenseRoll > defenseTarget;
}

int CombatResolver::reductionFor(const ArmorPiece& piece, DamageType type) const
{
    const auto bit = AnchorMud::damageBit(type);
    if (piece.stats.primaryTypes & bit) {
        return piece.stats.reduction;
    }
    if (piece.stats.secondaryTypes & bit) {
        return static_cast<int>(std::floor(static_cast<float>(piece.stats.reduction) *
                                           m_settings.secondaryArmorRate));
    }
    return 0;
}

int CombatResolver::applyArmor(int rawDamage, DamageType type, std::vector<ArmorPiece>& armor,
                               std::vector<ArmorAbsorption>& absorptions) const
{
    int remaining = std::max(0, rawDamage);
    for (auto& piece : armor) {
        if (remaining == 0) {
            break;
        }
        if (piece.isBroken()) {
            continue;
        }
        int reduction = reductionFor(piece, type);
        if (reduction <= 0) {
            continue;
        }

        int absorbed = std::min({remaining, reduction, piece.durability});
        piece.durability -= absorbed;
        remaining -= absorbed;

        ArmorAbsorption record{piece.name, absorbed, false};
        if (piece.isBroken() && !piece.brokenAnnounced) {
            piece.brokenAnnounced = true;
            record.broke = true;
        }
        absorptions.push_back(std::move(record));
    }
    return remaining;
}

AttackOutcome CombatResolver::resolveAttack(Combatant& attacker, Combatant& defender,
                                            const AttackContext& context,
                                            AnchorMud::DiceRoller& roller) const
{
    const AnchorMud::AttackProfile& profile = attacker.getAttackProfile();

    AttackOutcome outcome;
    outcome.verb = profile.verb;
    outcome.damageType = profile.damageType;
    outcome.effectiveAccuracy = effectiveAccuracy(
        attacker.getAccuracy(), context.attackerModifiers,
        context.accuracyBonus + context.situationalAccuracy);
    outcome.effectiveAvoidance = effectiveAvoidance(defender.getAvoidance(),
                                                    context.defenderModifiers);

    outcome.attackRoll = roller.d100();
    outcome.defenseRoll = roller.d100();
    outcome.hit = contestHits(outcome.attackRoll, outcome.effectiveAccuracy,
                              outcome.defenseRoll, outcome.effectiveAvoidance);
    outcome.remainingHitPoints = defender.getHitPoints();
    if (!outcome.hit) {
        return outcome;
    }

    const float critRoll = roller.unit();
    outcome.critical = outcome.attackRoll <= outcome.effectiveAccuracy / 10 ||
                       critRoll < profile.critChance;

    int raw = roller.rollRange(profile.minDamage, profile.maxDamage) + context.damageBonus;
    raw = static_cast<int>(std::lround(static_cast<float>(std::max(0, raw)) *
                                       context.damageMultiplier));
    if (outcome.critical) {
        raw = static_cast<int>(std::lround(static_cast<float>(raw) * m_settings.critMultiplier));
    } else {
        const auto glancingFloor = static_cast<int>(
            std::ceil(GLANCING_BAND * static_cast<float>(outcome.effectiveAvoidance)));
        if (outcome.defenseRoll >= glancingFloor &&
            outcome.defenseRoll <= outcome.effectiveAvoidance) {
            outcome.glancing = true;
            raw = std::max(1, raw / 2);
        }
    }
    outcome.rawDamage = std::max(0, raw);

    outcome.finalDamage = applyArmor(outcome.rawDamage, profile.damageType,
                                     defender.getArmor(), outcome.absorptions);
    outcome.remainingHitPoints = defender.applyDamage(outcome.finalDamage);
    outcome.killed = !defender.isAlive();

    int wear = 1;
    if (context.extraWearChance > 0.0f && roller.unit() < context.extraWearChance) {
        ++wear;
    }
    outcome.weaponName = attacker.getWeaponName();
    outcome.weaponBroke = attacker.wearWeapon(wear);

    COMBAT_DEBUG(std::string(attacker.getName()) + " -> " + std::string(defender.getName()) +
                 " roll " + std::to_string(outcome.attackRoll) + "/" +
                 std::to_string(outcome.effectiveAccuracy) + " vs " +
                 std::to_string(outcome.defenseRoll) + "/" +
                 std::to_string(outcome.effectiveAvoidance) + " raw " +
                 std::to_string(outcome.rawDamage) + " final " +
                 std::to_string(outcome.finalDamage));
    return outcome;
}

int CombatResolver::disengageChance(int avoidance, int opposition, int penalty) const
{
    return std::clamp(50 + avoidance - std::max(opposition, m_settings.disengageDifficulty) -
                          penalty,
                      5, 95);
}

bool CombatResolver::resolveDisengage(int avoidance, int opposition, int penalty,
                                      AnchorMud::DiceRoller& roller) const
{
    return roller.d100() <= disengageChance(avoidance, opposition, penalty);
}

int CombatResolver::rollInitiative(const Combatant& combatant,
                                   AnchorMud::DiceRoller& roller) const
{
    return roller.d20() + combatant.getInitiativeBonus();
}

double CombatResolver::attackInterval(float speed) const
{
    double interval = static_cast<double>(m_settings.baseAttackInterval) *
                      static_cast<double>(speed);
    return std::max(interval, static_cast<double>(m_settings.minAttackInterval));
}
