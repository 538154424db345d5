/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/CombatEvent.hpp"
#include "core/Logger.hpp"

namespace {
// "slash" -> "slashes", "bite" -> "bites"
std::string thirdPerson(const std::string& verb) {
    auto endsWith = [&verb](const char* suffix) {
        const std::string s(suffix);
        return verb.size() >= s.size() && verb.compare(verb.size() - s.size(), s.size(), s) == 0;
    };
    if (endsWith("s") || endsWith("sh") || endsWith("ch") || endsWith("x")) {
        return verb + "es";
    }
    return verb + "s";
}
} // namespace

CombatEvent::CombatEvent(CombatEventType combatType, EntityHandle attacker,
                         EntityHandle target, int damage)
    : m_combatType(combatType)
    , m_attacker(attacker)
    , m_target(target)
    , m_damage(damage)
    , m_rawDamage(damage)
{
    m_name = "CombatEvent_" + getCombatTypeString();
}

void CombatEvent::execute() {
    // Data carrier; combat logic lives in CombatController
    COMBAT_DEBUG("Combat event executed: " + getCombatTypeString() +
                 " damage=" + std::to_string(m_damage));
}

void CombatEvent::reset() {
    m_damage = 0;
    m_rawDamage = 0;
    m_remainingHealth = 0;
    m_attacker = INVALID_ENTITY_HANDLE;
    m_target = INVALID_ENTITY_HANDLE;
    m_detail.clear();
}

std::string CombatEvent::getMessage() const {
    switch (m_combatType) {
        case CombatEventType::Hit:
            return m_attackerName + " " + thirdPerson(m_verb) + " " + m_targetName + " for " +
                   std::to_string(m_damage) + " damage.";
        case CombatEventType::CriticalHit:
            return m_attackerName + " lands a critical " + m_verb + " on " + m_targetName +
                   " for " + std::to_string(m_damage) + " damage!";
        case CombatEventType::GlancingHit:
            return m_attackerName + "'s " + m_verb + " glances off " + m_targetName + " for " +
                   std::to_string(m_damage) + " damage.";
        case CombatEventType::Miss:
            return m_attackerName + " misses " + m_targetName + ".";
        case CombatEventType::Killed:
            return m_targetName + " is slain by " + m_attackerName + "!";
        case CombatEventType::ArmorBroken:
            return m_targetName + "'s " + m_detail + " breaks apart.";
        case CombatEventType::WeaponBroken:
            return m_attackerName + "'s " + m_detail + " shatters!";
        case CombatEventType::ManeuverUsed:
            return m_attackerName + " uses " + m_detail + " on " + m_targetName + ".";
        default:
            return {};
    }
}

std::string CombatEvent::getCombatTypeString() const {
    switch (m_combatType) {
        case CombatEventType::Hit:
            return "Hit";
        case CombatEventType::Miss:
            return "Miss";
        case CombatEventType::CriticalHit:
            return "CriticalHit";
        case CombatEventType::GlancingHit:
            return "GlancingHit";
        case CombatEventType::Killed:
            return "Killed";
        case CombatEventType::ArmorBroken:
            return "ArmorBroken";
        case CombatEventType::WeaponBroken:
            return "WeaponBroken";
        case CombatEventType::ManeuverUsed:
            return "ManeuverUsed";
        default:
            return "Unknown";
    }
}
