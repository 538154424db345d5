/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Combatant.hpp"
#include <algorithm>

const AnchorMud::AttackProfile& Combatant::getAttackProfile() const {
    if (m_stats.weapon.has_value()) {
        return m_stats.weapon->profile;
    }
    if (m_stats.hasNaturalAttack) {
        return m_stats.naturalAttack;
    }
    return m_unarmed;
}

int Combatant::getAccuracy() const {
    return m_stats.accuracy + getAttackProfile().accuracyBonus;
}

bool Combatant::knowsManeuver(std::string_view maneuverId) const {
    return std::find(m_stats.maneuvers.begin(), m_stats.maneuvers.end(),
                     maneuverId) != m_stats.maneuvers.end();
}

int Combatant::applyDamage(int amount) {
    m_stats.hpCurrent = std::clamp(m_stats.hpCurrent - std::max(0, amount), 0,
                                   m_stats.hpMax);
    return m_stats.hpCurrent;
}

void Combatant::restoreHitPoints(int amount) {
    m_stats.hpCurrent = std::clamp(m_stats.hpCurrent + std::max(0, amount), 0,
                                   m_stats.hpMax);
}

bool Combatant::spendStamina(int cost) {
    if (cost > m_stats.staminaCurrent) {
        return false;
    }
    m_stats.staminaCurrent -= std::max(0, cost);
    return true;
}

void Combatant::regainStamina(int amount) {
    m_stats.staminaCurrent = std::clamp(m_stats.staminaCurrent + amount, 0,
                                        m_stats.staminaMax);
}

bool Combatant::wearWeapon(int amount) {
    if (!m_stats.weapon.has_value() || m_stats.weapon->maxDurability <= 0) {
        return false; // Unarmed, natural and indestructible attacks never wear
    }
    m_stats.weapon->durability = std::max(0, m_stats.weapon->durability - amount);
    if (m_stats.weapon->durability == 0) {
        m_stats.weapon.reset();
        return true;
    }
    return false;
}

std::unique_ptr<Combatant> makeCombatant(EntityHandle handle, EntityInstance& instance,
                                         const AnchorMud::AttackProfile& unarmed) {
    if (auto* player = std::get_if<PlayerData>(&instance.payload)) {
        return std::make_unique<PlayerCombatant>(handle, instance, *player, unarmed);
    }
    if (auto* creature = std::get_if<CreatureData>(&instance.payload)) {
        return std::make_unique<CreatureCombatant>(handle, instance, *creature, unarmed);
    }
    if (auto* npc = std::get_if<NpcData>(&instance.payload)) {
        return std::make_unique<NpcCombatant>(handle, instance, *npc, unarmed);
    }
    return nullptr;
}
