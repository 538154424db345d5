/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_EVENT_HPP
#define COMBAT_EVENT_HPP

/**
 * @file CombatEvent.hpp
 * @brief One resolved strike or combat outcome, broadcast to the room
 *
 * CombatEvent notifies the session layer of:
 * - Hits, misses, critical and glancing blows
 * - Deaths
 * - Armor and weapons breaking
 * - Maneuvers being used
 */

#include "Event.hpp"
#include <string>
#include <utility>

enum class CombatEventType {
    Hit,
    Miss,
    CriticalHit,
    GlancingHit,
    Killed,
    ArmorBroken,
    WeaponBroken,
    ManeuverUsed
};

class CombatEvent : public Event {
public:
    CombatEvent(CombatEventType combatType, EntityHandle attacker,
                EntityHandle target, int damage = 0);
    ~CombatEvent() override = default;

    void execute() override;
    void reset() override;

    // Event identification
    std::string getName() const override { return m_name; }
    std::string getType() const override { return "Combat"; }
    std::string getTypeName() const override { return "CombatEvent"; }
    EventTypeId getTypeId() const override { return EventTypeId::Combat; }
    std::string getMessage() const override;

    // Combat-specific accessors
    [[nodiscard]] CombatEventType getCombatType() const { return m_combatType; }
    [[nodiscard]] EntityHandle getAttacker() const { return m_attacker; }
    [[nodiscard]] EntityHandle getTarget() const { return m_target; }
    [[nodiscard]] int getDamage() const { return m_damage; }
    [[nodiscard]] int getRawDamage() const { return m_rawDamage; }
    [[nodiscard]] int getRemainingHealth() const { return m_remainingHealth; }
    [[nodiscard]] const std::string& getDetail() const { return m_detail; }

    // Combat-specific setters
    void setNames(std::string attackerName, std::string targetName) {
        m_attackerName = std::move(attackerName);
        m_targetName = std::move(targetName);
    }
    void setVerb(std::string verb) { m_verb = std::move(verb); }
    void setRawDamage(int raw) { m_rawDamage = raw; }
    void setRemainingHealth(int health) { m_remainingHealth = health; }
    // Armor piece, weapon or maneuver name depending on the type
    void setDetail(std::string detail) { m_detail = std::move(detail); }

    // Utility
    [[nodiscard]] std::string getCombatTypeString() const;

private:
    std::string m_name;
    CombatEventType m_combatType;
    EntityHandle m_attacker;
    EntityHandle m_target;
    std::string m_attackerName;
    std::string m_targetName;
    std::string m_verb{"hit"};
    std::string m_detail;
    int m_damage{0};
    int m_rawDamage{0};
    int m_remainingHealth{0};
};

#endif // COMBAT_EVENT_HPP
