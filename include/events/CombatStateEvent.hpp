/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_STATE_EVENT_HPP
#define COMBAT_STATE_EVENT_HPP

/**
 * @file CombatStateEvent.hpp
 * @brief A combatant moved between Observing/Engaged/Supporting/Disengaging
 */

#include "controllers/combat/CombatTypes.hpp"
#include "core/Logger.hpp"
#include "events/Event.hpp"
#include <string>
#include <utility>

class CombatStateEvent : public Event {
public:
    CombatStateEvent(EntityHandle combatant, std::string combatantName,
                     CombatState from, CombatState to, std::string reason = {})
        : m_combatant(combatant), m_combatantName(std::move(combatantName)),
          m_from(from), m_to(to), m_reason(std::move(reason)) {}

    void execute() override {
        COMBAT_DEBUG(m_combatantName + ": " + combatStateToString(m_from) + " -> " +
                     combatStateToString(m_to));
    }
    void reset() override { m_reason.clear(); }

    std::string getName() const override { return "CombatStateEvent"; }
    std::string getType() const override { return "CombatState"; }
    std::string getTypeName() const override { return "CombatStateEvent"; }
    EventTypeId getTypeId() const override { return EventTypeId::CombatState; }

    std::string getMessage() const override {
        std::string text;
        switch (m_to) {
            case CombatState::Engaged:
                text = m_combatantName + " is engaged in combat.";
                break;
            case CombatState::Observing:
                text = m_combatantName + " is no longer fighting.";
                break;
            case CombatState::Disengaging:
                text = m_combatantName + " tries to break away.";
                break;
            case CombatState::Supporting:
                text = m_combatantName + " moves to support.";
                break;
        }
        if (!m_reason.empty()) {
            text += " (" + m_reason + ")";
        }
        return text;
    }

    [[nodiscard]] EntityHandle getCombatant() const { return m_combatant; }
    [[nodiscard]] CombatState getFrom() const { return m_from; }
    [[nodiscard]] CombatState getTo() const { return m_to; }
    [[nodiscard]] const std::string& getReason() const { return m_reason; }

private:
    EntityHandle m_combatant;
    std::string m_combatantName;
    CombatState m_from;
    CombatState m_to;
    std::string m_reason;
};

#endif // COMBAT_STATE_EVENT_HPP
