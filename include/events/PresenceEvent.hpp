/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PRESENCE_EVENT_HPP
#define PRESENCE_EVENT_HPP

/**
 * @file PresenceEvent.hpp
 * @brief Something appeared in or left a room
 */

#include "events/Event.hpp"
#include <string>
#include <utility>

enum class PresenceChange {
    Entered,
    Left,
    Pursued,      // Arrived chasing someone
    Returned,     // Pursuer walked back to its post
    Spawned,
    Despawned,
    Scheduled     // Schedule-bound NPC arrived or departed
};

class PresenceEvent : public Event {
public:
    PresenceEvent(PresenceChange change, EntityHandle entity, std::string entityName,
                  std::string direction = {})
        : m_change(change), m_entity(entity), m_entityName(std::move(entityName)),
          m_direction(std::move(direction)) {}

    void execute() override {}
    void reset() override { m_direction.clear(); }

    std::string getName() const override { return "PresenceEvent"; }
    std::string getType() const override { return "Presence"; }
    std::string getTypeName() const override { return "PresenceEvent"; }
    EventTypeId getTypeId() const override { return EventTypeId::Presence; }

    std::string getMessage() const override {
        switch (m_change) {
            case PresenceChange::Entered:
                return m_entityName + " arrives" +
                       (m_direction.empty() ? "." : " from the " + m_direction + ".");
            case PresenceChange::Left:
                return m_entityName + " leaves" +
                       (m_direction.empty() ? "." : " heading " + m_direction + ".");
            case PresenceChange::Pursued:
                return m_entityName + " charges in, giving chase!";
            case PresenceChange::Returned:
                return m_entityName + " gives up the chase and returns.";
            case PresenceChange::Spawned:
                return m_entityName + " appears.";
            case PresenceChange::Despawned:
                return m_entityName + " is gone.";
            case PresenceChange::Scheduled:
                return m_entityName + (m_direction.empty() ? " heads off." : " " + m_direction);
        }
        return {};
    }

    [[nodiscard]] PresenceChange getChange() const { return m_change; }
    [[nodiscard]] EntityHandle getEntity() const { return m_entity; }
    [[nodiscard]] const std::string& getEntityName() const { return m_entityName; }

private:
    PresenceChange m_change;
    EntityHandle m_entity;
    std::string m_entityName;
    std::string m_direction;
};

#endif // PRESENCE_EVENT_HPP
