/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef EVENT_HPP
#define EVENT_HPP

/**
 * @file Event.hpp
 * @brief Base class for all runtime events
 *
 * Events are data carriers dispatched through EventManager to the session
 * layer. Each one is addressed either to a whole room (every participant and
 * observer there) or to a single recipient.
 */

#include "entities/EntityHandle.hpp"
#include "events/EventTypeId.hpp"
#include <memory>
#include <string>

// Forward declarations
class Event;

// Define standard smart pointer types for Event
using EventPtr = std::shared_ptr<Event>;
using EventWeakPtr = std::weak_ptr<Event>;

class Event {
public:
    virtual ~Event() = default;

    // Core event methods
    virtual void update() {}
    virtual void execute() = 0;
    virtual void reset() = 0;
    virtual void clean() { reset(); }

    // Event identification
    virtual std::string getName() const = 0;
    virtual std::string getType() const = 0;
    virtual std::string getTypeName() const = 0;
    virtual EventTypeId getTypeId() const = 0;

    /**
     * @brief Text shown to the receiving session(s)
     */
    virtual std::string getMessage() const = 0;

    // Event state access
    virtual bool isActive() const { return m_active; }
    virtual void setActive(bool active) { m_active = active; }

    // Event priority (higher values = higher priority)
    virtual int getPriority() const { return m_priority; }
    virtual void setPriority(int priority) { m_priority = priority; }

    // Audience
    const std::string& getRoomId() const { return m_roomId; }
    void setRoomId(const std::string& roomId) { m_roomId = roomId; }
    EntityHandle getRecipient() const { return m_recipient; }
    void setRecipient(EntityHandle recipient) { m_recipient = recipient; }
    bool isRoomBroadcast() const { return !m_recipient.isValid(); }

protected:
    bool m_active{true};
    int m_priority{0};
    std::string m_roomId;
    EntityHandle m_recipient;   // Invalid = whole room
};

#endif // EVENT_HPP
