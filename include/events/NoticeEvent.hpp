/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NOTICE_EVENT_HPP
#define NOTICE_EVENT_HPP

/**
 * @file NoticeEvent.hpp
 * @brief Private message to one session (rejections, flee window expiry,
 * deferred outcomes)
 */

#include "controllers/combat/CombatTypes.hpp"
#include "events/Event.hpp"
#include <string>
#include <utility>

class NoticeEvent : public Event {
public:
    NoticeEvent(EntityHandle recipient, std::string text,
                ActionStatus status = ActionStatus::Ok)
        : m_text(std::move(text)), m_status(status) {
        m_recipient = recipient;
    }

    void execute() override {}
    void reset() override { m_text.clear(); }

    std::string getName() const override { return "NoticeEvent"; }
    std::string getType() const override { return "Notice"; }
    std::string getTypeName() const override { return "NoticeEvent"; }
    EventTypeId getTypeId() const override { return EventTypeId::Notice; }
    std::string getMessage() const override { return m_text; }

    [[nodiscard]] ActionStatus getStatus() const { return m_status; }

private:
    std::string m_text;
    ActionStatus m_status;
};

#endif // NOTICE_EVENT_HPP
