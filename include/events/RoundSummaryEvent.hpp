/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUND_SUMMARY_EVENT_HPP
#define ROUND_SUMMARY_EVENT_HPP

/**
 * @file RoundSummaryEvent.hpp
 * @brief One digest per combat round, sent to everyone in the room
 */

#include "core/Logger.hpp"
#include "events/Event.hpp"
#include <string>
#include <utility>
#include <vector>

class RoundSummaryEvent : public Event {
public:
    RoundSummaryEvent(int round, int hostilesRemaining, std::vector<std::string> lines)
        : m_round(round), m_hostilesRemaining(hostilesRemaining), m_lines(std::move(lines)) {}

    void execute() override {
        COMBAT_DEBUG("Round " + std::to_string(m_round) + " summary in " + m_roomId);
    }
    void reset() override {
        m_round = 0;
        m_hostilesRemaining = 0;
        m_lines.clear();
    }

    std::string getName() const override { return "RoundSummaryEvent"; }
    std::string getType() const override { return "RoundSummary"; }
    std::string getTypeName() const override { return "RoundSummaryEvent"; }
    EventTypeId getTypeId() const override { return EventTypeId::RoundSummary; }

    std::string getMessage() const override {
        std::string text = "[Round " + std::to_string(m_round) + "] " +
                           std::to_string(m_hostilesRemaining) +
                           (m_hostilesRemaining == 1 ? " hostile remains." : " hostiles remain.");
        for (const auto& line : m_lines) {
            text += "\n  " + line;
        }
        return text;
    }

    [[nodiscard]] int getRound() const { return m_round; }
    [[nodiscard]] int getHostilesRemaining() const { return m_hostilesRemaining; }
    [[nodiscard]] const std::vector<std::string>& getLines() const { return m_lines; }

private:
    int m_round;
    int m_hostilesRemaining;
    std::vector<std::string> m_lines;
};

#endif // ROUND_SUMMARY_EVENT_HPP
