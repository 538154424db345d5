/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_DICE_ROLLER_HPP
#define MOCK_DICE_ROLLER_HPP

#include "utils/DiceRoller.hpp"
#include <algorithm>
#include <deque>
#include <initializer_list>

/**
 * @brief DiceRoller that plays back scripted results
 *
 * Integer rolls are taken from the int queue and clamped into the requested
 * range; unit() rolls come from the float queue. Empty queues fall back to
 * the defaults (50 and 0.99, i.e. "middling roll, no crit, no encounter").
 * Like the real roller, a degenerate range returns min without consuming
 * a scripted value.
 */
class MockDiceRoller : public AnchorMud::DiceRoller
{
public:
    MockDiceRoller() : AnchorMud::DiceRoller(1) {}

    void queueRolls(std::initializer_list<int> rolls)
    {
        m_rolls.insert(m_rolls.end(), rolls.begin(), rolls.end());
    }

    void queueUnits(std::initializer_list<float> units)
    {
        m_units.insert(m_units.end(), units.begin(), units.end());
    }

    void setDefaultRoll(int roll) { m_defaultRoll = roll; }
    void setDefaultUnit(float unit) { m_defaultUnit = unit; }

    int rollRange(int min, int max) override
    {
        if (max <= min) {
            return min;
        }
        ++m_rangeCalls;
        int value = m_defaultRoll;
        if (!m_rolls.empty()) {
            value = m_rolls.front();
            m_rolls.pop_front();
        }
        return std::clamp(value, min, max);
    }

    float unit() override
    {
        ++m_unitCalls;
        if (m_units.empty()) {
            return m_defaultUnit;
        }
        float value = m_units.front();
        m_units.pop_front();
        return value;
    }

    size_t pendingRolls() const { return m_rolls.size(); }
    size_t pendingUnits() const { return m_units.size(); }
    int getRangeCalls() const { return m_rangeCalls; }
    int getUnitCalls() const { return m_unitCalls; }

    void clear()
    {
        m_rolls.clear();
        m_units.clear();
        m_rangeCalls = 0;
        m_unitCalls = 0;
    }

private:
    std::deque<int> m_rolls;
    std::deque<float> m_units;
    int m_defaultRoll{50};
    float m_defaultUnit{0.99f};
    int m_rangeCalls{0};
    int m_unitCalls{0};
};

#endif // MOCK_DICE_ROLLER_HPP
