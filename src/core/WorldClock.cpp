/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/WorldClock.hpp"
#include "core/Logger.hpp"
#include <cmath>

// ============================================================================
// Lifecycle
// ============================================================================

bool WorldClock::init(int64_t startSeconds, int timeRatio)
{
    if (timeRatio < 1) {
        CLOCK_ERROR("Invalid time ratio " + std::to_string(timeRatio) + ", must be >= 1");
        return false;
    }
    if (startSeconds < 0) {
        CLOCK_ERROR("Invalid start time " + std::to_string(startSeconds));
        return false;
    }

    m_timeRatio = timeRatio;
    m_worldSeconds.store(static_cast<double>(startSeconds), std::memory_order_release);
    m_paused.store(false, std::memory_order_release);
    m_initialized = true;

    CLOCK_INFO("WorldClock initialized at " + formatTime(startSeconds, true) +
               " with ratio " + std::to_string(timeRatio) + ":1");
    return true;
}

void WorldClock::clean()
{
    m_initialized = false;
    m_worldSeconds.store(0.0, std::memory_order_release);
    m_paused.store(false, std::memory_order_release);
}

void WorldClock::update(float realDeltaSeconds)
{
    if (isPaused() || realDeltaSeconds <= 0.0f) {
        return;
    }
    advanceWorldSeconds(static_cast<double>(realDeltaSeconds) * m_timeRatio);
}

void WorldClock::advanceWorldSeconds(double worldSeconds)
{
    if (worldSeconds <= 0.0) {
        return; // Monotonic
    }
    double current = m_worldSeconds.load(std::memory_order_relaxed);
    m_worldSeconds.store(current + worldSeconds, std::memory_order_release);
}

void WorldClock::setWorldSeconds(double worldSeconds)
{
    double current = m_worldSeconds.load(std::memory_order_relaxed);
    if (worldSeconds < current) {
        CLOCK_WARN("Ignoring attempt to move the clock backwards");
        return;
    }
    m_worldSeconds.store(worldSeconds, std::memory_order_release);
}

int64_t WorldClock::getWorldSeconds() const
{
    return static_cast<int64_t>(std::floor(now()));
}

// ============================================================================
// Calendar
// ============================================================================

int64_t WorldClock::dayOf(int64_t worldSeconds)
{
    return worldSeconds / SECONDS_PER_DAY;
}

int WorldClock::hourOf(int64_t worldSeconds)
{
    return static_cast<int>((worldSeconds % SECONDS_PER_DAY) / SECONDS_PER_HOUR);
}

int WorldClock::minuteOf(int64_t worldSeconds)
{
    return static_cast<int>((worldSeconds % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE);
}

int WorldClock::minuteOfDay(int64_t worldSeconds)
{
    return static_cast<int>((worldSeconds % SECONDS_PER_DAY) / SECONDS_PER_MINUTE);
}

DayPart WorldClock::dayPartOf(int hour)
{
    if (hour >= 5 && hour < 8) return DayPart::Dawn;
    if (hour >= 8 && hour < 12) return DayPart::Morning;
    if (hour >= 12 && hour < 17) return DayPart::Afternoon;
    if (hour >= 17 && hour < 20) return DayPart::Dusk;
    return DayPart::Night;
}

std::string_view WorldClock::dayPartToString(DayPart part)
{
    switch (part) {
        case DayPart::Dawn: return "Dawn";
        case DayPart::Morning: return "Morning";
        case DayPart::Afternoon: return "Afternoon";
        case DayPart::Dusk: return "Dusk";
        case DayPart::Night: return "Night";
        default: return "Unknown";
    }
}

std::string WorldClock::formatTime(int64_t worldSeconds, bool includeExact)
{
    const int hour = hourOf(worldSeconds);
    const DayPart part = dayPartOf(hour);

    struct BellText { int startHour; const char* atMark; const char* suffix; const char* flavor; };
    static constexpr BellText TABLE[] = {
        {5, "sunrise", "past sunrise", "Grey light creeps over the harbour."},
        {8, "early morning", "past dawn", "Carts rattle toward the market."},
        {12, "midday", "past noon", "The quays are loud with trade."},
        {17, "sunset", "past sunset", "Long shadows stretch across the docks."},
        {20, "deep night", "into the night", "Lanterns sway along the waterfront."},
    };
    const BellText& text = TABLE[static_cast<int>(part)];

    int bells = hour - text.startHour;
    if (part == DayPart::Night && hour < text.startHour) {
        bells = hour + (24 - text.startHour);
    }

    std::string result = "It is " + std::string(dayPartToString(part)) + ", ";
    if (bells == 0) {
        result += text.atMark;
    } else {
        result += std::to_string(bells) + (bells > 1 ? " bells " : " bell ") + text.suffix;
    }
    result += ". (Day " + std::to_string(dayOf(worldSeconds)) + ")";

    if (includeExact) {
        const int minute = minuteOf(worldSeconds);
        result += std::string(" (") + (hour < 10 ? "0" : "") + std::to_string(hour) + ":" +
                  (minute < 10 ? "0" : "") + std::to_string(minute) + ")";
    }

    result += "\n";
    result += text.flavor;
    return result;
}

std::optional<int> WorldClock::parseTimeOfDay(std::string_view text)
{
    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }

    auto parsePart = [](std::string_view digits) -> std::optional<int> {
        if (digits.empty() || digits.size() > 2) {
            return std::nullopt;
        }
        int value = 0;
        for (char c : digits) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
        }
        return value;
    };

    auto hour = parsePart(text.substr(0, colon));
    auto minute = parsePart(text.substr(colon + 1));
    if (!hour || !minute || *hour > 23 || *minute > 59) {
        return std::nullopt;
    }
    return *hour * 60 + *minute;
}

bool WorldClock::isMinuteInRange(int startMinute, int endMinute, int minute)
{
    if (startMinute == endMinute) {
        return true; // Whole day
    }
    if (startMinute < endMinute) {
        return minute >= startMinute && minute < endMinute;
    }
    // Wraps past midnight
    return minute >= startMinute || minute < endMinute;
}
