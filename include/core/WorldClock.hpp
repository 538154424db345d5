/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_CLOCK_HPP
#define WORLD_CLOCK_HPP

/**
 * @file WorldClock.hpp
 * @brief Authoritative in-game time
 *
 * One counter of world seconds, advanced by the server loop at a fixed
 * ratio to real time. Calendar fields (day, hour, minute, day-part) are pure
 * functions of the counter and are never stored.
 *
 * Single writer (the server loop thread), any number of readers.
 */

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class DayPart : uint8_t
{
    Dawn = 0,       // [05:00, 08:00)
    Morning = 1,    // [08:00, 12:00)
    Afternoon = 2,  // [12:00, 17:00)
    Dusk = 3,       // [17:00, 20:00)
    Night = 4
};

class WorldClock {
public:
    static constexpr int64_t SECONDS_PER_MINUTE = 60;
    static constexpr int64_t SECONDS_PER_HOUR = 3600;
    static constexpr int64_t SECONDS_PER_DAY = 86400;
    static constexpr int MINUTES_PER_DAY = 1440;

    static WorldClock& Instance() {
        static WorldClock instance;
        return instance;
    }

    /**
     * @param startSeconds World seconds at server start
     * @param timeRatio World seconds per real second (must be >= 1)
     */
    bool init(int64_t startSeconds = 0, int timeRatio = 3);

    void clean();

    /**
     * @brief Advance by real elapsed time. Called once per server tick.
     */
    void update(float realDeltaSeconds);

    // Direct control for tools and tests
    void advanceWorldSeconds(double worldSeconds);
    void setWorldSeconds(double worldSeconds);

    void pause() { m_paused.store(true, std::memory_order_release); }
    void resume() { m_paused.store(false, std::memory_order_release); }
    [[nodiscard]] bool isPaused() const { return m_paused.load(std::memory_order_acquire); }

    /**
     * @brief Whole world seconds elapsed (the public counter).
     */
    [[nodiscard]] int64_t getWorldSeconds() const;

    /**
     * @brief Fractional world time, used for ticker and flee-window timing.
     */
    [[nodiscard]] double now() const { return m_worldSeconds.load(std::memory_order_acquire); }

    [[nodiscard]] int getTimeRatio() const { return m_timeRatio; }

    [[nodiscard]] int64_t getDay() const { return dayOf(getWorldSeconds()); }
    [[nodiscard]] int getHour() const { return hourOf(getWorldSeconds()); }
    [[nodiscard]] int getMinute() const { return minuteOf(getWorldSeconds()); }
    [[nodiscard]] int getMinuteOfDay() const { return minuteOfDay(getWorldSeconds()); }
    [[nodiscard]] DayPart getDayPart() const { return dayPartOf(getHour()); }
    [[nodiscard]] std::string formatTime(bool includeExact = false) const {
        return formatTime(getWorldSeconds(), includeExact);
    }

    // ========================================================================
    // Pure calendar functions
    // ========================================================================

    static int64_t dayOf(int64_t worldSeconds);
    static int hourOf(int64_t worldSeconds);
    static int minuteOf(int64_t worldSeconds);
    static int minuteOfDay(int64_t worldSeconds);
    static DayPart dayPartOf(int hour);
    static std::string_view dayPartToString(DayPart part);

    /**
     * @brief Bell-count description, e.g. "It is Morning, 2 bells past dawn. (Day 3)"
     */
    static std::string formatTime(int64_t worldSeconds, bool includeExact = false);

    /**
     * @brief "HH:MM" to minutes since midnight.
     */
    static std::optional<int> parseTimeOfDay(std::string_view text);

    /**
     * @brief Start-inclusive, end-exclusive, wrapping past midnight when
     * end <= start.
     */
    static bool isMinuteInRange(int startMinute, int endMinute, int minute);

private:
    WorldClock() = default;
    ~WorldClock() = default;
    WorldClock(const WorldClock&) = delete;
    WorldClock& operator=(const WorldClock&) = delete;

    std::atomic<double> m_worldSeconds{0.0};
    std::atomic<bool> m_paused{false};
    int m_timeRatio{3};
    bool m_initialized{false};
};

#endif // WORLD_CLOCK_HPP
