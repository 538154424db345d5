/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

/**
 * TimestepManager paces the server tick.
 *
 * Updates always see the same fixed delta so combat timing does not depend
 * on how busy the host is. Real time is collected in an accumulator and
 * drained one tick at a time; a long stall is clamped so the server catches
 * up over a few frames instead of replaying minutes of backlog at once.
 */
class TimestepManager {
public:
    /**
     * @param tickRate Server ticks per real second (e.g. 10.0f)
     */
    explicit TimestepManager(float tickRate = 10.0f);

    /**
     * Call at the start of each frame
     */
    void startFrame();

    /**
     * True while a fixed tick is owed. May be true several times per frame.
     */
    bool shouldUpdate();

    /**
     * Fixed delta for every tick, in real seconds
     */
    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Sleep until the next tick is due
     */
    void endFrame();

    float getTickRate() const { return m_tickRate; }
    void setTickRate(float tickRate);

    /**
     * Measured ticks per second (EMA smoothed)
     */
    float getCurrentTickRate() const { return m_currentRate; }

    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }

    /**
     * True when the last frame took more than two tick periods
     */
    bool isFrameTimeExcessive() const;

    /**
     * Ticks dropped by the stall clamp since start
     */
    uint64_t getDroppedTicks() const { return m_droppedTicks; }

    void reset();

private:
    float m_tickRate;
    float m_fixedTimestep;

    std::chrono::steady_clock::time_point m_frameStart;
    std::chrono::steady_clock::time_point m_lastFrameTime;

    double m_accumulator{0.0};
    static constexpr double MAX_ACCUMULATED_TICKS = 5.0;

    uint32_t m_lastFrameTimeMs{0};
    float m_currentRate{0.0f};
    float m_smoothingAlpha{0.05f};
    uint64_t m_droppedTicks{0};
    bool m_firstFrame{true};
};

#endif // TIMESTEP_MANAGER_HPP
