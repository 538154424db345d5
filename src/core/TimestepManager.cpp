/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

TimestepManager::TimestepManager(float tickRate)
    : m_tickRate(tickRate > 0.0f ? tickRate : 10.0f)
    , m_fixedTimestep(1.0f / m_tickRate)
{
    auto currentTime = std::chrono::steady_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::startFrame() {
    auto currentTime = std::chrono::steady_clock::now();

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = currentTime;
        m_frameStart = currentTime;
        m_accumulator = m_fixedTimestep;  // First frame runs one tick
        return;
    }

    double deltaTime = std::chrono::duration<double>(currentTime - m_lastFrameTime).count();
    m_lastFrameTime = currentTime;
    m_frameStart = currentTime;
    m_lastFrameTimeMs = static_cast<uint32_t>(deltaTime * 1000.0);

    if (deltaTime > 0.0) {
        float instantRate = std::clamp(static_cast<float>(1.0 / deltaTime), 0.1f, 1000.0f);
        m_currentRate = (m_currentRate <= 0.0f)
                            ? instantRate
                            : m_smoothingAlpha * instantRate + (1.0f - m_smoothingAlpha) * m_currentRate;
    }

    m_accumulator += deltaTime;
    const double ceiling = m_fixedTimestep * MAX_ACCUMULATED_TICKS;
    if (m_accumulator > ceiling) {
        m_droppedTicks += static_cast<uint64_t>((m_accumulator - ceiling) / m_fixedTimestep);
        m_accumulator = ceiling;
    }
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

void TimestepManager::endFrame() {
    auto targetEnd = m_frameStart + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                        std::chrono::duration<double>(m_fixedTimestep - m_accumulator));
    auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(
        targetEnd - std::chrono::steady_clock::now());
    if (remaining.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remaining.count()));
    }
}

bool TimestepManager::isFrameTimeExcessive() const {
    return m_lastFrameTimeMs > static_cast<uint32_t>(m_fixedTimestep * 2000.0f);
}

void TimestepManager::setTickRate(float tickRate) {
    if (tickRate > 0.0f) {
        m_tickRate = tickRate;
        m_fixedTimestep = 1.0f / tickRate;
    }
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_firstFrame = true;
    m_currentRate = 0.0f;
    m_droppedTicks = 0;

    auto currentTime = std::chrono::steady_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}
