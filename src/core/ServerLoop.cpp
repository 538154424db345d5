/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/ServerLoop.hpp"
#include "core/Logger.hpp"
#include <exception>
#include <string>

namespace {
// Ticks between performance log lines (one minute at 10 Hz)
constexpr uint64_t REPORT_INTERVAL_TICKS = 600;
}

ServerLoop::ServerLoop(float tickRate)
    : m_timestepManager(std::make_unique<TimestepManager>(tickRate))
{
}

ServerLoop::~ServerLoop() {
    if (m_running.load()) {
        stop();
    }
}

void ServerLoop::setPollHandler(PollHandler handler) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_pollHandler = std::move(handler);
}

void ServerLoop::setUpdateHandler(UpdateHandler handler) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_updateHandler = std::move(handler);
}

bool ServerLoop::run() {
    if (m_running.exchange(true)) {
        SERVER_WARN("ServerLoop already running");
        return false;
    }
    m_stopRequested.store(false, std::memory_order_relaxed);
    m_timestepManager->reset();

    SERVER_INFO("ServerLoop running at " + std::to_string(m_timestepManager->getTickRate()) +
                " ticks per second");

    try {
        runFrames();
    } catch (const std::exception& e) {
        SERVER_CRITICAL("Exception in server loop: " + std::string(e.what()));
        m_running.store(false, std::memory_order_relaxed);
        return false;
    }

    m_running.store(false, std::memory_order_relaxed);
    SERVER_INFO("ServerLoop stopped after " + std::to_string(getTickCount()) + " ticks");
    return true;
}

void ServerLoop::stop() {
    m_stopRequested.store(true, std::memory_order_relaxed);
}

bool ServerLoop::isRunning() const {
    return m_running.load(std::memory_order_relaxed);
}

void ServerLoop::setPaused(bool paused) {
    m_paused.store(paused, std::memory_order_relaxed);
}

bool ServerLoop::isPaused() const {
    return m_paused.load(std::memory_order_relaxed);
}

float ServerLoop::getCurrentTickRate() const {
    return m_timestepManager->getCurrentTickRate();
}

uint32_t ServerLoop::getFrameTimeMs() const {
    return m_timestepManager->getFrameTimeMs();
}

TimestepManager& ServerLoop::getTimestepManager() {
    return *m_timestepManager;
}

void ServerLoop::runFrames() {
    while (!m_stopRequested.load(std::memory_order_relaxed)) {
        m_timestepManager->startFrame();

        try {
            invokePollHandler();
            processUpdates();
            if (m_timestepManager->isFrameTimeExcessive()) {
                SERVER_WARN("Frame took " + std::to_string(m_timestepManager->getFrameTimeMs()) +
                            "ms, the world is running behind");
            }
        } catch (const std::exception& e) {
            SERVER_ERROR("Exception in server frame: " + std::string(e.what()));
            // Continue running, but log the error
        }

        m_timestepManager->endFrame();
    }
}

void ServerLoop::processUpdates() {
    while (m_timestepManager->shouldUpdate()) {
        if (m_paused.load(std::memory_order_relaxed)) {
            continue;
        }
        invokeUpdateHandler(m_timestepManager->getUpdateDeltaTime());

        const uint64_t ticks = m_tickCount.fetch_add(1, std::memory_order_relaxed) + 1;
        if (ticks % REPORT_INTERVAL_TICKS == 0) {
            SERVER_DEBUG("Tick rate " + std::to_string(m_timestepManager->getCurrentTickRate()) +
                         ", dropped " + std::to_string(m_timestepManager->getDroppedTicks()));
        }
    }
}

void ServerLoop::invokePollHandler() {
    PollHandler handlerCopy;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        handlerCopy = m_pollHandler;
    }
    if (handlerCopy) {
        handlerCopy();
    }
}

void ServerLoop::invokeUpdateHandler(float deltaTime) {
    UpdateHandler handlerCopy;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        handlerCopy = m_updateHandler;
    }
    if (handlerCopy) {
        try {
            handlerCopy(deltaTime);
        } catch (const std::exception& e) {
            SERVER_ERROR("Exception in update handler: " + std::string(e.what()));
        }
    }
}
