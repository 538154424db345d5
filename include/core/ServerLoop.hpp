/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SERVER_LOOP_HPP
#define SERVER_LOOP_HPP

#include "core/TimestepManager.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

/**
 * ServerLoop drives the runtime at a fixed tick rate.
 *
 * Callback-based, like a game loop without the render half:
 * - The poll handler runs once per frame (OS events, shutdown requests)
 * - The update handler runs once per owed fixed tick
 *
 * Everything runs on the calling thread. Parallel work (ticker batches,
 * deferred saves) is fanned out to the ThreadSystem by the runtime itself.
 */
class ServerLoop {
public:
    using PollHandler = std::function<void()>;
    using UpdateHandler = std::function<void(float deltaTime)>;

    /**
     * @param tickRate Server ticks per real second
     */
    explicit ServerLoop(float tickRate = 10.0f);
    ~ServerLoop();

    void setPollHandler(PollHandler handler);
    void setUpdateHandler(UpdateHandler handler);

    /**
     * Run until stop() is called
     * @return false if the loop was already running or died on an exception
     */
    bool run();

    /**
     * Thread-safe, callable from handlers and other threads
     */
    void stop();

    bool isRunning() const;

    /**
     * Stop running update handlers but keep polling
     */
    void setPaused(bool paused);
    bool isPaused() const;

    float getCurrentTickRate() const;
    uint32_t getFrameTimeMs() const;
    uint64_t getTickCount() const { return m_tickCount.load(std::memory_order_relaxed); }

    TimestepManager& getTimestepManager();

private:
    std::unique_ptr<TimestepManager> m_timestepManager;

    PollHandler m_pollHandler;
    UpdateHandler m_updateHandler;
    std::mutex m_callbackMutex;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_paused{false};
    std::atomic<bool> m_stopRequested{false};
    std::atomic<uint64_t> m_tickCount{0};

    void runFrames();
    void processUpdates();
    void invokePollHandler();
    void invokeUpdateHandler(float deltaTime);

    ServerLoop(const ServerLoop&) = delete;
    ServerLoop& operator=(const ServerLoop&) = delete;
};

#endif // SERVER_LOOP_HPP
