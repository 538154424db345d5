/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_BASE_HPP
#define CONTROLLER_BASE_HPP

/**
 * @file ControllerBase.hpp
 * @brief Base class for runtime controllers
 *
 * Controllers hold the per-room behaviour of the runtime (combat rounds,
 * attack tickers, pursuit, weather, upkeep sweeps). They read and write the
 * managers' data but own only their own bookkeeping, and they react to
 * EventManager events through handler tokens that are removed on
 * destruction.
 *
 * Ownership: MudRuntime owns the ControllerRegistry, which owns the
 * controllers.
 */

#include "managers/EventManager.hpp"
#include <string_view>
#include <vector>

class ControllerBase
{
public:
    virtual ~ControllerBase() { unsubscribe(); }

    // Event handlers capture 'this'
    ControllerBase(const ControllerBase&) = delete;
    ControllerBase& operator=(const ControllerBase&) = delete;

    /**
     * @brief Register event handlers. Must be idempotent.
     */
    virtual void subscribe() = 0;

    [[nodiscard]] virtual std::string_view getName() const = 0;

    /**
     * @brief Remove all registered event handlers
     * @note Safe to call multiple times
     */
    void unsubscribe()
    {
        if (!m_subscribed) {
            return;
        }

        auto& eventMgr = EventManager::Instance();
        for (const auto& token : m_handlerTokens) {
            eventMgr.removeHandler(token);
        }
        m_handlerTokens.clear();
        m_subscribed = false;
    }

    [[nodiscard]] bool isSubscribed() const { return m_subscribed; }

    // Suspended controllers are skipped by ControllerRegistry::updateAll()
    virtual void suspend() { m_suspended = true; }
    virtual void resume() { m_suspended = false; }
    [[nodiscard]] bool isSuspended() const { return m_suspended; }

protected:
    ControllerBase() = default;

    void addHandlerToken(const EventManager::HandlerToken& token)
    {
        m_handlerTokens.push_back(token);
    }

    void setSubscribed(bool subscribed) { m_subscribed = subscribed; }

    [[nodiscard]] bool checkAlreadySubscribed() const { return m_subscribed; }

private:
    bool m_subscribed{false};
    bool m_suspended{false};
    std::vector<EventManager::HandlerToken> m_handlerTokens;
};

#endif // CONTROLLER_BASE_HPP
