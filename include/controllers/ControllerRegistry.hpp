/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_REGISTRY_HPP
#define CONTROLLER_REGISTRY_HPP

/**
 * @file ControllerRegistry.hpp
 * @brief Owns the runtime's controllers and drives their ticks
 *
 * Registration order is tick order and the reverse of teardown order.
 * Controllers may hold references to ones registered before them (pursuit
 * and upkeep both borrow the combat controller), so:
 * - updateAll() runs combat before pursuit before upkeep
 * - clear() destroys the newest controller first
 *
 * @code
 *     auto& weather = m_controllers.add<WeatherController>(settings);
 *     auto& combat = m_controllers.add<CombatController>(settings, &weather);
 *     m_controllers.add<PursuitController>(combat, settings, &weather);
 *     m_controllers.subscribeAll();
 *     ...
 *     m_controllers.updateAll(WorldClock::Instance().now());
 * @endcode
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

class ControllerRegistry
{
public:
    ControllerRegistry() = default;
    ~ControllerRegistry() { clear(); }

    ControllerRegistry(const ControllerRegistry&) = delete;
    ControllerRegistry& operator=(const ControllerRegistry&) = delete;

    /**
     * @brief Construct and register a T, or return the one already present
     */
    template<typename T, typename... Args>
    T& add(Args&&... args)
    {
        static_assert(std::is_base_of_v<ControllerBase, T>,
            "T must derive from ControllerBase");

        if (T* existing = get<T>()) {
            return *existing;
        }

        auto controller = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *controller;

        Slot slot;
        slot.base = controller.get();
        if constexpr (std::is_base_of_v<IUpdatable, T>) {
            slot.updatable = static_cast<IUpdatable*>(&ref);
        }
        m_indexByType.emplace(std::type_index(typeid(T)), m_slots.size());
        m_slots.push_back(slot);
        m_owned.push_back(std::move(controller));
        return ref;
    }

    template<typename T>
    T* get() const
    {
        auto it = m_indexByType.find(std::type_index(typeid(T)));
        return it == m_indexByType.end() ? nullptr : static_cast<T*>(m_slots[it->second].base);
    }

    template<typename T>
    [[nodiscard]] bool has() const { return get<T>() != nullptr; }

    void subscribeAll()
    {
        for (auto& slot : m_slots) {
            slot.base->subscribe();
        }
    }

    void unsubscribeAll()
    {
        for (auto it = m_slots.rbegin(); it != m_slots.rend(); ++it) {
            it->base->unsubscribe();
        }
    }

    void suspendAll()
    {
        for (auto& slot : m_slots) {
            slot.base->suspend();
        }
    }

    void resumeAll()
    {
        for (auto& slot : m_slots) {
            slot.base->resume();
        }
    }

    /**
     * @brief Tick every updatable, unsuspended controller in registration order
     */
    void updateAll(double worldSeconds)
    {
        for (auto& slot : m_slots) {
            if (slot.updatable && !slot.base->isSuspended()) {
                slot.updatable->update(worldSeconds);
            }
        }
    }

    /**
     * @brief Controller names in tick order (startup log)
     */
    [[nodiscard]] std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        out.reserve(m_slots.size());
        for (const auto& slot : m_slots) {
            out.emplace_back(slot.base->getName());
        }
        return out;
    }

    [[nodiscard]] size_t size() const { return m_slots.size(); }
    [[nodiscard]] bool empty() const { return m_slots.empty(); }

    /**
     * @brief Unsubscribe everything, then destroy newest first
     */
    void clear()
    {
        unsubscribeAll();
        while (!m_owned.empty()) {
            m_owned.pop_back();
        }
        m_slots.clear();
        m_indexByType.clear();
    }

private:
    struct Slot {
        ControllerBase* base{nullptr};
        IUpdatable* updatable{nullptr};   // null for event-only controllers
    };

    std::vector<std::unique_ptr<ControllerBase>> m_owned;
    std::vector<Slot> m_slots;
    std::unordered_map<std::type_index, size_t> m_indexByType;
};

#endif // CONTROLLER_REGISTRY_HPP
