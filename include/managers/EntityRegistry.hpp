/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_REGISTRY_HPP
#define ENTITY_REGISTRY_HPP

/**
 * @file EntityRegistry.hpp
 * @brief Owner of every live entity instance and its position
 *
 * Slot arena + id index: instances live in a slot vector, handles carry the
 * slot generation so a destroyed entity's handle is rejected instead of
 * aliasing whatever reuses the slot.
 *
 * Thread safety: the registry serializes its own structures with a
 * shared_mutex. Multi-step logic over one room (read then write back)
 * is linearized by the caller holding that room's lock from
 * RoomStateManager; the registry itself never takes room locks.
 */

#include "entities/EntityInstance.hpp"
#include <boost/container/flat_set.hpp>
#include <atomic>
#include <optional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

class EntityRegistry {
public:
    static EntityRegistry& Instance() {
        static EntityRegistry instance;
        return instance;
    }

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    bool init();

    [[nodiscard]] bool isInitialized() const noexcept {
        return m_initialized.load(std::memory_order_acquire);
    }

    void clean();

    // ========================================================================
    // CREATION / DESTRUCTION
    // ========================================================================

    /**
     * @brief Register a new instance at a position.
     * @return Handle to the entity, or an invalid handle if the position has
     * no room
     */
    EntityHandle createEntity(EntityInstance instance, EntityPosition position);

    /**
     * @brief Remove the instance and its position in one step.
     * @return false if the handle was already stale
     */
    bool destroyEntity(EntityHandle handle);

    [[nodiscard]] bool isValidHandle(EntityHandle handle) const;

    // ========================================================================
    // INSTANCE ACCESS
    // ========================================================================

    [[nodiscard]] std::optional<EntityInstance> getInstance(EntityHandle handle) const;

    /**
     * @brief Run fn(EntityInstance&) under the registry's write lock.
     * fn must not call back into the registry.
     */
    template <typename F>
    bool modifyInstance(EntityHandle handle, F&& fn);

    /**
     * @brief Write back a modified copy taken with getInstance().
     * Rejected if the copy's template id differs from the stored one.
     */
    bool replaceInstance(EntityHandle handle, const EntityInstance& instance);

    // ========================================================================
    // POSITIONS
    // ========================================================================

    [[nodiscard]] std::optional<EntityPosition> getPosition(EntityHandle handle) const;

    /**
     * @brief The only way an entity changes rooms. Clears its engaged target.
     */
    bool moveTo(EntityHandle handle, const std::string& roomId,
                std::optional<AnchorMud::RangeBand> band);

    bool setRangeBand(EntityHandle handle, std::optional<AnchorMud::RangeBand> band);
    bool setEngagedTarget(EntityHandle handle, EntityHandle target);

    // ========================================================================
    // QUERIES
    // ========================================================================

    [[nodiscard]] std::vector<EntityHandle> getEntitiesInRoom(const std::string& roomId) const;
    [[nodiscard]] std::vector<EntityHandle> getEntitiesInRoom(const std::string& roomId,
                                                              EntityKind kind) const;
    [[nodiscard]] size_t countInRoom(const std::string& roomId, EntityKind kind) const;
    [[nodiscard]] bool hasPlayersInRoom(const std::string& roomId) const {
        return countInRoom(roomId, EntityKind::Player) > 0;
    }

    /**
     * @brief Case-insensitive name prefix match among a room's entities,
     * in id order.
     */
    [[nodiscard]] std::vector<EntityHandle> findInRoomByName(const std::string& roomId,
                                                             const std::string& name) const;

    [[nodiscard]] std::vector<EntityHandle> getAllEntities(EntityKind kind) const;
    [[nodiscard]] std::vector<std::string> getRoomsWithPlayers() const;
    [[nodiscard]] size_t getEntityCount() const;

    /**
     * @brief Clear engaged-target references in a room that point at
     * destroyed entities or at entities no longer in the room.
     * @return Number of references purged
     */
    size_t purgeStaleTargets(const std::string& roomId);

private:
    EntityRegistry() = default;
    ~EntityRegistry() = default;
    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    struct Slot {
        std::optional<EntityInstance> instance;
        EntityPosition position;
        EntityHandle::IDType id{EntityHandle::INVALID_ID};
        EntityHandle::Generation generation{EntityHandle::INVALID_GENERATION};
    };

    using RoomMembers = boost::container::flat_set<EntityHandle>;

    // Caller holds m_mutex
    [[nodiscard]] size_t findSlot(EntityHandle handle) const;
    size_t allocateSlot();
    uint8_t nextGeneration(size_t index) const;
    void unindex(const std::string& roomId, EntityHandle handle);

    std::vector<Slot> m_slots;
    std::vector<size_t> m_freeSlots;
    std::unordered_map<EntityHandle::IDType, size_t> m_idToIndex;
    std::unordered_map<std::string, RoomMembers> m_roomIndex;

    mutable std::shared_mutex m_mutex;
    std::atomic<bool> m_initialized{false};

    static constexpr size_t INVALID_INDEX = static_cast<size_t>(-1);
};

template <typename F>
bool EntityRegistry::modifyInstance(EntityHandle handle, F&& fn) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    size_t index = findSlot(handle);
    if (index == INVALID_INDEX) {
        return false;
    }
    fn(*m_slots[index].instance);
    auto* stats = m_slots[index].instance->combat();
    if (stats && stats->hpCurrent > stats->hpMax) {
        stats->hpCurrent = stats->hpMax;
    }
    return true;
}

#endif // ENTITY_REGISTRY_HPP
