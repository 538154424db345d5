/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWN_LOOT_ENGINE_HPP
#define SPAWN_LOOT_ENGINE_HPP

/**
 * @file SpawnLootEngine.hpp
 * @brief Creates entity instances from room rules, loot tables and zone
 * encounter tables, and retires them on death or expiry.
 *
 * Every entry point that touches a room takes that room's RoomLock from the
 * caller. Spawn counts and room loot rolls are seeded from the room seed and
 * the rule's fire count, so a given room epoch replays the same results.
 */

#include "core/RuntimeSettings.hpp"
#include "entities/EntityInstance.hpp"
#include "managers/RoomStateManager.hpp"
#include "utils/DiceRoller.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

class LootEvent;

struct SpawnReport {
    std::vector<EntityHandle> creatures;
    std::vector<EntityHandle> items;
    uint64_t encounterId{0};

    [[nodiscard]] bool empty() const { return creatures.empty() && items.empty(); }
};

class SpawnLootEngine {
public:
    static SpawnLootEngine& Instance() {
        static SpawnLootEngine instance;
        return instance;
    }

    struct Config {
        float encounterRollChance{0.35f};
        int64_t encounterCooldownSeconds{120};
        int64_t wanderExpirySeconds{900};
        int64_t dropExpirySeconds{600};
    };

    bool init(const AnchorMud::RuntimeSettings& settings);
    [[nodiscard]] bool isInitialized() const { return m_initialized.load(std::memory_order_acquire); }
    void clean();

    /**
     * @brief Entities for which this returns true are never expired
     * (set by the combat layer to protect engaged creatures).
     */
    void setCombatPredicate(std::function<bool(EntityHandle)> inCombat);

    // ========================================================================
    // ROOM RULES
    // ========================================================================

    /**
     * @brief Fire every eligible spawn and loot rule of the locked room.
     */
    SpawnReport evaluateRoom(RoomLock& room, double now);

    /**
     * @brief Roll for a random encounter from the room's zone table.
     * Gated by the room's encounter cooldown and the configured chance.
     */
    SpawnReport rollEncounter(RoomLock& room, double now, AnchorMud::DiceRoller& dice);

    // ========================================================================
    // INSTANCE FACTORIES
    // ========================================================================

    static CombatStats makeCombatStats(const AnchorMud::CombatTemplate& combat);

    EntityHandle spawnCreature(const std::string& templateId, const std::string& roomId,
                               AnchorMud::RangeBand band, std::optional<double> expiresAt,
                               const std::string& ruleId = {}, uint64_t encounterId = 0);

    EntityHandle spawnNpc(const std::string& templateId, const std::string& roomId);

    EntityHandle spawnItem(const std::string& templateId, const std::string& roomId,
                           int quantity, std::optional<double> expiresAt,
                           const std::string& ruleId = {}, EntityHandle reservedFor = {});

    // ========================================================================
    // DEATH AND LOOT
    // ========================================================================

    /**
     * @brief Remove a dead combatant and roll its loot table exactly once.
     *
     * Destroys the instance and its position, releases its spawn rule slot,
     * clears its encounter bookkeeping and drops items in the same room,
     * reserved for the killer when the killer is a player.
     *
     * @param dead Copy of the instance taken before removal
     * @param dice Loot roller; the calling thread's roller when null
     * @return The loot event (also dispatched), or nullptr if the handle was
     * already stale
     */
    std::shared_ptr<LootEvent> handleDeath(RoomLock& room, EntityHandle handle,
                                           const EntityInstance& dead, EntityHandle killer,
                                           double now, AnchorMud::DiceRoller* dice = nullptr);

    /**
     * @brief Roll a loot table and create the items.
     */
    std::vector<EntityHandle> rollLootTable(const std::string& tableId, const std::string& roomId,
                                            double now, AnchorMud::DiceRoller& dice,
                                            EntityHandle reservedFor = {});

    /**
     * @brief Pick up an item. Honors loot reservations.
     */
    bool takeItem(RoomLock& room, EntityHandle item, EntityHandle taker);

    // ========================================================================
    // EXPIRY
    // ========================================================================

    /**
     * @brief Lazy expiry for the locked room: items and unengaged wandering
     * creatures past their expiry.
     * @return Number of instances removed
     */
    size_t expireInRoom(RoomLock& room, double now);

    /**
     * @brief Background sweep over every room holding expirable instances.
     */
    size_t sweepExpired(double now);

    // Statistics
    [[nodiscard]] uint64_t getLootRollCount() const { return m_lootRolls.load(); }
    [[nodiscard]] uint64_t getLootRollCount(const std::string& tableId) const;
    [[nodiscard]] uint64_t getSpawnCount() const { return m_spawned.load(); }
    void resetStats();

private:
    SpawnLootEngine() = default;
    ~SpawnLootEngine() = default;
    SpawnLootEngine(const SpawnLootEngine&) = delete;
    SpawnLootEngine& operator=(const SpawnLootEngine&) = delete;

    void releaseInstance(RoomRecord& record, const EntityInstance& instance);
    bool isProtected(EntityHandle handle) const;

    Config m_config;
    std::function<bool(EntityHandle)> m_inCombat;
    mutable std::mutex m_predicateMutex;

    std::atomic<uint64_t> m_lootRolls{0};
    std::atomic<uint64_t> m_spawned{0};
    mutable std::mutex m_statsMutex;
    std::unordered_map<std::string, uint64_t> m_rollsByTable;

    std::atomic<bool> m_initialized{false};
};

#endif // SPAWN_LOOT_ENGINE_HPP
