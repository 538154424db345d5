/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MUD_RUNTIME_HPP
#define MUD_RUNTIME_HPP

/**
 * @file MudRuntime.hpp
 * @brief Owns the runtime's subsystems and exposes the intent surface the
 * session layer drives.
 *
 * Initialization order:
 *   1. Logger, ThreadSystem (optional worker pool)
 *   2. EventManager, ContentRegistry (content loaded exactly once)
 *   3. WorldClock, EntityRegistry, RoomStateManager, SpawnLootEngine,
 *      ScheduleResolver, PersistenceGateway
 *   4. Controllers: Weather, Combat, Pursuit, Upkeep (subscribed last)
 *
 * Every intent resolves the actor's room, takes that room's lock (both
 * rooms for a move, in sorted order) and re-checks the actor is still there
 * before handing off to the controllers. No lock is held across a call into
 * the persistence collaborator.
 *
 * Output reaches sessions through one OutputSink: events addressed to a
 * player go to that player, room broadcasts go to every connected player in
 * the room, weather changes go to players outside in the region.
 */

#include "controllers/ControllerRegistry.hpp"
#include "controllers/combat/CombatTypes.hpp"
#include "core/RuntimeSettings.hpp"
#include "entities/EntityInstance.hpp"
#include "managers/EventManager.hpp"
#include "managers/PersistenceGateway.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class IContentSource;
class CombatController;
class PursuitController;
class WeatherController;
class UpkeepController;
class RoomLock;

namespace AnchorMud {
class DiceRoller;
}

class MudRuntime {
public:
    using OutputSink = std::function<void(EntityHandle recipient, const std::string& text)>;

    static MudRuntime& Instance() {
        static MudRuntime instance;
        return instance;
    }

    /**
     * @brief Bring every subsystem up.
     * @param startWorkers Start the ThreadSystem pool; tests pass false and
     * every batch runs inline on the calling thread
     * @return false if content could not be loaded or a manager failed
     */
    bool init(const AnchorMud::RuntimeSettings& settings, IContentSource& content,
              std::shared_ptr<IPersistenceService> persistence, bool startWorkers = true);

    [[nodiscard]] bool isInitialized() const { return m_initialized.load(std::memory_order_acquire); }

    /**
     * @brief Flush pending saves and shut everything down in reverse order
     */
    void clean();

    /**
     * @brief One server tick: advance the clock, drain events, run the
     * controllers, dispatch due saves.
     */
    void update(float realDeltaSeconds);

    // ------------------------------------------------------------------
    // Sessions
    // ------------------------------------------------------------------

    /**
     * @brief Validate, load the character and place it in the world.
     * A player still inside its disconnect grace is taken over instead.
     * @return Invalid handle when the account is rejected
     */
    EntityHandle connectPlayer(const std::string& accountName, const std::string& credential,
                               const std::string& sessionId = {});

    /**
     * @brief Drop the player from combat, keep the body in place for the
     * grace period and queue a save.
     */
    void disconnectPlayer(EntityHandle player);

    /**
     * @brief Save and destroy a player (grace expired or logout)
     * @param onlyIfGraceExpired Leave the body alone unless it is still
     * disconnected past its grace, checked under its room lock
     */
    bool removePlayer(EntityHandle player, bool onlyIfGraceExpired = false);

    // ------------------------------------------------------------------
    // Intents
    // ------------------------------------------------------------------

    ActionResult attack(EntityHandle actor, const std::string& targetName);
    ActionResult attack(EntityHandle actor, EntityHandle target);
    ActionResult useManeuver(EntityHandle actor, const std::string& maneuverId,
                             const std::string& targetName = {});
    ActionResult disengage(EntityHandle actor);

    /**
     * @brief Walk through an exit. On success the message is the rendered
     * destination room.
     */
    ActionResult move(EntityHandle actor, const std::string& direction);

    ActionResult joinCombat(EntityHandle actor);
    ActionResult advance(EntityHandle actor);
    ActionResult ready(EntityHandle actor, const std::string& maneuverId);

    /**
     * @brief Take an item from the floor. Weapons and armor are equipped when
     * the matching slot is free; anything else goes into the pack.
     */
    ActionResult pickUp(EntityHandle actor, const std::string& itemName);

    /**
     * @brief Room text as seen by viewer: name, description, weather,
     * occupants and exits. Read-only apart from lazy weather resolution.
     */
    std::string renderRoom(const std::string& roomId, EntityHandle viewer);
    std::string look(EntityHandle viewer);

    // ------------------------------------------------------------------
    // Hooks
    // ------------------------------------------------------------------

    void setOutputSink(OutputSink sink);

    /**
     * @brief Mark a schedule NPC busy (trade, dialogue). An empty reason
     * clears it.
     */
    void setBusy(const std::string& npcId, const std::string& reason);

    /**
     * @brief Dice for encounter rolls and combat contests (tests script them)
     */
    void setDiceRoller(AnchorMud::DiceRoller* roller);

    [[nodiscard]] const AnchorMud::RuntimeSettings& getSettings() const { return m_settings; }

    CombatController& getCombat();
    PursuitController& getPursuit();
    WeatherController& getWeather();
    UpkeepController& getUpkeep();

    static CharacterSheet makeSheet(const EntityInstance& player, const std::string& roomId);
    static PlayerData makePlayerData(const CharacterSheet& sheet, const std::string& sessionId);

private:
    MudRuntime() = default;
    ~MudRuntime() = default;
    MudRuntime(const MudRuntime&) = delete;
    MudRuntime& operator=(const MudRuntime&) = delete;

    /**
     * @brief Lock the actor's current room and run fn(RoomLock&) once the
     * actor is confirmed to still stand in it.
     */
    template <typename Fn>
    ActionResult withActorRoom(EntityHandle actor, Fn&& fn);

    EntityHandle findTarget(const std::string& roomId, EntityHandle actor,
                            const std::string& name) const;
    void arrive(RoomLock& room, EntityHandle actor, double now);
    std::optional<std::string> busyReason(const std::string& npcId) const;

    void registerOutputHandlers();
    void routeEvent(const EventData& data);
    void deliver(EntityHandle recipient, const std::string& text);
    void broadcastToRoom(const std::string& roomId, const std::string& text, EntityHandle skip);

    AnchorMud::RuntimeSettings m_settings;
    ControllerRegistry m_controllers;
    CombatController* mp_combat{nullptr};
    PursuitController* mp_pursuit{nullptr};
    WeatherController* mp_weather{nullptr};
    UpkeepController* mp_upkeep{nullptr};
    AnchorMud::DiceRoller* m_roller{nullptr};
    bool m_ownsThreadSystem{false};

    std::vector<EventManager::HandlerToken> m_outputTokens;
    mutable std::mutex m_sinkMutex;
    OutputSink m_sink;

    mutable std::mutex m_busyMutex;
    std::unordered_map<std::string, std::string> m_busy;

    std::atomic<bool> m_initialized{false};
};

#endif // MUD_RUNTIME_HPP
