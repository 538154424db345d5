/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_CONTROLLER_HPP
#define COMBAT_CONTROLLER_HPP

/**
 * @file CombatController.hpp
 * @brief Per-room combat sessions, rounds and attack tickers
 *
 * CombatController handles:
 * - Combat sessions: fixed initiative, late-joiner queue, round counter
 * - Intents: attack, maneuver, join, advance, ready
 * - Ticker fires: one basic attack per due fire, resolved under the room lock
 * - Rounds: action, reaction, resolution and summary phases every
 *   round_seconds
 * - Deaths, retargeting and the end of a session
 *
 * Every method that takes a RoomLock expects the caller to hold that room.
 * tick() and processRespawns() take room locks themselves and must be
 * called without holding any.
 *
 * A defeated player is healed where it fell and queued for respawn; the
 * move to the respawn room happens later under both room locks.
 *
 * Session data is only touched under its room's lock. The per-entity
 * combat state is mirrored into an index with its own lock so other rooms
 * (spawn expiry, schedules) can ask "is this entity fighting" cheaply.
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include "controllers/combat/AttackTicker.hpp"
#include "controllers/combat/CombatResolver.hpp"
#include "controllers/combat/CombatTypes.hpp"
#include "core/RuntimeSettings.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class RoomLock;
class WeatherController;
class Event;

namespace AnchorMud {
class DiceRoller;
}

struct CombatParticipant {
    EntityHandle handle;
    CombatSide side{CombatSide::World};
    CombatState state{CombatState::Observing};
    EntityHandle target;
    int initiative{0};
    bool lateJoiner{false};

    uint8_t modifiers{AnchorMud::CombatModifier::NONE};
    std::map<uint8_t, int> modifierRounds;   // Modifier bit -> rounds left

    bool primaryUsed{false};
    bool minorUsed{false};
    std::string readiedManeuver;             // Armed reaction

    double fleeUntil{0.0};
    EntityHandle fleeFrom;                   // Target to resume if the window lapses
};

struct PendingAction {
    EntityHandle actor;
    std::string maneuverId;
    EntityHandle target;
};

struct PendingRespawn {
    EntityHandle player;
    std::string deathRoom;
};

struct PendingReaction {
    EntityHandle actor;
    EntityHandle target;
    std::string maneuverId;
};

/**
 * @brief Read-only copy of a session for tests and tools
 */
struct CombatSessionSnapshot {
    std::string roomId;
    uint64_t sessionId{0};
    int round{1};
    double nextRoundAt{0.0};
    std::vector<EntityHandle> initiativeOrder;
    std::vector<EntityHandle> lateJoiners;
    std::vector<CombatParticipant> participants;
};

class CombatController : public ControllerBase, public IUpdatable
{
public:
    explicit CombatController(const AnchorMud::RuntimeSettings& settings = {},
                              WeatherController* weather = nullptr);
    ~CombatController() override;

    /**
     * @brief Engage aggressive creatures when a player enters or a creature
     * spawns next to one
     */
    void subscribe() override;

    [[nodiscard]] std::string_view getName() const override { return "CombatController"; }

    /**
     * @brief Server tick, same as tick(worldSeconds)
     */
    void update(double worldSeconds) override;

    /**
     * @brief Fire due tickers, run due rounds, lapse flee windows, then
     * move defeated players to the respawn room.
     */
    void tick(double now);

    /**
     * @brief Called under the respawn room's lock after a defeated player
     * arrives there (spawn evaluation, aggro)
     */
    using ArrivalHandler = std::function<void(RoomLock& room, EntityHandle player, double now)>;
    void setArrivalHandler(ArrivalHandler handler) { m_onArrival = std::move(handler); }

    /**
     * @brief Move queued defeated players to the respawn room, each under
     * the locks of the room it fell in and the respawn room.
     * @return Players moved
     */
    size_t processRespawns(double now);
    [[nodiscard]] size_t getPendingRespawnCount() const;

    // ------------------------------------------------------------------
    // Intents (caller holds the room lock)
    // ------------------------------------------------------------------

    /**
     * @brief Start auto-attacking a target.
     *
     * Creates the room's session if needed, engages the target back and
     * starts or retargets the attacker's ticker.
     */
    ActionResult attack(RoomLock& room, EntityHandle attacker, EntityHandle target, double now);

    /**
     * @brief Queue a maneuver as this round's primary action.
     * @param target Invalid handle means the current target
     */
    ActionResult useManeuver(RoomLock& room, EntityHandle actor, const std::string& maneuverId,
                             EntityHandle target, double now);

    /**
     * @brief Join the room's fight in a supporting role
     */
    ActionResult joinCombat(RoomLock& room, EntityHandle actor, double now);

    /**
     * @brief Minor action: close one range band
     */
    ActionResult advance(RoomLock& room, EntityHandle actor, double now);

    /**
     * @brief Minor action: arm a reaction maneuver for this round
     */
    ActionResult ready(RoomLock& room, EntityHandle actor, const std::string& maneuverId);

    /**
     * @brief Hostile creatures in the room engage any player present.
     * @return Number of creatures that started fighting
     */
    size_t engageAggressors(RoomLock& room, double now);

    // ------------------------------------------------------------------
    // Hooks for PursuitController and MudRuntime (caller holds the lock)
    // ------------------------------------------------------------------

    [[nodiscard]] std::optional<CombatParticipant> getParticipant(RoomLock& room,
                                                                  EntityHandle handle) const;

    /**
     * @brief Hostile participants currently aimed at handle
     */
    [[nodiscard]] std::vector<EntityHandle> getHostilesTargeting(RoomLock& room,
                                                                 EntityHandle handle) const;

    /**
     * @brief Successful disengage: Disengaging with a flee window, ticker
     * cancelled, previous target remembered.
     */
    void beginFleeWindow(RoomLock& room, EntityHandle handle, double fleeUntil);

    /**
     * @brief Failed disengage: stays Engaged on the same target and loses
     * this round's primary action.
     */
    void failDisengage(RoomLock& room, EntityHandle handle, double now);

    /**
     * @brief Interrupts: hostiles aimed at handle with an OnDisengage
     * reaction readied strike now, within the round's reaction budget.
     * @return Reactions resolved
     */
    int resolveDisengageReactions(RoomLock& room, EntityHandle handle, double now);

    /**
     * @brief Take an entity out of the room's session (left, despawned,
     * disconnected). Those aimed at it retarget or stand down.
     */
    void removeFromCombat(RoomLock& room, EntityHandle handle, const std::string& reason,
                          double now);

    /**
     * @brief A pursuer arrives in a room and keeps fighting its quarry.
     * Joins the room's session (or starts one) from the far band.
     */
    void engageOnArrival(RoomLock& room, EntityHandle pursuer, EntityHandle target, double now);

    // ------------------------------------------------------------------
    // Queries (any thread)
    // ------------------------------------------------------------------

    [[nodiscard]] CombatState getCombatState(EntityHandle handle) const;
    [[nodiscard]] bool isInCombat(EntityHandle handle) const;
    [[nodiscard]] std::optional<std::string> getCombatRoom(EntityHandle handle) const;
    [[nodiscard]] bool hasSession(const std::string& roomId) const;
    [[nodiscard]] std::optional<CombatSessionSnapshot> getSessionSnapshot(RoomLock& room) const;
    [[nodiscard]] size_t getSessionCount() const;
    [[nodiscard]] std::vector<std::string> getActiveRooms() const;

    AttackTicker& getTicker() { return m_ticker; }
    const CombatResolver& getResolver() const { return m_resolver; }

    /**
     * @brief Replace the dice used for contests (tests script outcomes)
     */
    void setDiceRoller(AnchorMud::DiceRoller* roller) { m_roller = roller; }

    static const char* healthBand(int current, int max);

private:
    struct CombatSession {
        std::string roomId;
        uint64_t id{0};
        int round{1};
        double startedAt{0.0};
        double nextRoundAt{0.0};
        std::vector<EntityHandle> initiativeOrder;   // Fixed at creation
        std::vector<EntityHandle> lateJoiners;
        std::unordered_map<EntityHandle, CombatParticipant> participants;
        std::vector<PendingAction> actions;
        std::vector<PendingReaction> reactions;
        std::vector<std::string> notable;            // Status changes for the summary
        int reactionsUsed{0};
    };

    using SessionPtr = std::shared_ptr<CombatSession>;

    AnchorMud::DiceRoller& dice() const;

    SessionPtr findSession(const std::string& roomId) const;
    SessionPtr createSession(RoomLock& room, const std::vector<EntityHandle>& founders,
                             double now, bool closeIn);
    void endSession(RoomLock& room, CombatSession& session, const std::string& reason);

    CombatParticipant& addParticipant(CombatSession& session, EntityHandle handle,
                                      bool lateJoiner, bool distant);
    CombatParticipant* findParticipant(CombatSession& session, EntityHandle handle) const;
    double intervalFor(EntityHandle handle) const;
    void setState(CombatSession& session, CombatParticipant& participant, CombatState state,
                  const std::string& reason);

    /**
     * @brief Bring a participant's state and ticker in line with its target:
     * Engaged with a ticker when the target is valid and in reach,
     * Supporting when it is out of reach, retarget or Observing otherwise.
     */
    void refreshEngagement(CombatSession& session, CombatParticipant& participant, double now);

    /**
     * @brief Validate target for actor in this room.
     * Purges stale engaged-target references along the way.
     */
    ActionResult validateTarget(const std::string& roomId, EntityHandle actor,
                                EntityHandle target, bool checkReach);
    bool inReach(EntityHandle actor, EntityHandle target) const;
    EntityHandle findNewTarget(const CombatSession& session,
                               const CombatParticipant& participant) const;

    void executeTickerFire(RoomLock& room, const TickerFire& fire, double now);
    void runRoomBatch(const std::string& roomId, const std::vector<TickerFire>& fires, double now);
    void runRound(RoomLock& room, CombatSession& session, double now);

    /**
     * @brief Resolve one attack (basic or maneuver) and handle the fallout:
     * events, weapon breakage, defender engagement, death.
     */
    void performAttack(RoomLock& room, CombatSession& session, EntityHandle attacker,
                       EntityHandle target, const AnchorMud::ManeuverDef* maneuver, double now,
                       bool isReaction);

    void handleDeath(RoomLock& room, CombatSession& session, EntityHandle victim,
                     const EntityInstance& dead, EntityHandle killer, double now);
    void purgeTarget(CombatSession& session, EntityHandle gone, double now);
    bool hostilesRemain(const CombatSession& session) const;
    std::vector<EntityHandle> roundQueue(const CombatSession& session) const;
    void emitSummary(const CombatSession& session);
    void lapseFleeWindows(RoomLock& room, CombatSession& session, double now);
    void onPresenceEvent(const EventData& data);

    void dispatch(const std::shared_ptr<Event>& event, const std::string& roomId) const;
    void notify(EntityHandle recipient, const std::string& roomId, const ActionResult& result) const;

    AnchorMud::RuntimeSettings m_settings;
    CombatResolver m_resolver;
    AttackTicker m_ticker;
    WeatherController* mp_weather{nullptr};
    AnchorMud::DiceRoller* m_roller{nullptr};
    ArrivalHandler m_onArrival;

    mutable std::mutex m_respawnMutex;
    std::vector<PendingRespawn> m_pendingRespawns;

    mutable std::mutex m_sessionsMutex;
    std::unordered_map<std::string, SessionPtr> m_sessions;

    struct IndexEntry {
        std::string roomId;
        CombatState state{CombatState::Observing};
    };
    mutable std::shared_mutex m_indexMutex;
    std::unordered_map<EntityHandle, IndexEntry> m_index;
};

#endif // COMBAT_CONTROLLER_HPP
