/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/CombatController.hpp"
#include "controllers/world/WeatherController.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "core/WorldClock.hpp"
#include "events/CombatEvent.hpp"
#include "events/CombatStateEvent.hpp"
#include "events/NoticeEvent.hpp"
#include "events/PresenceEvent.hpp"
#include "events/RoundSummaryEvent.hpp"
#include "managers/ContentRegistry.hpp"
#include "managers/EntityRegistry.hpp"
#include "managers/RoomStateManager.hpp"
#include "managers/SpawnLootEngine.hpp"
#include "utils/DiceRoller.hpp"
#include "utils/UniqueID.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>

using AnchorMud::RangeBand;

namespace {

constexpr int MAX_ROUND_CATCH_UP = 4;
constexpr int MAX_RESPAWN_ATTEMPTS = 4;

std::string nameOf(EntityHandle handle)
{
    auto instance = EntityRegistry::Instance().getInstance(handle);
    return instance ? instance->name : std::string("someone");
}

CombatSide sideOf(EntityHandle handle)
{
    return handle.isPlayer() ? CombatSide::Players : CombatSide::World;
}

RangeBand bandOf(EntityHandle handle)
{
    auto position = EntityRegistry::Instance().getPosition(handle);
    if (!position || !position->band) {
        return RangeBand::Near;
    }
    return *position->band;
}

const char* modifierName(uint8_t bit)
{
    switch (bit) {
        case AnchorMud::CombatModifier::EXPOSED:   return "exposed";
        case AnchorMud::CombatModifier::PINNED:    return "pinned";
        case AnchorMud::CombatModifier::STAGGERED: return "staggered";
        default:                                   return "hampered";
    }
}

} // namespace

CombatController::CombatController(const AnchorMud::RuntimeSettings& settings,
                                   WeatherController* weather)
    : m_settings(settings), m_resolver(settings), mp_weather(weather)
{
}

CombatController::~CombatController() = default;

void CombatController::subscribe()
{
    if (checkAlreadySubscribed()) {
        return;
    }

    auto token = EventManager::Instance().registerHandlerWithToken(
        EventTypeId::Presence,
        [this](const EventData& data) { onPresenceEvent(data); });
    addHandlerToken(token);

    setSubscribed(true);
    COMBAT_INFO("CombatController subscribed");
}

void CombatController::onPresenceEvent(const EventData& data)
{
    auto presence = std::dynamic_pointer_cast<PresenceEvent>(data.event);
    if (!presence || presence->getRoomId().empty()) {
        return;
    }

    const bool playerArrived = presence->getChange() == PresenceChange::Entered &&
                               presence->getEntity().isPlayer();
    const bool creatureSpawned = presence->getChange() == PresenceChange::Spawned &&
                                 presence->getEntity().isCombatant();
    if (!playerArrived && !creatureSpawned) {
        return;
    }

    auto room = RoomStateManager::Instance().lockRoom(presence->getRoomId());
    if (room) {
        engageAggressors(room, WorldClock::Instance().now());
    }
}

void CombatController::update(double worldSeconds)
{
    tick(worldSeconds);
}

AnchorMud::DiceRoller& CombatController::dice() const
{
    return m_roller ? *m_roller : AnchorMud::DiceRoller::threadLocal();
}

// ============================================================================
// SESSIONS
// ============================================================================

CombatController::SessionPtr CombatController::findSession(const std::string& roomId) const
{
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    auto it = m_sessions.find(roomId);
    return it == m_sessions.end() ? nullptr : it->second;
}

CombatParticipant* CombatController::findParticipant(CombatSession& session,
                                                     EntityHandle handle) const
{
    auto it = session.participants.find(handle);
    return it == session.participants.end() ? nullptr : &it->second;
}

CombatController::SessionPtr CombatController::createSession(
    RoomLock& room, const std::vector<EntityHandle>& founders, double now, bool closeIn)
{
    auto session = std::make_shared<CombatSession>();
    session->roomId = room.roomId();
    session->id = AnchorMud::UniqueID::generate(AnchorMud::IdSpace::CombatSession);
    session->startedAt = now;
    session->nextRoundAt = now + m_settings.roundSeconds;

    // Initiative is rolled once here and never again for this session
    std::vector<std::pair<int, EntityHandle>> rolls;
    for (EntityHandle handle : founders) {
        auto instance = EntityRegistry::Instance().getInstance(handle);
        if (!instance) {
            continue;
        }
        auto view = makeCombatant(handle, *instance, m_resolver.getUnarmedProfile());
        if (!view) {
            continue;
        }
        rolls.emplace_back(m_resolver.rollInitiative(*view, dice()), handle);
    }
    std::stable_sort(rolls.begin(), rolls.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second < b.second;
    });

    for (const auto& [roll, handle] : rolls) {
        session->initiativeOrder.push_back(handle);
        CombatParticipant& participant = addParticipant(*session, handle, false, false);
        participant.initiative = roll;
        if (closeIn) {
            EntityRegistry::Instance().setRangeBand(handle, RangeBand::Engaged);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        m_sessions[session->roomId] = session;
    }

    COMBAT_INFO("Combat starts in " + session->roomId + " with " +
                std::to_string(session->initiativeOrder.size()) + " combatants");
    return session;
}

CombatParticipant& CombatController::addParticipant(CombatSession& session, EntityHandle handle,
                                                    bool lateJoiner, bool distant)
{
    auto it = session.participants.find(handle);
    if (it != session.participants.end()) {
        return it->second;
    }

    CombatParticipant participant;
    participant.handle = handle;
    participant.side = sideOf(handle);
    participant.lateJoiner = lateJoiner;

    if (lateJoiner) {
        // Appended behind the current round's queue, never into initiative
        session.lateJoiners.push_back(handle);
        if (distant) {
            EntityRegistry::Instance().setRangeBand(handle, RangeBand::Far);
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_indexMutex);
        m_index[handle] = IndexEntry{session.roomId, CombatState::Observing};
    }
    return session.participants.emplace(handle, std::move(participant)).first->second;
}

void CombatController::setState(CombatSession& session, CombatParticipant& participant,
                                CombatState state, const std::string& reason)
{
    if (participant.state == state) {
        return;
    }

    CombatState previous = participant.state;
    participant.state = state;
    {
        std::unique_lock<std::shared_mutex> lock(m_indexMutex);
        m_index[participant.handle] = IndexEntry{session.roomId, state};
    }

    std::string name = nameOf(participant.handle);
    if (state == CombatState::Observing || state == CombatState::Disengaging) {
        session.notable.push_back(name + " is " + combatStateToString(state) +
                                  (reason.empty() ? "" : " (" + reason + ")"));
    }
    dispatch(std::make_shared<CombatStateEvent>(participant.handle, name, previous, state, reason),
             session.roomId);
}

void CombatController::endSession(RoomLock& room, CombatSession& session,
                                  const std::string& reason)
{
    for (auto& [handle, participant] : session.participants) {
        m_ticker.cancel(handle);
        EntityRegistry::Instance().setEngagedTarget(handle, INVALID_ENTITY_HANDLE);
        setState(session, participant, CombatState::Observing, reason);
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_indexMutex);
        for (const auto& [handle, participant] : session.participants) {
            auto it = m_index.find(handle);
            if (it != m_index.end() && it->second.roomId == session.roomId) {
                m_index.erase(it);
            }
        }
    }

    COMBAT_INFO("Combat ends in " + room.roomId() + " after " +
                std::to_string(session.round) + " round(s): " + reason);

    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    m_sessions.erase(room.roomId());
}

bool CombatController::hostilesRemain(const CombatSession& session) const
{
    bool players = false;
    bool world = false;
    for (const auto& [handle, participant] : session.participants) {
        if (participant.state == CombatState::Observing) {
            continue;
        }
        if (participant.side == CombatSide::Players) {
            players = true;
        } else {
            world = true;
        }
    }
    return players && world;
}

std::vector<EntityHandle> CombatController::roundQueue(const CombatSession& session) const
{
    std::vector<EntityHandle> queue;
    queue.reserve(session.initiativeOrder.size() + session.lateJoiners.size());
    for (EntityHandle handle : session.initiativeOrder) {
        if (session.participants.count(handle)) {
            queue.push_back(handle);
        }
    }
    for (EntityHandle handle : session.lateJoiners) {
        if (session.participants.count(handle) &&
            std::find(queue.begin(), queue.end(), handle) == queue.end()) {
            queue.push_back(handle);
        }
    }
    return queue;
}

// ============================================================================
// TARGETING
// ============================================================================

bool CombatController::inReach(EntityHandle actor, EntityHandle target) const
{
    auto instance = EntityRegistry::Instance().getInstance(actor);
    if (!instance) {
        return false;
    }
    auto view = makeCombatant(actor, *instance, m_resolver.getUnarmedProfile());
    if (!view) {
        return false;
    }
    const RangeBand distance = std::max(bandOf(actor), bandOf(target));
    return distance <= view->getAttackProfile().reach;
}

double CombatController::intervalFor(EntityHandle handle) const
{
    auto instance = EntityRegistry::Instance().getInstance(handle);
    if (!instance) {
        return m_resolver.attackInterval(1.0f);
    }
    auto view = makeCombatant(handle, *instance, m_resolver.getUnarmedProfile());
    return m_resolver.attackInterval(view ? view->getAttackProfile().speed : 1.0f);
}

ActionResult CombatController::validateTarget(const std::string& roomId, EntityHandle actor,
                                              EntityHandle target, bool checkReach)
{
    auto& registry = EntityRegistry::Instance();

    if (!target.isValid()) {
        return ActionResult::failure(ActionStatus::InvalidTarget, "You have no target.");
    }
    if (target == actor) {
        return ActionResult::failure(ActionStatus::InvalidTarget, "You cannot attack yourself.");
    }
    if (!target.isCombatant()) {
        return ActionResult::failure(ActionStatus::InvalidTarget, "You cannot fight that.");
    }

    auto instance = registry.getInstance(target);
    auto position = registry.getPosition(target);
    if (!instance || !position) {
        size_t purged = registry.purgeStaleTargets(roomId);
        if (purged > 0) {
            COMBAT_WARN("Purged " + std::to_string(purged) + " stale target reference(s) in " +
                        roomId);
        }
        return ActionResult::failure(ActionStatus::InvalidTarget, "Your target is gone.");
    }
    if (position->roomId != roomId) {
        return ActionResult::failure(ActionStatus::InvalidTarget, instance->name + " is not here.");
    }
    const CombatStats* stats = instance->combat();
    if (!stats || stats->hpCurrent <= 0) {
        return ActionResult::failure(ActionStatus::InvalidTarget,
                                     instance->name + " is already down.");
    }
    if (sideOf(actor) == sideOf(target)) {
        return ActionResult::failure(ActionStatus::InvalidTarget,
                                     instance->name + " is on your side.");
    }
    if (checkReach && !inReach(actor, target)) {
        return ActionResult::failure(ActionStatus::InvalidTarget,
                                     instance->name + " is out of reach.");
    }
    return ActionResult::success();
}

EntityHandle CombatController::findNewTarget(const CombatSession& session,
                                             const CombatParticipant& participant) const
{
    auto usable = [&](EntityHandle candidate) {
        auto it = session.participants.find(candidate);
        if (it == session.participants.end() || it->second.side == participant.side ||
            it->second.state == CombatState::Observing ||
            it->second.state == CombatState::Disengaging) {
            return false;
        }
        auto instance = EntityRegistry::Instance().getInstance(candidate);
        auto position = EntityRegistry::Instance().getPosition(candidate);
        return instance && position && position->roomId == session.roomId &&
               instance->combat() && instance->combat()->hpCurrent > 0;
    };

    const auto queue = roundQueue(session);
    // Whoever is fighting us first, then anyone on the other side
    for (EntityHandle candidate : queue) {
        if (usable(candidate) && session.participants.at(candidate).target == participant.handle) {
            return candidate;
        }
    }
    for (EntityHandle candidate : queue) {
        if (usable(candidate)) {
            return candidate;
        }
    }
    return INVALID_ENTITY_HANDLE;
}

void CombatController::refreshEngagement(CombatSession& session, CombatParticipant& participant,
                                         double now)
{
    if (participant.state == CombatState::Disengaging) {
        return;
    }

    if (participant.target.isValid() &&
        !validateTarget(session.roomId, participant.handle, participant.target, false).ok()) {
        participant.target = INVALID_ENTITY_HANDLE;
    }
    if (!participant.target.isValid()) {
        participant.target = findNewTarget(session, participant);
    }
    EntityRegistry::Instance().setEngagedTarget(participant.handle, participant.target);

    if (!participant.target.isValid()) {
        m_ticker.cancel(participant.handle);
        if (participant.state == CombatState::Supporting && hostilesRemain(session)) {
            return;
        }
        setState(session, participant, CombatState::Observing, "no foes in reach");
        return;
    }

    if (inReach(participant.handle, participant.target)) {
        m_ticker.start(participant.handle, participant.target, session.roomId,
                       intervalFor(participant.handle), now);
        setState(session, participant, CombatState::Engaged, {});
    } else {
        m_ticker.cancel(participant.handle);
        setState(session, participant, CombatState::Supporting, "out of reach");
    }
}

void CombatController::purgeTarget(CombatSession& session, EntityHandle gone, double now)
{
    for (EntityHandle handle : roundQueue(session)) {
        auto* participant = findParticipant(session, handle);
        if (participant && participant->target == gone) {
            participant->target = INVALID_ENTITY_HANDLE;
            refreshEngagement(session, *participant, now);
        }
        if (participant && participant->fleeFrom == gone) {
            participant->fleeFrom = INVALID_ENTITY_HANDLE;
        }
    }
}

// ============================================================================
// INTENTS
// ============================================================================

ActionResult CombatController::attack(RoomLock& room, EntityHandle attacker, EntityHandle target,
                                      double now)
{
    const std::string& roomId = room.roomId();
    const auto* roomDef = ContentRegistry::Instance().getRoom(roomId);
    if (roomDef && roomDef->safe) {
        return ActionResult::failure(ActionStatus::Rejected, "You cannot start a fight here.");
    }

    auto attackerInstance = EntityRegistry::Instance().getInstance(attacker);
    auto attackerPosition = EntityRegistry::Instance().getPosition(attacker);
    if (!attackerInstance || !attackerInstance->combat() || !attackerPosition ||
        attackerPosition->roomId != roomId || attackerInstance->combat()->hpCurrent <= 0) {
        return ActionResult::failure(ActionStatus::Rejected, "You are in no state to fight.");
    }

    ActionResult valid = validateTarget(roomId, attacker, target, false);
    if (!valid.ok()) {
        return valid;
    }

    SessionPtr session = findSession(roomId);
    if (session) {
        if (auto* existing = findParticipant(*session, attacker)) {
            if (existing->state == CombatState::Disengaging) {
                return ActionResult::failure(ActionStatus::Rejected,
                                             "You are trying to break away.");
            }
            if (existing->target == target && m_ticker.isTicking(attacker)) {
                return ActionResult::failure(ActionStatus::AlreadyAttacking,
                                             "You are already attacking " + nameOf(target) + ".");
            }
        }
    }

    // Encounter groups fight together
    std::vector<EntityHandle> group;
    auto targetInstance = EntityRegistry::Instance().getInstance(target);
    if (targetInstance && targetInstance->encounterId != 0) {
        for (EntityHandle other : EntityRegistry::Instance().getEntitiesInRoom(roomId, EntityKind::Creature)) {
            if (other == target) {
                continue;
            }
            auto otherInstance = EntityRegistry::Instance().getInstance(other);
            if (otherInstance && otherInstance->encounterId == targetInstance->encounterId &&
                otherInstance->combat() && otherInstance->combat()->hpCurrent > 0) {
                group.push_back(other);
            }
        }
    }

    if (!session) {
        std::vector<EntityHandle> founders{attacker, target};
        founders.insert(founders.end(), group.begin(), group.end());
        session = createSession(room, founders, now, true);
    } else {
        addParticipant(*session, attacker, true, !session->participants.count(attacker));
        addParticipant(*session, target, true, false);
        for (EntityHandle member : group) {
            addParticipant(*session, member, true, false);
        }
    }

    const auto before = m_ticker.get(attacker);
    CombatParticipant& self = session->participants.at(attacker);
    self.target = target;
    refreshEngagement(*session, self, now);

    // Being attacked engages the defender and its group
    std::vector<EntityHandle> defenders{target};
    defenders.insert(defenders.end(), group.begin(), group.end());
    for (EntityHandle defender : defenders) {
        auto* participant = findParticipant(*session, defender);
        if (participant && !participant->target.isValid()) {
            participant->target = attacker;
            refreshEngagement(*session, *participant, now);
        } else if (participant && participant->state == CombatState::Observing) {
            refreshEngagement(*session, *participant, now);
        }
    }

    const std::string targetName = nameOf(target);
    if (self.state == CombatState::Supporting) {
        return ActionResult::success("You move against " + targetName +
                                     ", but they are out of reach. Advance to close in.");
    }
    if (before && before->target != target) {
        return ActionResult::success("You turn your attacks on " + targetName + ".");
    }
    return ActionResult::success("You attack " + targetName + "!");
}

ActionResult CombatController::useManeuver(RoomLock& room, EntityHandle actor,
                                           const std::string& maneuverId, EntityHandle target,
                                           double now)
{
    const std::string& roomId = room.roomId();
    const auto* roomDef = ContentRegistry::Instance().getRoom(roomId);
    if (roomDef && roomDef->safe) {
        return ActionResult::failure(ActionStatus::Rejected, "You cannot start a fight here.");
    }

    const auto* maneuver = ContentRegistry::Instance().getManeuver(maneuverId);
    auto instance = EntityRegistry::Instance().getInstance(actor);
    if (!instance || !instance->combat()) {
        return ActionResult::failure(ActionStatus::Rejected, "You are in no state to fight.");
    }
    auto view = makeCombatant(actor, *instance, m_resolver.getUnarmedProfile());
    if (!maneuver || !view->knowsManeuver(maneuverId)) {
        return ActionResult::failure(ActionStatus::UnknownManeuver,
                                     "You don't know a maneuver called '" + maneuverId + "'.");
    }
    if (view->getStamina() < maneuver->staminaCost) {
        return ActionResult::failure(ActionStatus::InsufficientResource,
                                     "You are too winded for " + maneuver->name + " (needs " +
                                         std::to_string(maneuver->staminaCost) + " stamina).");
    }

    SessionPtr session = findSession(roomId);
    CombatParticipant* self = session ? findParticipant(*session, actor) : nullptr;
    if (self && self->state == CombatState::Disengaging) {
        return ActionResult::failure(ActionStatus::Rejected, "You are trying to break away.");
    }
    if (!target.isValid() && self) {
        target = self->target;
    }

    ActionResult valid = validateTarget(roomId, actor, target, true);
    if (!valid.ok()) {
        return valid;
    }
    if (self && self->primaryUsed) {
        return ActionResult::failure(ActionStatus::Rejected, "You have already acted this round.");
    }

    if (!self || self->state == CombatState::Observing) {
        ActionResult engaged = attack(room, actor, target, now);
        if (!engaged.ok() && engaged.status != ActionStatus::AlreadyAttacking) {
            return engaged;
        }
        session = findSession(roomId);
        self = session ? findParticipant(*session, actor) : nullptr;
        if (!self) {
            return ActionResult::failure(ActionStatus::Rejected, "You cannot act right now.");
        }
        if (!inReach(actor, target)) {
            return ActionResult::failure(ActionStatus::InvalidTarget,
                                         "You join the fight, but " + nameOf(target) +
                                             " is out of reach.");
        }
    }

    self->primaryUsed = true;
    session->actions.push_back(PendingAction{actor, maneuverId, target});
    return ActionResult::success("You prepare " + maneuver->name + " against " + nameOf(target) + ".");
}

ActionResult CombatController::joinCombat(RoomLock& room, EntityHandle actor, double now)
{
    SessionPtr session = findSession(room.roomId());
    if (!session) {
        return ActionResult::failure(ActionStatus::NotInCombat, "There is no fight here to join.");
    }
    auto position = EntityRegistry::Instance().getPosition(actor);
    if (!actor.isCombatant() || !position || position->roomId != room.roomId()) {
        return ActionResult::failure(ActionStatus::Rejected, "You cannot join from here.");
    }

    auto* existing = findParticipant(*session, actor);
    if (existing && existing->state != CombatState::Observing) {
        return ActionResult::failure(ActionStatus::AlreadyInCombat, "You are already fighting.");
    }

    CombatParticipant& self = existing ? *existing : addParticipant(*session, actor, true, true);
    setState(*session, self, CombatState::Supporting, "joined the fight");
    self.target = findNewTarget(*session, self);
    refreshEngagement(*session, self, now);

    if (self.state == CombatState::Observing) {
        return ActionResult::failure(ActionStatus::NotInCombat, "There is nobody left to fight.");
    }
    return ActionResult::success("You join the fight.");
}

ActionResult CombatController::advance(RoomLock& room, EntityHandle actor, double now)
{
    SessionPtr session = findSession(room.roomId());
    auto* self = session ? findParticipant(*session, actor) : nullptr;
    if (!self || self->state == CombatState::Observing) {
        return ActionResult::failure(ActionStatus::NotInCombat, "You are not fighting.");
    }
    if (self->minorUsed) {
        return ActionResult::failure(ActionStatus::Rejected, "You have already moved this round.");
    }

    RangeBand band = bandOf(actor);
    if (band == RangeBand::Engaged) {
        return ActionResult::failure(ActionStatus::Rejected, "You are already in the thick of it.");
    }

    RangeBand closer = static_cast<RangeBand>(static_cast<uint8_t>(band) - 1);
    EntityRegistry::Instance().setRangeBand(actor, closer);
    self->minorUsed = true;
    refreshEngagement(*session, *self, now);
    return ActionResult::success(std::string("You press closer (") +
                                 AnchorMud::rangeBandToString(closer) + ").");
}

ActionResult CombatController::ready(RoomLock& room, EntityHandle actor,
                                     const std::string& maneuverId)
{
    SessionPtr session = findSession(room.roomId());
    auto* self = session ? findParticipant(*session, actor) : nullptr;
    if (!self || self->state == CombatState::Observing) {
        return ActionResult::failure(ActionStatus::NotInCombat, "You are not fighting.");
    }

    const auto* maneuver = ContentRegistry::Instance().getManeuver(maneuverId);
    auto instance = EntityRegistry::Instance().getInstance(actor);
    auto view = instance ? makeCombatant(actor, *instance, m_resolver.getUnarmedProfile())
                         : nullptr;
    if (!maneuver || !view || !view->knowsManeuver(maneuverId) ||
        maneuver->trigger == AnchorMud::ReactionTrigger::None) {
        return ActionResult::failure(ActionStatus::UnknownManeuver,
                                     "You have no reaction called '" + maneuverId + "'.");
    }
    if (self->minorUsed) {
        return ActionResult::failure(ActionStatus::Rejected, "You have already moved this round.");
    }

    self->readiedManeuver = maneuverId;
    self->minorUsed = true;
    return ActionResult::success("You ready " + maneuver->name + ".");
}

size_t CombatController::engageAggressors(RoomLock& room, double now)
{
    const std::string& roomId = room.roomId();
    const auto* roomDef = ContentRegistry::Instance().getRoom(roomId);
    if (roomDef && roomDef->safe) {
        return 0;
    }

    auto& registry = EntityRegistry::Instance();
    std::vector<EntityHandle> players;
    for (EntityHandle handle : registry.getEntitiesInRoom(roomId, EntityKind::Player)) {
        auto instance = registry.getInstance(handle);
        if (instance && instance->player() && instance->player()->connected &&
            instance->combat()->hpCurrent > 0) {
            players.push_back(handle);
        }
    }
    if (players.empty()) {
        return 0;
    }

    size_t engaged = 0;
    for (EntityHandle handle : registry.getEntitiesInRoom(roomId)) {
        if (!handle.isCreature() && !handle.isNPC()) {
            continue;
        }
        auto instance = registry.getInstance(handle);
        if (!instance || !instance->combat() || !instance->combat()->behavior.aggressive) {
            continue;
        }
        if (const auto* npc = std::get_if<NpcData>(&instance->payload); npc && !npc->hostile) {
            continue;
        }
        if (isInCombat(handle)) {
            continue;
        }
        if (attack(room, handle, players.front(), now).ok()) {
            COMBAT_DEBUG(instance->name + " attacks on sight in " + roomId);
            ++engaged;
        }
    }
    return engaged;
}

// ============================================================================
// RESOLUTION
// ============================================================================

void CombatController::performAttack(RoomLock& room, CombatSession& session,
                                     EntityHandle attacker, EntityHandle target,
                                     const AnchorMud::ManeuverDef* maneuver, double now,
                                     bool isReaction)
{
    auto& registry = EntityRegistry::Instance();
    auto attackerInstance = registry.getInstance(attacker);
    auto targetInstance = registry.getInstance(target);
    if (!attackerInstance || !targetInstance) {
        purgeTarget(session, attackerInstance ? target : attacker, now);
        return;
    }

    auto attackerView = makeCombatant(attacker, *attackerInstance, m_resolver.getUnarmedProfile());
    auto targetView = makeCombatant(target, *targetInstance, m_resolver.getUnarmedProfile());
    if (!attackerView || !targetView) {
        return;
    }

    AttackContext context;
    if (maneuver) {
        if (!attackerView->spendStamina(maneuver->staminaCost)) {
            notify(attacker, session.roomId,
                   ActionResult::failure(ActionStatus::InsufficientResource,
                                         "You are too winded for " + maneuver->name + "."));
            return;
        }
        context.accuracyBonus = maneuver->accuracyBonus;
        context.damageBonus = maneuver->damageBonus;
        context.damageMultiplier = maneuver->damageMultiplier;
    }
    if (auto* self = findParticipant(session, attacker)) {
        context.attackerModifiers = self->modifiers;
    }
    if (auto* other = findParticipant(session, target)) {
        context.defenderModifiers = other->modifiers;
    }
    if (mp_weather) {
        WeatherModifiers weather = mp_weather->getModifiers(session.roomId, now);
        const bool farShot = std::max(bandOf(attacker), bandOf(target)) == RangeBand::Far;
        if (farShot) {
            context.situationalAccuracy += weather.farRangedAccuracy;
        }
        context.extraWearChance = weather.extraWearChance;
    }

    AttackOutcome outcome = m_resolver.resolveAttack(*attackerView, *targetView, context, dice());

    registry.replaceInstance(attacker, *attackerInstance);
    if (!outcome.killed || !targetView->isRemovedOnDeath()) {
        registry.replaceInstance(target, *targetInstance);
    }

    const std::string attackerName = attackerInstance->name;
    const std::string targetName = targetInstance->name;

    if (maneuver) {
        auto used = std::make_shared<CombatEvent>(CombatEventType::ManeuverUsed, attacker, target);
        used->setNames(attackerName, targetName);
        used->setDetail(maneuver->name);
        dispatch(used, session.roomId);
    }

    CombatEventType type = CombatEventType::Miss;
    if (outcome.hit) {
        type = outcome.critical ? CombatEventType::CriticalHit
             : outcome.glancing ? CombatEventType::GlancingHit
                                : CombatEventType::Hit;
    }
    auto strike = std::make_shared<CombatEvent>(type, attacker, target, outcome.finalDamage);
    strike->setNames(attackerName, targetName);
    strike->setVerb(outcome.verb);
    strike->setRawDamage(outcome.rawDamage);
    strike->setRemainingHealth(outcome.remainingHitPoints);
    dispatch(strike, session.roomId);

    for (const auto& absorption : outcome.absorptions) {
        if (absorption.broke) {
            auto broken = std::make_shared<CombatEvent>(CombatEventType::ArmorBroken, attacker, target);
            broken->setNames(attackerName, targetName);
            broken->setDetail(absorption.pieceName);
            dispatch(broken, session.roomId);
        }
    }
    if (outcome.weaponBroke) {
        auto broken = std::make_shared<CombatEvent>(CombatEventType::WeaponBroken, attacker, target);
        broken->setNames(attackerName, targetName);
        broken->setDetail(outcome.weaponName);
        dispatch(broken, session.roomId);
        m_ticker.setInterval(attacker, intervalFor(attacker));
    }

    if (maneuver) {
        if (maneuver->tickerDelay > 0.0f) {
            m_ticker.addDelay(attacker, maneuver->tickerDelay);
        }
        if (outcome.hit && maneuver->appliesModifier != AnchorMud::CombatModifier::NONE) {
            if (auto* other = findParticipant(session, target)) {
                other->modifiers |= maneuver->appliesModifier;
                other->modifierRounds[maneuver->appliesModifier] = std::max(1, maneuver->modifierRounds);
                session.notable.push_back(targetName + " is " +
                                          modifierName(maneuver->appliesModifier));
            }
        }
    }

    if (outcome.killed) {
        handleDeath(room, session, target, *targetInstance, attacker, now);
        return;
    }

    // Being attacked pulls the defender in
    if (auto* defender = findParticipant(session, target)) {
        if (defender->state == CombatState::Observing || !defender->target.isValid()) {
            if (defender->state != CombatState::Disengaging) {
                defender->target = attacker;
                refreshEngagement(session, *defender, now);
            }
        }
        if (!isReaction && !defender->readiedManeuver.empty()) {
            const auto* readied = ContentRegistry::Instance().getManeuver(defender->readiedManeuver);
            if (readied && readied->trigger == AnchorMud::ReactionTrigger::OnAttacked) {
                session.reactions.push_back(PendingReaction{target, attacker, defender->readiedManeuver});
            }
        }
    }
}

void CombatController::handleDeath(RoomLock& room, CombatSession& session, EntityHandle victim,
                                   const EntityInstance& dead, EntityHandle killer, double now)
{
    auto killed = std::make_shared<CombatEvent>(CombatEventType::Killed, killer, victim);
    killed->setNames(nameOf(killer), dead.name);
    dispatch(killed, session.roomId);

    m_ticker.cancel(victim);
    if (auto* participant = findParticipant(session, victim)) {
        setState(session, *participant, CombatState::Observing, "defeated");
    }
    session.participants.erase(victim);
    {
        std::unique_lock<std::shared_mutex> lock(m_indexMutex);
        m_index.erase(victim);
    }

    if (victim.isPlayer()) {
        // Players are never destroyed; they wake up at the respawn room
        auto& registry = EntityRegistry::Instance();
        registry.modifyInstance(victim, [](EntityInstance& instance) {
            if (auto* stats = instance.combat()) {
                stats->hpCurrent = std::max(1, stats->hpMax / 2);
            }
        });
        registry.setEngagedTarget(victim, INVALID_ENTITY_HANDLE);
        {
            std::lock_guard<std::mutex> lock(m_respawnMutex);
            m_pendingRespawns.push_back(PendingRespawn{victim, room.roomId()});
        }
        notify(victim, m_settings.respawnRoom,
               ActionResult::success("You have been defeated. You come to, bruised, somewhere safe."));
        COMBAT_INFO(dead.name + " was defeated in " + room.roomId());
    } else {
        SpawnLootEngine::Instance().handleDeath(room, victim, dead, killer, now, &dice());
    }

    session.notable.push_back(dead.name + " falls");
    purgeTarget(session, victim, now);
}

void CombatController::executeTickerFire(RoomLock& room, const TickerFire& fire, double now)
{
    auto target = m_ticker.confirm(fire);
    if (!target) {
        return;  // Cancelled or restarted after collection
    }

    SessionPtr session = findSession(room.roomId());
    auto* self = session ? findParticipant(*session, fire.combatant) : nullptr;
    if (!self || self->state != CombatState::Engaged) {
        m_ticker.cancel(fire.combatant);
        return;
    }

    auto position = EntityRegistry::Instance().getPosition(fire.combatant);
    if (!position || position->roomId != room.roomId()) {
        removeFromCombat(room, fire.combatant, "left", now);
        return;
    }

    if (!validateTarget(room.roomId(), fire.combatant, *target, false).ok()) {
        self->target = INVALID_ENTITY_HANDLE;
        refreshEngagement(*session, *self, now);
        return;
    }
    if (!inReach(fire.combatant, *target)) {
        refreshEngagement(*session, *self, now);
        return;
    }

    performAttack(room, *session, fire.combatant, *target, nullptr, now, false);

    if (!hostilesRemain(*session)) {
        endSession(room, *session, "no hostiles remain");
    }
}

void CombatController::runRoomBatch(const std::string& roomId,
                                    const std::vector<TickerFire>& fires, double now)
{
    try {
        auto room = RoomStateManager::Instance().lockRoom(roomId);
        for (const auto& fire : fires) {
            executeTickerFire(room, fire, now);
        }
    } catch (const std::exception& e) {
        COMBAT_ERROR("Ticker batch for " + roomId + " failed: " + std::string(e.what()));
    }
}

void CombatController::runRound(RoomLock& room, CombatSession& session, double now)
{
    auto& content = ContentRegistry::Instance();

    // Action phase: initiative order, then late joiners
    for (EntityHandle actor : roundQueue(session)) {
        auto* self = findParticipant(session, actor);
        if (!self || self->state == CombatState::Observing ||
            self->state == CombatState::Disengaging) {
            continue;
        }

        auto action = std::find_if(session.actions.begin(), session.actions.end(),
                                   [&](const PendingAction& a) { return a.actor == actor; });
        if (action != session.actions.end()) {
            const auto* maneuver = content.getManeuver(action->maneuverId);
            ActionResult valid = validateTarget(session.roomId, actor, action->target, true);
            if (!maneuver || !valid.ok()) {
                notify(actor, session.roomId, valid.ok() ? ActionResult::failure(
                                                   ActionStatus::UnknownManeuver, "Your maneuver fizzles.")
                                                         : valid);
                continue;
            }
            performAttack(room, session, actor, action->target, maneuver, now, false);
            continue;
        }

        // Creatures close the distance on their own
        if (!actor.isPlayer() && self->state == CombatState::Supporting &&
            self->target.isValid() && !self->minorUsed && bandOf(actor) != RangeBand::Engaged) {
            RangeBand band = bandOf(actor);
            EntityRegistry::Instance().setRangeBand(
                actor, static_cast<RangeBand>(static_cast<uint8_t>(band) - 1));
            self->minorUsed = true;
            refreshEngagement(session, *self, now);
        }
    }
    session.actions.clear();

    // Reaction phase, bounded per round
    for (const auto& reaction : session.reactions) {
        if (session.reactionsUsed >= m_settings.maxReactionsPerRound) {
            COMBAT_DEBUG("Reaction budget spent in " + session.roomId);
            break;
        }
        auto* self = findParticipant(session, reaction.actor);
        if (!self || self->readiedManeuver != reaction.maneuverId) {
            continue;
        }
        const auto* maneuver = content.getManeuver(reaction.maneuverId);
        if (!maneuver || !validateTarget(session.roomId, reaction.actor, reaction.target, true).ok()) {
            continue;
        }
        self->readiedManeuver.clear();
        ++session.reactionsUsed;
        performAttack(room, session, reaction.actor, reaction.target, maneuver, now, true);
    }
    session.reactions.clear();

    // Resolution phase
    int drain = 0;
    if (mp_weather) {
        drain = mp_weather->getModifiers(session.roomId, now).staminaDrain;
    }
    for (EntityHandle handle : roundQueue(session)) {
        auto* self = findParticipant(session, handle);
        if (!self) {
            continue;
        }
        for (auto it = self->modifierRounds.begin(); it != self->modifierRounds.end();) {
            if (--it->second <= 0) {
                self->modifiers &= static_cast<uint8_t>(~it->first);
                it = self->modifierRounds.erase(it);
            } else {
                ++it;
            }
        }
        self->primaryUsed = false;
        self->minorUsed = false;
        self->readiedManeuver.clear();

        if (self->state != CombatState::Observing) {
            const int regen = m_settings.staminaRegenPerRound - drain;
            EntityRegistry::Instance().modifyInstance(handle, [regen](EntityInstance& instance) {
                if (auto* stats = instance.combat()) {
                    stats->staminaCurrent =
                        std::clamp(stats->staminaCurrent + regen, 0, stats->staminaMax);
                }
            });
        }
        refreshEngagement(session, *self, now);
    }
    session.reactionsUsed = 0;

    // Summary phase
    emitSummary(session);
    session.notable.clear();
    ++session.round;
    session.nextRoundAt += m_settings.roundSeconds;
}

void CombatController::emitSummary(const CombatSession& session)
{
    int hostiles = 0;
    std::vector<std::string> lines;
    for (EntityHandle handle : roundQueue(session)) {
        const auto& participant = session.participants.at(handle);
        auto instance = EntityRegistry::Instance().getInstance(handle);
        if (!instance || !instance->combat()) {
            continue;
        }
        if (participant.side == CombatSide::World &&
            participant.state != CombatState::Observing) {
            ++hostiles;
        }
        const CombatStats* stats = instance->combat();
        lines.push_back(instance->name + ": " + healthBand(stats->hpCurrent, stats->hpMax) +
                        " [" + combatStateToString(participant.state) + "]");
    }
    lines.insert(lines.end(), session.notable.begin(), session.notable.end());

    auto summary = std::make_shared<RoundSummaryEvent>(session.round, hostiles, std::move(lines));
    dispatch(summary, session.roomId);
}

const char* CombatController::healthBand(int current, int max)
{
    if (max <= 0) {
        return "critical";
    }
    const int percent = current * 100 / max;
    if (percent >= 75) return "healthy";
    if (percent >= 50) return "injured";
    if (percent >= 25) return "wounded";
    return "critical";
}

void CombatController::lapseFleeWindows(RoomLock& room, CombatSession& session, double now)
{
    (void)room;
    for (EntityHandle handle : roundQueue(session)) {
        auto* self = findParticipant(session, handle);
        if (!self || self->state != CombatState::Disengaging || self->fleeUntil > now) {
            continue;
        }
        self->target = self->fleeFrom;
        self->fleeFrom = INVALID_ENTITY_HANDLE;
        setState(session, *self, CombatState::Engaged, "hesitated too long");
        refreshEngagement(session, *self, now);
        notify(handle, session.roomId,
               ActionResult::failure(ActionStatus::MustDisengage,
                                     "Your chance to slip away has passed."));
    }
}

void CombatController::tick(double now)
{
    auto due = m_ticker.collectDue(now);
    if (!due.empty()) {
        if (AnchorMud::ThreadSystem::Exists() && due.size() > 1) {
            // One task per room; rooms run in parallel, each under its own lock
            std::vector<std::future<void>> batches;
            batches.reserve(due.size());
            for (const auto& [roomId, fires] : due) {
                try {
                    batches.push_back(AnchorMud::ThreadSystem::Instance().enqueueTaskWithResult(
                        [this, roomId = roomId, fires = fires, now]() {
                            runRoomBatch(roomId, fires, now);
                        },
                        AnchorMud::TaskPriority::Critical, "combat room batch"));
                } catch (const std::runtime_error& e) {
                    COMBAT_WARN("Running " + roomId + " inline: " + std::string(e.what()));
                    runRoomBatch(roomId, fires, now);
                }
            }
            for (auto& batch : batches) {
                batch.get();
            }
        } else {
            for (const auto& [roomId, fires] : due) {
                runRoomBatch(roomId, fires, now);
            }
        }
    }

    for (const std::string& roomId : getActiveRooms()) {
        auto room = RoomStateManager::Instance().lockRoom(roomId);
        SessionPtr session = findSession(roomId);
        if (!session) {
            continue;
        }

        lapseFleeWindows(room, *session, now);
        int rounds = 0;
        while (session->nextRoundAt <= now && rounds < MAX_ROUND_CATCH_UP && hostilesRemain(*session)) {
            runRound(room, *session, now);
            ++rounds;
        }
        if (session->nextRoundAt <= now) {
            session->nextRoundAt = now + m_settings.roundSeconds;
        }
        if (!hostilesRemain(*session)) {
            endSession(room, *session, "no hostiles remain");
        }
    }

    processRespawns(now);
}

size_t CombatController::processRespawns(double now)
{
    std::vector<PendingRespawn> pending;
    {
        std::lock_guard<std::mutex> lock(m_respawnMutex);
        pending.swap(m_pendingRespawns);
    }

    auto& registry = EntityRegistry::Instance();
    const std::string& respawnRoom = m_settings.respawnRoom;
    size_t moved = 0;

    for (const auto& respawn : pending) {
        for (int attempt = 0; attempt < MAX_RESPAWN_ATTEMPTS; ++attempt) {
            auto position = registry.getPosition(respawn.player);
            if (!position || position->roomId == respawnRoom) {
                break;  // Logged out, or already there
            }
            const std::string fromId = position->roomId;

            auto [first, second] = RoomStateManager::Instance().lockRooms(fromId, respawnRoom);
            RoomLock& from = first.roomId() == fromId ? first : second;
            RoomLock& to = first.roomId() == respawnRoom ? first : second;

            auto confirmed = registry.getPosition(respawn.player);
            if (!confirmed) {
                break;
            }
            if (confirmed->roomId != fromId) {
                continue;  // Walked off between the read and the lock
            }

            // Aggro in the death room may have pulled the body back in
            removeFromCombat(from, respawn.player, "defeated", now);
            const std::string name = nameOf(respawn.player);
            if (!registry.moveTo(respawn.player, respawnRoom, std::nullopt)) {
                COMBAT_WARN("Could not move " + name + " to " + respawnRoom);
                break;
            }
            dispatch(std::make_shared<PresenceEvent>(PresenceChange::Left, respawn.player, name),
                     fromId);
            dispatch(std::make_shared<PresenceEvent>(PresenceChange::Entered, respawn.player, name),
                     respawnRoom);
            if (m_onArrival) {
                m_onArrival(to, respawn.player, now);
            }
            ++moved;
            COMBAT_INFO(name + " fell in " + respawn.deathRoom + " and respawns in " + respawnRoom);
            break;
        }
    }
    return moved;
}

size_t CombatController::getPendingRespawnCount() const
{
    std::lock_guard<std::mutex> lock(m_respawnMutex);
    return m_pendingRespawns.size();
}

// ============================================================================
// PURSUIT / RUNTIME HOOKS
// ============================================================================

std::optional<CombatParticipant> CombatController::getParticipant(RoomLock& room,
                                                                  EntityHandle handle) const
{
    SessionPtr session = findSession(room.roomId());
    if (!session) {
        return std::nullopt;
    }
    auto* participant = findParticipant(*session, handle);
    if (!participant) {
        return std::nullopt;
    }
    return *participant;
}

std::vector<EntityHandle> CombatController::getHostilesTargeting(RoomLock& room,
                                                                 EntityHandle handle) const
{
    std::vector<EntityHandle> hostiles;
    SessionPtr session = findSession(room.roomId());
    if (!session) {
        return hostiles;
    }
    for (EntityHandle other : roundQueue(*session)) {
        const auto& participant = session->participants.at(other);
        if (participant.target == handle && participant.side != sideOf(handle) &&
            participant.state != CombatState::Observing) {
            hostiles.push_back(other);
        }
    }
    return hostiles;
}

void CombatController::beginFleeWindow(RoomLock& room, EntityHandle handle, double fleeUntil)
{
    SessionPtr session = findSession(room.roomId());
    auto* self = session ? findParticipant(*session, handle) : nullptr;
    if (!self) {
        return;
    }
    m_ticker.cancel(handle);
    self->fleeFrom = self->target;
    self->fleeUntil = fleeUntil;
    self->target = INVALID_ENTITY_HANDLE;
    EntityRegistry::Instance().setEngagedTarget(handle, INVALID_ENTITY_HANDLE);
    setState(*session, *self, CombatState::Disengaging, "breaking away");
}

void CombatController::failDisengage(RoomLock& room, EntityHandle handle, double now)
{
    SessionPtr session = findSession(room.roomId());
    auto* self = session ? findParticipant(*session, handle) : nullptr;
    if (!self) {
        return;
    }
    self->primaryUsed = true;
    setState(*session, *self, CombatState::Engaged, "failed to break away");
    refreshEngagement(*session, *self, now);
}

int CombatController::resolveDisengageReactions(RoomLock& room, EntityHandle handle, double now)
{
    SessionPtr session = findSession(room.roomId());
    if (!session) {
        return 0;
    }

    int resolved = 0;
    for (EntityHandle hostile : getHostilesTargeting(room, handle)) {
        if (session->reactionsUsed >= m_settings.maxReactionsPerRound) {
            break;
        }
        auto* participant = findParticipant(*session, hostile);
        if (!participant || participant->readiedManeuver.empty()) {
            continue;
        }
        const auto* maneuver = ContentRegistry::Instance().getManeuver(participant->readiedManeuver);
        if (!maneuver || maneuver->trigger != AnchorMud::ReactionTrigger::OnDisengage ||
            !validateTarget(session->roomId, hostile, handle, true).ok()) {
            continue;
        }
        participant->readiedManeuver.clear();
        ++session->reactionsUsed;
        ++resolved;
        performAttack(room, *session, hostile, handle, maneuver, now, true);
        if (!EntityRegistry::Instance().isValidHandle(handle) || !findParticipant(*session, handle)) {
            break;
        }
    }
    return resolved;
}

void CombatController::removeFromCombat(RoomLock& room, EntityHandle handle,
                                        const std::string& reason, double now)
{
    m_ticker.cancel(handle);
    SessionPtr session = findSession(room.roomId());
    auto* self = session ? findParticipant(*session, handle) : nullptr;
    if (!self) {
        return;
    }

    EntityRegistry::Instance().setEngagedTarget(handle, INVALID_ENTITY_HANDLE);
    setState(*session, *self, CombatState::Observing, reason);
    session->participants.erase(handle);
    {
        std::unique_lock<std::shared_mutex> lock(m_indexMutex);
        auto it = m_index.find(handle);
        if (it != m_index.end() && it->second.roomId == room.roomId()) {
            m_index.erase(it);
        }
    }

    purgeTarget(*session, handle, now);
    if (!hostilesRemain(*session)) {
        endSession(room, *session, "no hostiles remain");
    }
}

void CombatController::engageOnArrival(RoomLock& room, EntityHandle pursuer, EntityHandle target,
                                       double now)
{
    SessionPtr session = findSession(room.roomId());
    if (!session) {
        session = createSession(room, {target, pursuer}, now, false);
    } else {
        addParticipant(*session, target, true, false);
        addParticipant(*session, pursuer, true, true);
    }
    EntityRegistry::Instance().setRangeBand(pursuer, RangeBand::Far);

    CombatParticipant& chaser = session->participants.at(pursuer);
    chaser.target = target;
    refreshEngagement(*session, chaser, now);

    auto* quarry = findParticipant(*session, target);
    if (quarry && (quarry->state == CombatState::Observing || !quarry->target.isValid())) {
        quarry->target = pursuer;
        refreshEngagement(*session, *quarry, now);
    }
}

// ============================================================================
// QUERIES
// ============================================================================

CombatState CombatController::getCombatState(EntityHandle handle) const
{
    std::shared_lock<std::shared_mutex> lock(m_indexMutex);
    auto it = m_index.find(handle);
    return it == m_index.end() ? CombatState::Observing : it->second.state;
}

bool CombatController::isInCombat(EntityHandle handle) const
{
    return getCombatState(handle) != CombatState::Observing;
}

std::optional<std::string> CombatController::getCombatRoom(EntityHandle handle) const
{
    std::shared_lock<std::shared_mutex> lock(m_indexMutex);
    auto it = m_index.find(handle);
    if (it == m_index.end() || it->second.state == CombatState::Observing) {
        return std::nullopt;
    }
    return it->second.roomId;
}

bool CombatController::hasSession(const std::string& roomId) const
{
    return findSession(roomId) != nullptr;
}

std::optional<CombatSessionSnapshot> CombatController::getSessionSnapshot(RoomLock& room) const
{
    SessionPtr session = findSession(room.roomId());
    if (!session) {
        return std::nullopt;
    }

    CombatSessionSnapshot snapshot;
    snapshot.roomId = session->roomId;
    snapshot.sessionId = session->id;
    snapshot.round = session->round;
    snapshot.nextRoundAt = session->nextRoundAt;
    snapshot.initiativeOrder = session->initiativeOrder;
    snapshot.lateJoiners = session->lateJoiners;
    for (EntityHandle handle : roundQueue(*session)) {
        snapshot.participants.push_back(session->participants.at(handle));
    }
    return snapshot;
}

size_t CombatController::getSessionCount() const
{
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    return m_sessions.size();
}

std::vector<std::string> CombatController::getActiveRooms() const
{
    std::vector<std::string> rooms;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        rooms.reserve(m_sessions.size());
        for (const auto& [roomId, session] : m_sessions) {
            rooms.push_back(roomId);
        }
    }
    std::sort(rooms.begin(), rooms.end());
    return rooms;
}

void CombatController::dispatch(const std::shared_ptr<Event>& event, const std::string& roomId) const
{
    event->setRoomId(roomId);
    if (!EventManager::Instance().dispatchEvent(event, EventManager::DispatchMode::Deferred)) {
        COMBAT_DEBUG("Dropped " + event->getName() + " for " + roomId);
    }
}

void CombatController::notify(EntityHandle recipient, const std::string& roomId,
                              const ActionResult& result) const
{
    auto notice = std::make_shared<NoticeEvent>(recipient, result.message, result.status);
    dispatch(notice, roomId);
}
