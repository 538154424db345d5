/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/PursuitController.hpp"
#include "controllers/combat/CombatController.hpp"
#include "controllers/world/WeatherController.hpp"
#include "core/Logger.hpp"
#include "entities/Combatant.hpp"
#include "events/PresenceEvent.hpp"
#include "managers/ContentRegistry.hpp"
#include "managers/EntityRegistry.hpp"
#include "managers/RoomStateManager.hpp"
#include "utils/DiceRoller.hpp"
#include <algorithm>
#include <cmath>

namespace {

void announce(PresenceChange change, EntityHandle entity, const std::string& name,
              const std::string& roomId, const std::string& direction = {})
{
    auto event = std::make_shared<PresenceEvent>(change, entity, name, direction);
    event->setRoomId(roomId);
    if (!EventManager::Instance().dispatchEvent(event, EventManager::DispatchMode::Deferred)) {
        PURSUIT_DEBUG("Presence event dropped for " + roomId);
    }
}

} // namespace

PursuitController::PursuitController(CombatController& combat,
                                     const AnchorMud::RuntimeSettings& settings,
                                     WeatherController* weather)
    : m_combat(combat), m_settings(settings), mp_weather(weather)
{
}

void PursuitController::subscribe()
{
    if (checkAlreadySubscribed()) {
        return;
    }

    auto token = EventManager::Instance().registerHandlerWithToken(
        EventTypeId::Presence, [this](const EventData& data) {
            auto presence = std::dynamic_pointer_cast<PresenceEvent>(data.event);
            if (presence && presence->getChange() == PresenceChange::Despawned) {
                forget(presence->getEntity());
            }
        });
    addHandlerToken(token);
    setSubscribed(true);
}

void PursuitController::update(double worldSeconds)
{
    enforceLeashes(worldSeconds);
}

AnchorMud::DiceRoller& PursuitController::dice() const
{
    return m_roller ? *m_roller : AnchorMud::DiceRoller::threadLocal();
}

std::pair<int, double> PursuitController::leashFor(const AnchorMud::BehaviorProfile& behavior,
                                                   const AnchorMud::RuntimeSettings& settings)
{
    switch (behavior.pursuit) {
        case AnchorMud::PursuitMode::Short:
            return {behavior.leashRooms > 0 ? behavior.leashRooms : settings.shortLeashRooms,
                    behavior.leashSeconds > 0.0f ? behavior.leashSeconds
                                                 : settings.shortLeashSeconds};
        case AnchorMud::PursuitMode::Long:
            return {behavior.leashRooms > 0 ? behavior.leashRooms : settings.longLeashRooms,
                    behavior.leashSeconds > 0.0f ? behavior.leashSeconds
                                                 : settings.longLeashSeconds};
        case AnchorMud::PursuitMode::None:
        default:
            return {0, 0.0};
    }
}

// ============================================================================
// DISENGAGE
// ============================================================================

ActionResult PursuitController::disengage(RoomLock& room, EntityHandle actor, double now)
{
    auto participant = m_combat.getParticipant(room, actor);
    if (!participant || participant->state == CombatState::Observing) {
        return ActionResult::failure(ActionStatus::NotInCombat, "You are not fighting anyone.");
    }
    if (participant->state == CombatState::Disengaging) {
        return ActionResult::failure(ActionStatus::Rejected, "You are already breaking away.");
    }
    if (participant->primaryUsed) {
        return ActionResult::failure(ActionStatus::Rejected, "You have already acted this round.");
    }

    // Readied guards strike as the opening shows
    const int interrupts = m_combat.resolveDisengageReactions(room, actor, now);
    participant = m_combat.getParticipant(room, actor);
    if (!participant || participant->state == CombatState::Observing) {
        return ActionResult::failure(ActionStatus::Rejected,
                                     "You are cut down as you try to break away.");
    }

    auto& registry = EntityRegistry::Instance();
    auto instance = registry.getInstance(actor);
    if (!instance || !instance->combat()) {
        return ActionResult::failure(ActionStatus::Rejected, "You cannot move.");
    }

    int opposition = 0;
    for (EntityHandle hostile : m_combat.getHostilesTargeting(room, actor)) {
        auto other = registry.getInstance(hostile);
        if (!other) {
            continue;
        }
        auto view = makeCombatant(hostile, *other, m_combat.getResolver().getUnarmedProfile());
        if (view) {
            opposition = std::max(opposition, view->getAccuracy());
        }
    }

    int penalty = 0;
    if (mp_weather) {
        penalty = mp_weather->getModifiers(room.roomId(), now).disengagePenalty;
    }

    const int avoidance = CombatResolver::effectiveAvoidance(instance->combat()->avoidance,
                                                             participant->modifiers);
    const bool success = m_combat.getResolver().resolveDisengage(avoidance, opposition, penalty,
                                                                 dice());
    PURSUIT_DEBUG(instance->name + " disengage " + (success ? "succeeds" : "fails") +
                  " (opposition " + std::to_string(opposition) + ", penalty " +
                  std::to_string(penalty) + ", interrupts " + std::to_string(interrupts) + ")");

    if (!success) {
        m_combat.failDisengage(room, actor, now);
        return ActionResult::failure(ActionStatus::Rejected,
                                     "You try to break away but cannot find an opening.");
    }

    m_combat.beginFleeWindow(room, actor, now + m_settings.fleeWindowSeconds);
    return ActionResult::success("You break away! You have a moment to leave.");
}

ActionResult PursuitController::checkDeparture(RoomLock& room, EntityHandle actor,
                                               double now) const
{
    auto participant = m_combat.getParticipant(room, actor);
    if (!participant || participant->state == CombatState::Observing) {
        return ActionResult::success();
    }
    if (participant->state == CombatState::Disengaging) {
        if (participant->fleeUntil >= now) {
            return ActionResult::success();
        }
        return ActionResult::failure(ActionStatus::MustDisengage,
                                     "Your chance to slip away has passed.");
    }
    if (m_settings.leaveEndsCombat) {
        return ActionResult::success();
    }
    return ActionResult::failure(ActionStatus::MustDisengage,
                                 "You are fighting! Disengage first.");
}

// ============================================================================
// PURSUIT
// ============================================================================

bool PursuitController::canPursue(EntityHandle hostile, const std::string& fromRoom,
                                  const std::string& toRoom, double now) const
{
    if ((!hostile.isCreature() && !hostile.isNPC()) || fromRoom == toRoom) {
        return false;
    }

    const auto* destination = ContentRegistry::Instance().getRoom(toRoom);
    if (!destination || destination->noPursuit) {
        return false;
    }

    auto instance = EntityRegistry::Instance().getInstance(hostile);
    if (!instance || !instance->combat() || instance->combat()->hpCurrent <= 0) {
        return false;
    }

    if (leashFor(instance->combat()->behavior, m_settings).first <= 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pursuers.find(hostile);
    if (it == m_pursuers.end()) {
        return true;
    }
    const PursuitState& state = it->second;
    if (state.roomsAway + 1 > state.leashRooms) {
        return false;
    }
    return now - state.startedAt <= state.leashSeconds;
}

std::vector<EntityHandle> PursuitController::onCombatantLeft(RoomLock& from, RoomLock& to,
                                                             EntityHandle mover,
                                                             const std::string& direction,
                                                             double now)
{
    std::vector<EntityHandle> followers;
    const std::string fromRoom = from.roomId();
    const std::string toRoom = to.roomId();

    std::vector<EntityHandle> hostiles;
    if (!m_settings.leaveEndsCombat) {
        hostiles = m_combat.getHostilesTargeting(from, mover);
    }
    m_combat.removeFromCombat(from, mover, "left the room", now);

    auto& registry = EntityRegistry::Instance();
    for (EntityHandle hostile : hostiles) {
        if (!canPursue(hostile, fromRoom, toRoom, now)) {
            const auto* destination = ContentRegistry::Instance().getRoom(toRoom);
            if (destination && destination->noPursuit) {
                PURSUIT_DEBUG(hostile.toString() + " stops at the edge of " + toRoom);
            }
            continue;
        }

        auto instance = registry.getInstance(hostile);
        if (!instance) {
            continue;
        }

        m_combat.removeFromCombat(from, hostile, "gave chase", now);
        if (!registry.moveTo(hostile, toRoom, AnchorMud::RangeBand::Far)) {
            PURSUIT_WARN("Pursuer " + hostile.toString() + " could not follow into " + toRoom);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_pursuers.find(hostile);
            if (it == m_pursuers.end()) {
                const auto [leashRooms, leashSeconds] =
                    leashFor(instance->combat()->behavior, m_settings);
                PursuitState state;
                state.homeRoom = instance->homeRoom.empty() ? fromRoom : instance->homeRoom;
                state.startedAt = now;
                state.leashRooms = leashRooms;
                state.leashSeconds = leashSeconds;
                it = m_pursuers.emplace(hostile, std::move(state)).first;
            }
            it->second.quarry = mover;
            ++it->second.roomsAway;
        }

        announce(PresenceChange::Left, hostile, instance->name, fromRoom, direction);
        announce(PresenceChange::Pursued, hostile, instance->name, toRoom);
        m_combat.engageOnArrival(to, hostile, mover, now);
        followers.push_back(hostile);

        PURSUIT_INFO(instance->name + " pursues into " + toRoom);
    }
    return followers;
}

size_t PursuitController::enforceLeashes(double now)
{
    std::vector<std::pair<EntityHandle, PursuitState>> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [pursuer, state] : m_pursuers) {
            const bool leashExpired = now - state.startedAt > state.leashSeconds;
            if (leashExpired || !m_combat.isInCombat(pursuer)) {
                due.emplace_back(pursuer, state);
            }
        }
    }

    for (const auto& [pursuer, state] : due) {
        returnHome(pursuer, state, now);
    }
    return due.size();
}

void PursuitController::returnHome(EntityHandle pursuer, const PursuitState& state, double now)
{
    auto& registry = EntityRegistry::Instance();
    auto position = registry.getPosition(pursuer);
    if (!position) {
        forget(pursuer);
        return;
    }

    const std::string current = position->roomId;
    if (current == state.homeRoom) {
        forget(pursuer);
        return;
    }

    auto [currentLock, homeLock] = RoomStateManager::Instance().lockRooms(current, state.homeRoom);

    // Re-check under the locks; the pursuer may have died or moved
    position = registry.getPosition(pursuer);
    auto instance = registry.getInstance(pursuer);
    if (!position || !instance || position->roomId != current) {
        forget(pursuer);
        return;
    }

    m_combat.removeFromCombat(currentLock, pursuer, "returns to its post", now);
    if (!registry.moveTo(pursuer, state.homeRoom, AnchorMud::RangeBand::Near)) {
        PURSUIT_WARN("Could not return " + instance->name + " to " + state.homeRoom);
        forget(pursuer);
        return;
    }

    announce(PresenceChange::Left, pursuer, instance->name, current);
    announce(PresenceChange::Returned, pursuer, instance->name, state.homeRoom);
    PURSUIT_INFO(instance->name + " returns to " + state.homeRoom + " after " +
                 std::to_string(state.roomsAway) + " room(s)");
    forget(pursuer);
}

std::optional<PursuitState> PursuitController::getPursuit(EntityHandle pursuer) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pursuers.find(pursuer);
    if (it == m_pursuers.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PursuitController::isPursuing(EntityHandle pursuer) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pursuers.count(pursuer) > 0;
}

size_t PursuitController::getPursuerCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pursuers.size();
}

void PursuitController::forget(EntityHandle pursuer)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pursuers.erase(pursuer);
}
