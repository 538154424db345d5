/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/UpkeepController.hpp"
#include "controllers/combat/CombatController.hpp"
#include "controllers/world/WeatherController.hpp"
#include "core/Logger.hpp"
#include "core/WorldClock.hpp"
#include "events/PresenceEvent.hpp"
#include "managers/ContentRegistry.hpp"
#include "managers/EntityRegistry.hpp"
#include "managers/RoomStateManager.hpp"
#include "managers/SpawnLootEngine.hpp"
#include <exception>
#include <set>

namespace {

constexpr int MAX_LOCK_ATTEMPTS = 4;

void announceSchedule(EntityHandle npc, const std::string& name, const std::string& roomId,
                      const std::string& direction)
{
    auto event = std::make_shared<PresenceEvent>(PresenceChange::Scheduled, npc, name, direction);
    event->setRoomId(roomId);
    if (!EventManager::Instance().dispatchEvent(event, EventManager::DispatchMode::Deferred)) {
        UPKEEP_DEBUG("Schedule presence dropped for " + roomId);
    }
}

} // namespace

UpkeepController::UpkeepController(const AnchorMud::RuntimeSettings& settings,
                                   CombatController& combat, WeatherController* weather)
    : m_settings(settings), m_combat(combat), mp_weather(weather)
{
}

void UpkeepController::subscribe()
{
    if (checkAlreadySubscribed()) {
        return;
    }
    setSubscribed(true);
}

void UpkeepController::update(double worldSeconds)
{
    tick(worldSeconds);
}

void UpkeepController::tick(double now)
{
    if (now - m_lastSweepAt >= m_settings.sweepIntervalSeconds) {
        m_lastSweepAt = now;
        runSweep(now);
        sweepDisconnected(now);
    }

    const int minute = WorldClock::minuteOfDay(static_cast<int64_t>(now));
    if (minute != m_lastMinute) {
        m_lastMinute = minute;
        applySchedules(minute, now);
    }

    if (mp_weather && now - m_lastWeatherAt >= m_settings.weatherEvaluationInterval) {
        m_lastWeatherAt = now;
        evaluateWeather(now);
    }
}

size_t UpkeepController::runSweep(double now)
{
    ++m_stats.sweeps;

    const size_t expired = SpawnLootEngine::Instance().sweepExpired(now);
    m_stats.expired += expired;

    const size_t retired = RoomStateManager::Instance().sweepIdle(
        now, static_cast<double>(m_settings.idleHorizonSeconds), [this](const std::string& roomId) {
            return !EntityRegistry::Instance().hasPlayersInRoom(roomId) &&
                   !m_combat.hasSession(roomId);
        });
    m_stats.roomsRetired += retired;

    if (expired + retired > 0) {
        UPKEEP_DEBUG("Sweep: " + std::to_string(expired) + " expired, " +
                     std::to_string(retired) + " room record(s) retired");
    }
    return expired + retired;
}

std::vector<ScheduleMove> UpkeepController::applySchedules(int minuteOfDay, double now)
{
    std::vector<ScheduleMove> moves = ScheduleResolver::Instance().update(minuteOfDay);
    for (const auto& move : moves) {
        try {
            moveScheduledNpc(move, now);
        } catch (const std::exception& e) {
            UPKEEP_ERROR("Schedule move for " + move.npcId + " failed: " + std::string(e.what()));
        }
    }
    m_stats.scheduleMoves += moves.size();
    return moves;
}

void UpkeepController::moveScheduledNpc(const ScheduleMove& move, double now)
{
    auto& schedules = ScheduleResolver::Instance();
    auto& registry = EntityRegistry::Instance();
    EntityHandle npc = schedules.getHandle(move.npcId);
    if (npc.isValid() && !registry.isValidHandle(npc)) {
        npc = INVALID_ENTITY_HANDLE;   // Killed since the last move
    }

    if (!npc.isValid()) {
        if (!move.toRoom) {
            return;
        }
        auto room = RoomStateManager::Instance().lockRoom(*move.toRoom);
        npc = SpawnLootEngine::Instance().spawnNpc(move.npcId, *move.toRoom);
        if (!npc.isValid()) {
            UPKEEP_WARN("Could not place scheduled NPC " + move.npcId);
            return;
        }
        schedules.bindHandle(move.npcId, npc);
        const auto* tmpl = ContentRegistry::Instance().getNpc(move.npcId);
        announceSchedule(npc, tmpl ? tmpl->name : move.npcId, *move.toRoom, "arrives.");
        return;
    }

    for (int attempt = 0; attempt < MAX_LOCK_ATTEMPTS; ++attempt) {
        auto position = registry.getPosition(npc);
        if (!position) {
            return;
        }
        const std::string from = position->roomId;
        if (move.toRoom && *move.toRoom == from) {
            return;
        }

        if (!move.toRoom) {
            auto room = RoomStateManager::Instance().lockRoom(from);
            auto confirmed = registry.getPosition(npc);
            auto instance = registry.getInstance(npc);
            if (!confirmed || !instance) {
                return;
            }
            if (confirmed->roomId != from) {
                continue;
            }
            m_combat.removeFromCombat(room, npc, "off duty", now);
            announceSchedule(npc, instance->name, from, "leaves for the day.");
            if (!registry.destroyEntity(npc)) {
                UPKEEP_WARN("Scheduled NPC " + move.npcId + " was already gone");
            }
            schedules.bindHandle(move.npcId, INVALID_ENTITY_HANDLE);
            return;
        }

        const std::string& toId = *move.toRoom;
        auto [first, second] = RoomStateManager::Instance().lockRooms(from, toId);
        RoomLock& fromLock = first.roomId() == from ? first : second;

        // Pursuit or a death may have changed things before the locks landed
        auto confirmed = registry.getPosition(npc);
        auto instance = registry.getInstance(npc);
        if (!confirmed || !instance) {
            UPKEEP_DEBUG("Scheduled NPC " + move.npcId + " vanished before its move");
            return;
        }
        if (confirmed->roomId != from) {
            continue;
        }

        m_combat.removeFromCombat(fromLock, npc, "off to other duties", now);
        if (!registry.moveTo(npc, toId, AnchorMud::RangeBand::Near)) {
            UPKEEP_WARN("Scheduled move of " + instance->name + " to " + toId + " failed");
            return;
        }
        announceSchedule(npc, instance->name, from, "heads off.");
        announceSchedule(npc, instance->name, toId, "arrives.");
        return;
    }
    UPKEEP_WARN("Scheduled NPC " + move.npcId + " kept moving; skipped this minute");
}

size_t UpkeepController::evaluateWeather(double now)
{
    std::set<std::string> regions;
    for (const std::string& roomId : EntityRegistry::Instance().getRoomsWithPlayers()) {
        const auto* room = ContentRegistry::Instance().getRoom(roomId);
        if (room && !room->region.empty() && regions.insert(room->region).second) {
            mp_weather->resolveRegion(room->region, now);
        }
    }
    return regions.size();
}

std::vector<EntityHandle> UpkeepController::sweepDisconnected(double now)
{
    std::vector<EntityHandle> expired;
    auto& registry = EntityRegistry::Instance();
    for (EntityHandle player : registry.getAllEntities(EntityKind::Player)) {
        auto instance = registry.getInstance(player);
        if (!instance || !instance->player() || instance->player()->connected) {
            continue;
        }
        if (instance->player()->graceExpired(now, m_settings.disconnectGraceSeconds)) {
            expired.push_back(player);
        }
    }

    std::vector<EntityHandle> removed;
    for (EntityHandle player : expired) {
        const bool gone = m_onGraceExpired ? m_onGraceExpired(player)
                                           : removeIfStillExpired(player, now);
        if (gone) {
            removed.push_back(player);
        }
    }
    m_stats.playersRemoved += removed.size();
    return removed;
}

bool UpkeepController::removeIfStillExpired(EntityHandle player, double now)
{
    auto& registry = EntityRegistry::Instance();
    auto position = registry.getPosition(player);
    if (!position) {
        UPKEEP_WARN("Disconnected player " + player.toString() + " was already gone");
        return false;
    }
    RoomLock room = RoomStateManager::Instance().lockRoom(position->roomId);
    auto confirmed = registry.getPosition(player);
    auto instance = registry.getInstance(player);
    if (!confirmed || confirmed->roomId != room.roomId() || !instance || !instance->player()) {
        return false;  // Moved or gone; the next sweep looks again
    }
    if (!instance->player()->graceExpired(now, m_settings.disconnectGraceSeconds)) {
        UPKEEP_DEBUG(instance->name + " reconnected before removal");
        return false;
    }
    return registry.destroyEntity(player);
}
