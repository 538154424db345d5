/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/RoomStateManager.hpp"
#include "core/Logger.hpp"
#include "core/WorldClock.hpp"
#include "utils/DiceRoller.hpp"
#include <algorithm>
#include <cmath>

bool RoomStateManager::init(uint32_t worldSeed, int64_t resetSeconds) {
    if (resetSeconds <= 0) {
        ROOMSTATE_ERROR("Room reset period must be positive");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mapMutex);
        m_records.clear();
    }
    m_worldSeed = worldSeed;
    m_resetSeconds = resetSeconds;
    m_initialized.store(true, std::memory_order_release);

    ROOMSTATE_INFO("RoomStateManager initialized (seed " + std::to_string(worldSeed) +
                   ", reset every " + std::to_string(resetSeconds) + "s)");
    return true;
}

void RoomStateManager::clean() {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    m_records.clear();
    m_initialized.store(false, std::memory_order_release);
}

RoomLock RoomStateManager::lockRoom(const std::string& roomId) {
    const double now = WorldClock::Instance().now();

    while (true) {
        auto record = findOrCreate(roomId);
        std::unique_lock<std::mutex> lock(record->mutex);
        if (record->retired) {
            // Lost a race with the idle sweep; the map now holds no record
            // (or a newer one) for this room
            continue;
        }
        applyReset(*record, now);
        record->lastActiveAt = std::max(record->lastActiveAt, now);
        return RoomLock(std::move(record), std::move(lock));
    }
}

std::pair<RoomLock, RoomLock> RoomStateManager::lockRooms(const std::string& a,
                                                          const std::string& b) {
    if (a == b) {
        return {lockRoom(a), RoomLock{}};
    }
    if (a < b) {
        RoomLock first = lockRoom(a);
        RoomLock second = lockRoom(b);
        return {std::move(first), std::move(second)};
    }
    RoomLock second = lockRoom(b);
    RoomLock first = lockRoom(a);
    return {std::move(first), std::move(second)};
}

bool RoomStateManager::tryConsumeSpawnEligibility(RoomRecord& record, const std::string& ruleId,
                                                  int maxAlive, int64_t cooldownSeconds,
                                                  double now, int requested, int* granted) {
    std::lock_guard<std::mutex> lock(record.timerMutex);
    RuleTimer& timer = record.timers[ruleId];

    if (granted) {
        *granted = 0;
    }
    if (timer.alive >= maxAlive || now < timer.nextEligibleAt) {
        return false;
    }

    const int reserve = std::clamp(requested, 1, maxAlive - timer.alive);
    if (granted) {
        *granted = reserve;
    }
    timer.lastFiredAt = now;
    timer.nextEligibleAt = now + static_cast<double>(cooldownSeconds);
    timer.alive += reserve;
    ++timer.fireCount;

    ROOMSTATE_DEBUG("Rule " + ruleId + " fired in " + record.roomId + " (alive " +
                    std::to_string(timer.alive) + "/" + std::to_string(maxAlive) + ")");
    return true;
}

void RoomStateManager::releaseReservedSlots(RoomRecord& record, const std::string& ruleId,
                                            int count) {
    if (count <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(record.timerMutex);
    auto it = record.timers.find(ruleId);
    if (it != record.timers.end()) {
        it->second.alive = std::max(0, it->second.alive - count);
    }
}

void RoomStateManager::notifyRuleInstanceRemoved(const std::string& roomId,
                                                 const std::string& ruleId) {
    if (ruleId.empty()) {
        return;
    }
    auto record = find(roomId);
    if (!record) {
        ROOMSTATE_DEBUG("No record for " + roomId + " when releasing rule " + ruleId);
        return;
    }
    std::lock_guard<std::mutex> lock(record->timerMutex);
    auto it = record->timers.find(ruleId);
    if (it == record->timers.end() || it->second.alive <= 0) {
        ROOMSTATE_WARN("Alive count underflow for rule " + ruleId + " in " + roomId);
        return;
    }
    --it->second.alive;
}

RuleTimer RoomStateManager::getTimer(const std::string& roomId, const std::string& ruleId) const {
    auto record = find(roomId);
    if (!record) {
        return RuleTimer{};
    }
    std::lock_guard<std::mutex> lock(record->timerMutex);
    auto it = record->timers.find(ruleId);
    return it == record->timers.end() ? RuleTimer{} : it->second;
}

uint64_t RoomStateManager::computeSeed(uint32_t worldSeed, const std::string& roomId,
                                       int64_t resetEpoch) {
    return AnchorMud::deriveSeed(worldSeed, roomId, static_cast<uint64_t>(resetEpoch));
}

bool RoomStateManager::hasRecord(const std::string& roomId) const {
    return find(roomId) != nullptr;
}

size_t RoomStateManager::getRecordCount() const {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    return m_records.size();
}

std::vector<std::string> RoomStateManager::getActiveRoomIds() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(m_mapMutex);
        ids.reserve(m_records.size());
        for (const auto& [id, record] : m_records) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::shared_ptr<RoomRecord> RoomStateManager::findOrCreate(const std::string& roomId) {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    auto it = m_records.find(roomId);
    if (it != m_records.end()) {
        return it->second;
    }
    auto record = std::make_shared<RoomRecord>(roomId);
    m_records.emplace(roomId, record);
    ROOMSTATE_DEBUG("Created room record for " + roomId);
    return record;
}

std::shared_ptr<RoomRecord> RoomStateManager::find(const std::string& roomId) const {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    auto it = m_records.find(roomId);
    return it == m_records.end() ? nullptr : it->second;
}

void RoomStateManager::applyReset(RoomRecord& record, double now) {
    const auto epoch = static_cast<int64_t>(std::floor(now / static_cast<double>(m_resetSeconds)));
    if (epoch == record.resetEpoch) {
        return;
    }
    const bool firstUse = record.resetEpoch < 0;
    record.resetEpoch = epoch;
    record.seed = computeSeed(m_worldSeed, record.roomId, epoch);
    ++record.stateVersion;
    if (!firstUse) {
        ROOMSTATE_INFO("Room " + record.roomId + " reset (epoch " + std::to_string(epoch) + ")");
    }
}

void RoomStateManager::eraseIfSame(const std::shared_ptr<RoomRecord>& record) {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    auto it = m_records.find(record->roomId);
    if (it != m_records.end() && it->second == record) {
        m_records.erase(it);
        ROOMSTATE_DEBUG("Retired idle room record " + record->roomId);
    }
}
