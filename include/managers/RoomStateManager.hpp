/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROOM_STATE_MANAGER_HPP
#define ROOM_STATE_MANAGER_HPP

/**
 * @file RoomStateManager.hpp
 * @brief Per-room runtime records and the per-room lock
 *
 * Every mutation of one room's entities, combat session or timers happens
 * while holding that room's RoomLock. Unrelated rooms lock independently.
 *
 * Records are created lazily by lockRoom() and retired by the idle sweep.
 * Retirement marks the record under its own lock before it leaves the map;
 * a locker that wakes up holding a retired record drops it and retries, so
 * at most one live record exists per room. A record whose rule timers or
 * encounter roll are still cooling down is never retired: a fresh record
 * would otherwise fire the same rule again inside its window.
 *
 * Spawn/loot timers have their own mutex so a death in one room can release
 * an alive-count slot in another room without taking that room's lock.
 */

#include <atomic>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct RuleTimer {
    double lastFiredAt{-1.0};
    double nextEligibleAt{0.0};
    int alive{0};
    uint32_t fireCount{0};
};

struct RoomRecord {
    explicit RoomRecord(std::string id) : roomId(std::move(id)) {}

    const std::string roomId;

    // Guarded by mutex (the room lock)
    std::mutex mutex;
    bool retired{false};
    uint64_t seed{0};
    int64_t resetEpoch{-1};
    uint32_t stateVersion{0};
    double lastActiveAt{0.0};
    double lastEncounterRollAt{-std::numeric_limits<double>::infinity()};
    double encounterEligibleAt{0.0};
    std::vector<uint64_t> activeEncounters;

    // Guarded by timerMutex
    mutable std::mutex timerMutex;
    std::unordered_map<std::string, RuleTimer> timers;
};

/**
 * @brief RAII exclusive access to one room's record
 */
class RoomLock {
public:
    RoomLock() = default;
    RoomLock(std::shared_ptr<RoomRecord> record, std::unique_lock<std::mutex> lock)
        : m_record(std::move(record)), m_lock(std::move(lock)) {}

    RoomLock(RoomLock&&) noexcept = default;
    RoomLock& operator=(RoomLock&&) noexcept = default;
    RoomLock(const RoomLock&) = delete;
    RoomLock& operator=(const RoomLock&) = delete;

    [[nodiscard]] bool ownsLock() const { return m_record && m_lock.owns_lock(); }
    explicit operator bool() const { return ownsLock(); }

    RoomRecord& record() { return *m_record; }
    const RoomRecord& record() const { return *m_record; }
    RoomRecord* operator->() { return m_record.get(); }

    [[nodiscard]] const std::string& roomId() const { return m_record->roomId; }

    void unlock() {
        if (m_lock.owns_lock()) {
            m_lock.unlock();
        }
        m_record.reset();
    }

private:
    std::shared_ptr<RoomRecord> m_record;
    std::unique_lock<std::mutex> m_lock;
};

class RoomStateManager {
public:
    static RoomStateManager& Instance() {
        static RoomStateManager instance;
        return instance;
    }

    /**
     * @param worldSeed Base of every room seed
     * @param resetSeconds Room reset period in world seconds
     */
    bool init(uint32_t worldSeed = 1337, int64_t resetSeconds = 3600);
    [[nodiscard]] bool isInitialized() const { return m_initialized.load(std::memory_order_acquire); }
    void clean();

    /**
     * @brief Exclusive access to a room, creating its record on first use.
     * Also applies a pending room reset and stamps the activity time.
     */
    RoomLock lockRoom(const std::string& roomId);

    /**
     * @brief Lock two rooms in a fixed (sorted) order. When both ids match
     * only the first lock is populated.
     */
    std::pair<RoomLock, RoomLock> lockRooms(const std::string& a, const std::string& b);

    /**
     * @brief Atomic check-and-update for a spawn or loot rule.
     *
     * Succeeds only if alive < maxAlive and now >= next-eligible time. On
     * success the timer records the firing, sets the next-eligible time to
     * now + cooldown and reserves `count` alive slots.
     *
     * @param requested Alive slots wanted; clamped to the room left under
     * the ceiling
     * @param granted Receives the number of slots actually reserved
     * @return false if another caller already consumed the window (or the
     * ceiling is reached); callers treat that as a silent no-op
     */
    bool tryConsumeSpawnEligibility(RoomRecord& record, const std::string& ruleId,
                                    int maxAlive, int64_t cooldownSeconds, double now,
                                    int requested = 1, int* granted = nullptr);

    /**
     * @brief Give back alive slots reserved by a firing that produced fewer
     * entities than reserved.
     */
    void releaseReservedSlots(RoomRecord& record, const std::string& ruleId, int count);

    /**
     * @brief Decrement a rule's alive count after a death, despawn or pickup.
     * Locks only the timer table of the owning room.
     */
    void notifyRuleInstanceRemoved(const std::string& roomId, const std::string& ruleId);

    [[nodiscard]] RuleTimer getTimer(const std::string& roomId, const std::string& ruleId) const;

    /**
     * @brief Seed for deterministic rolls in the current reset epoch
     */
    [[nodiscard]] static uint64_t computeSeed(uint32_t worldSeed, const std::string& roomId,
                                              int64_t resetEpoch);

    /**
     * @brief Remove records of rooms that are empty of players, idle past
     * the horizon, and hold no live spawns or cooling timers.
     * @param isRoomEmpty Called with the room lock held
     * @return Number of records retired
     */
    template <typename EmptyPredicate>
    size_t sweepIdle(double now, double idleHorizon, EmptyPredicate&& isRoomEmpty);

    [[nodiscard]] bool hasRecord(const std::string& roomId) const;
    [[nodiscard]] size_t getRecordCount() const;
    [[nodiscard]] std::vector<std::string> getActiveRoomIds() const;

private:
    RoomStateManager() = default;
    ~RoomStateManager() = default;
    RoomStateManager(const RoomStateManager&) = delete;
    RoomStateManager& operator=(const RoomStateManager&) = delete;

    std::shared_ptr<RoomRecord> findOrCreate(const std::string& roomId);
    std::shared_ptr<RoomRecord> find(const std::string& roomId) const;
    void applyReset(RoomRecord& record, double now);
    void eraseIfSame(const std::shared_ptr<RoomRecord>& record);

    mutable std::mutex m_mapMutex;
    std::unordered_map<std::string, std::shared_ptr<RoomRecord>> m_records;

    uint32_t m_worldSeed{1337};
    int64_t m_resetSeconds{3600};
    std::atomic<bool> m_initialized{false};
};

template <typename EmptyPredicate>
size_t RoomStateManager::sweepIdle(double now, double idleHorizon, EmptyPredicate&& isRoomEmpty) {
    std::vector<std::shared_ptr<RoomRecord>> candidates;
    {
        std::lock_guard<std::mutex> lock(m_mapMutex);
        candidates.reserve(m_records.size());
        for (const auto& [id, record] : m_records) {
            candidates.push_back(record);
        }
    }

    size_t retired = 0;
    for (auto& record : candidates) {
        std::unique_lock<std::mutex> roomLock(record->mutex, std::try_to_lock);
        if (!roomLock.owns_lock() || record->retired) {
            continue;  // In use right now, not idle
        }
        if (now - record->lastActiveAt < idleHorizon) {
            continue;
        }
        if (!isRoomEmpty(record->roomId)) {
            continue;
        }
        {
            std::lock_guard<std::mutex> timerLock(record->timerMutex);
            bool pinned = record->encounterEligibleAt > now;
            for (const auto& [ruleId, timer] : record->timers) {
                // Live spawns still count against this room, and a cooling
                // timer must outlast the record
                if (timer.alive > 0 || timer.nextEligibleAt > now) {
                    pinned = true;
                    break;
                }
            }
            if (pinned) {
                continue;
            }
        }
        record->retired = true;
        eraseIfSame(record);
        ++retired;
    }
    return retired;
}

#endif // ROOM_STATE_MANAGER_HPP
