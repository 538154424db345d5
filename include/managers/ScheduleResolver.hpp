/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCHEDULE_RESOLVER_HPP
#define SCHEDULE_RESOLVER_HPP

/**
 * @file ScheduleResolver.hpp
 * @brief Which schedule-bound NPC is where, as a function of the time of day
 *
 * Each NPC has a list of (start, end) -> room bindings in minutes since
 * midnight. Bindings of one NPC may not overlap. If no binding matches the
 * current minute the NPC is absent.
 *
 * Presence is resolved lazily: update() is called with the current minute
 * and returns the moves to apply. An NPC reported busy (combat, trade,
 * dialogue) keeps its current room and the change is deferred until the
 * first update after it is free again.
 */

#include "entities/EntityHandle.hpp"
#include "world/WorldData.hpp"
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct ScheduleMove {
    std::string npcId;
    std::optional<std::string> fromRoom;
    std::optional<std::string> toRoom;
};

struct ScheduleDeferral {
    std::string reason;
    std::optional<std::string> pendingRoom;
};

class ScheduleResolver {
public:
    static ScheduleResolver& Instance() {
        static ScheduleResolver instance;
        return instance;
    }

    // Returns a reason when the NPC may not move right now
    using BusyPredicate = std::function<std::optional<std::string>(const std::string& npcId)>;

    bool init();
    void clean();

    /**
     * @brief Add a binding.
     * @return false if it overlaps an existing binding of the same NPC
     */
    bool addBinding(const std::string& npcId, const AnchorMud::ScheduleEntry& entry);

    /**
     * @brief Load content schedules. Overlapping entries are rejected
     * individually.
     * @return Number of bindings accepted
     */
    size_t loadSchedules(const std::vector<AnchorMud::NpcScheduleDef>& schedules);

    void setBusyPredicate(BusyPredicate predicate);

    /**
     * @brief Pure lookup: the room an NPC's schedule names for a minute.
     */
    [[nodiscard]] std::optional<std::string> resolveRoom(const std::string& npcId,
                                                         int minuteOfDay) const;

    /**
     * @brief Move NPCs to their scheduled rooms, deferring busy ones.
     * @return The moves that were applied
     */
    std::vector<ScheduleMove> update(int minuteOfDay);

    [[nodiscard]] std::optional<std::string> getCurrentRoom(const std::string& npcId) const;
    [[nodiscard]] std::vector<std::string> presentNpcs(const std::string& roomId) const;
    [[nodiscard]] std::optional<ScheduleDeferral> getDeferral(const std::string& npcId) const;
    [[nodiscard]] bool isDeferred(const std::string& npcId) const { return getDeferral(npcId).has_value(); }

    /**
     * @brief A shop is open while its keeper is standing in it.
     */
    [[nodiscard]] bool isShopOpen(const std::string& shopRoom) const;

    // Live entity bound to a schedule NPC, if the runtime spawned one
    void bindHandle(const std::string& npcId, EntityHandle handle);
    [[nodiscard]] EntityHandle getHandle(const std::string& npcId) const;
    [[nodiscard]] std::vector<std::string> getNpcIds() const;

    /**
     * @brief True if two wrapped minute ranges share at least one minute.
     */
    static bool rangesOverlap(int startA, int endA, int startB, int endB);

private:
    ScheduleResolver() = default;
    ~ScheduleResolver() = default;
    ScheduleResolver(const ScheduleResolver&) = delete;
    ScheduleResolver& operator=(const ScheduleResolver&) = delete;

    struct NpcSchedule {
        std::vector<AnchorMud::ScheduleEntry> entries;
        std::optional<std::string> currentRoom;
        std::optional<ScheduleDeferral> deferral;
        std::string shopRoom;
        EntityHandle handle;
        bool resolved{false};
    };

    static std::optional<std::string> lookup(const NpcSchedule& schedule, int minuteOfDay);

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, NpcSchedule> m_schedules;
    BusyPredicate m_busy;
};

#endif // SCHEDULE_RESOLVER_HPP
