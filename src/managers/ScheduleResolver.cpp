/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ScheduleResolver.hpp"
#include "core/Logger.hpp"
#include "core/WorldClock.hpp"
#include <algorithm>
#include <mutex>
#include <utility>

using AnchorMud::NpcScheduleDef;
using AnchorMud::ScheduleEntry;

namespace {

// Split a possibly wrapping [start, end) range into plain segments
std::vector<std::pair<int, int>> segments(int start, int end) {
    if (start == end) {
        return {{0, WorldClock::MINUTES_PER_DAY}};
    }
    if (start < end) {
        return {{start, end}};
    }
    return {{start, WorldClock::MINUTES_PER_DAY}, {0, end}};
}

std::string describeRoom(const std::optional<std::string>& room) {
    return room ? *room : std::string("(absent)");
}

} // namespace

bool ScheduleResolver::init() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_schedules.clear();
    SCHEDULE_INFO("ScheduleResolver initialized");
    return true;
}

void ScheduleResolver::clean() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_schedules.clear();
    m_busy = nullptr;
}

bool ScheduleResolver::rangesOverlap(int startA, int endA, int startB, int endB) {
    for (const auto& [a0, a1] : segments(startA, endA)) {
        for (const auto& [b0, b1] : segments(startB, endB)) {
            if (a0 < b1 && b0 < a1) {
                return true;
            }
        }
    }
    return false;
}

bool ScheduleResolver::addBinding(const std::string& npcId, const ScheduleEntry& entry) {
    if (entry.startMinute < 0 || entry.startMinute >= WorldClock::MINUTES_PER_DAY ||
        entry.endMinute < 0 || entry.endMinute >= WorldClock::MINUTES_PER_DAY ||
        entry.roomId.empty()) {
        SCHEDULE_WARN("Invalid schedule binding for " + npcId);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    NpcSchedule& schedule = m_schedules[npcId];
    for (const auto& existing : schedule.entries) {
        if (rangesOverlap(existing.startMinute, existing.endMinute, entry.startMinute,
                          entry.endMinute)) {
            SCHEDULE_WARN("Rejected overlapping schedule binding for " + npcId + " (" +
                          entry.roomId + " overlaps " + existing.roomId + ")");
            return false;
        }
    }
    schedule.entries.push_back(entry);
    return true;
}

size_t ScheduleResolver::loadSchedules(const std::vector<NpcScheduleDef>& schedules) {
    size_t accepted = 0;
    for (const auto& def : schedules) {
        for (const auto& entry : def.entries) {
            if (addBinding(def.npcTemplateId, entry)) {
                ++accepted;
            }
        }
        if (!def.shopRoom.empty()) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            m_schedules[def.npcTemplateId].shopRoom = def.shopRoom;
        }
    }
    SCHEDULE_INFO("Loaded " + std::to_string(accepted) + " schedule bindings");
    return accepted;
}

void ScheduleResolver::setBusyPredicate(BusyPredicate predicate) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_busy = std::move(predicate);
}

std::optional<std::string> ScheduleResolver::lookup(const NpcSchedule& schedule, int minuteOfDay) {
    for (const auto& entry : schedule.entries) {
        if (WorldClock::isMinuteInRange(entry.startMinute, entry.endMinute, minuteOfDay)) {
            return entry.roomId;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ScheduleResolver::resolveRoom(const std::string& npcId,
                                                         int minuteOfDay) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_schedules.find(npcId);
    if (it == m_schedules.end()) {
        return std::nullopt;
    }
    return lookup(it->second, minuteOfDay);
}

std::vector<ScheduleMove> ScheduleResolver::update(int minuteOfDay) {
    struct Pending {
        std::string npcId;
        std::optional<std::string> target;
    };

    // Decide targets under the read lock, ask the busy predicate unlocked
    std::vector<Pending> pending;
    BusyPredicate busy;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        busy = m_busy;
        for (const auto& [npcId, schedule] : m_schedules) {
            auto target = lookup(schedule, minuteOfDay);
            if (!schedule.resolved || target != schedule.currentRoom || schedule.deferral) {
                pending.push_back(Pending{npcId, std::move(target)});
            }
        }
    }

    std::vector<std::pair<Pending, std::optional<std::string>>> decided;
    decided.reserve(pending.size());
    for (auto& p : pending) {
        std::optional<std::string> reason;
        if (busy) {
            reason = busy(p.npcId);
        }
        decided.emplace_back(std::move(p), std::move(reason));
    }

    std::vector<ScheduleMove> moves;
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (auto& [p, reason] : decided) {
        auto it = m_schedules.find(p.npcId);
        if (it == m_schedules.end()) {
            continue;
        }
        NpcSchedule& schedule = it->second;

        if (schedule.resolved && p.target == schedule.currentRoom) {
            schedule.deferral.reset();
            continue;
        }
        if (reason && schedule.resolved) {
            if (!schedule.deferral) {
                SCHEDULE_DEBUG("Deferring schedule change for " + p.npcId + ": " + *reason);
            }
            schedule.deferral = ScheduleDeferral{*reason, p.target};
            continue;
        }

        moves.push_back(ScheduleMove{p.npcId, schedule.currentRoom, p.target});
        SCHEDULE_DEBUG(p.npcId + " moves " + describeRoom(schedule.currentRoom) + " -> " +
                       describeRoom(p.target));
        schedule.currentRoom = p.target;
        schedule.deferral.reset();
        schedule.resolved = true;
    }
    return moves;
}

std::optional<std::string> ScheduleResolver::getCurrentRoom(const std::string& npcId) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_schedules.find(npcId);
    if (it == m_schedules.end()) {
        return std::nullopt;
    }
    return it->second.currentRoom;
}

std::vector<std::string> ScheduleResolver::presentNpcs(const std::string& roomId) const {
    std::vector<std::string> present;
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    for (const auto& [npcId, schedule] : m_schedules) {
        if (schedule.currentRoom && *schedule.currentRoom == roomId) {
            present.push_back(npcId);
        }
    }
    std::sort(present.begin(), present.end());
    return present;
}

std::optional<ScheduleDeferral> ScheduleResolver::getDeferral(const std::string& npcId) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_schedules.find(npcId);
    if (it == m_schedules.end()) {
        return std::nullopt;
    }
    return it->second.deferral;
}

bool ScheduleResolver::isShopOpen(const std::string& shopRoom) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    for (const auto& [npcId, schedule] : m_schedules) {
        if (schedule.shopRoom == shopRoom && schedule.currentRoom &&
            *schedule.currentRoom == shopRoom) {
            return true;
        }
    }
    return false;
}

void ScheduleResolver::bindHandle(const std::string& npcId, EntityHandle handle) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_schedules[npcId].handle = handle;
}

EntityHandle ScheduleResolver::getHandle(const std::string& npcId) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_schedules.find(npcId);
    return it == m_schedules.end() ? INVALID_ENTITY_HANDLE : it->second.handle;
}

std::vector<std::string> ScheduleResolver::getNpcIds() const {
    std::vector<std::string> ids;
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    for (const auto& [npcId, schedule] : m_schedules) {
        ids.push_back(npcId);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}
