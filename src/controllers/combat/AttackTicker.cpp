/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/AttackTicker.hpp"
#include "core/Logger.hpp"
#include <algorithm>

TickerStart AttackTicker::start(EntityHandle combatant, EntityHandle target,
                                const std::string& roomId, double interval, double now)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(combatant);
    if (it != m_entries.end() && it->second.roomId == roomId) {
        if (it->second.target == target) {
            return TickerStart::AlreadyTargeting;
        }
        it->second.target = target;
        TICKER_DEBUG(combatant.toString() + " retargets " + target.toString());
        return TickerStart::Retargeted;
    }

    TickerEntry entry;
    entry.combatant = combatant;
    entry.target = target;
    entry.roomId = roomId;
    entry.interval = interval;
    entry.nextFireAt = now + interval;
    entry.token = m_nextToken++;
    m_entries[combatant] = std::move(entry);

    TICKER_DEBUG(combatant.toString() + " ticking every " + std::to_string(interval) + "s");
    return TickerStart::Started;
}

bool AttackTicker::cancel(EntityHandle combatant)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.erase(combatant) > 0;
}

std::vector<EntityHandle> AttackTicker::cancelTargeting(EntityHandle target)
{
    std::vector<EntityHandle> cancelled;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.target == target) {
            cancelled.push_back(it->first);
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
    std::sort(cancelled.begin(), cancelled.end());
    return cancelled;
}

bool AttackTicker::addDelay(EntityHandle combatant, double seconds)
{
    if (seconds <= 0.0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(combatant);
    if (it == m_entries.end()) {
        return false;
    }
    it->second.nextFireAt += seconds;
    return true;
}

bool AttackTicker::setInterval(EntityHandle combatant, double interval)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(combatant);
    if (it == m_entries.end() || interval <= 0.0) {
        return false;
    }
    it->second.interval = interval;
    return true;
}

std::map<std::string, std::vector<TickerFire>> AttackTicker::collectDue(double now)
{
    std::map<std::string, std::vector<TickerFire>> due;
    std::lock_guard<std::mutex> lock(m_mutex);

    for (auto& [handle, entry] : m_entries) {
        int fired = 0;
        while (entry.nextFireAt <= now && fired < MAX_CATCH_UP) {
            due[entry.roomId].push_back(
                TickerFire{entry.combatant, entry.target, entry.roomId, entry.nextFireAt, entry.token});
            entry.nextFireAt += entry.interval;
            ++entry.fires;
            ++fired;
        }
        if (entry.nextFireAt <= now) {
            // Too far behind; drop the backlog instead of bursting
            TICKER_WARN(handle.toString() + " ticker fell behind, skipping backlog");
            entry.nextFireAt = now + entry.interval;
        }
    }

    // Fire time order within a room, ties by combatant for stable replay
    for (auto& [roomId, fires] : due) {
        std::sort(fires.begin(), fires.end(), [](const TickerFire& a, const TickerFire& b) {
            if (a.fireAt != b.fireAt) {
                return a.fireAt < b.fireAt;
            }
            return a.combatant < b.combatant;
        });
    }
    return due;
}

std::optional<EntityHandle> AttackTicker::confirm(const TickerFire& fire) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(fire.combatant);
    if (it == m_entries.end() || it->second.token != fire.token) {
        return std::nullopt;
    }
    return it->second.target;
}

std::optional<TickerEntry> AttackTicker::get(EntityHandle combatant) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(combatant);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool AttackTicker::isTicking(EntityHandle combatant) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(combatant) > 0;
}

size_t AttackTicker::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void AttackTicker::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}
