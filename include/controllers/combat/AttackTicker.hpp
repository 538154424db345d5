/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ATTACK_TICKER_HPP
#define ATTACK_TICKER_HPP

/**
 * @file AttackTicker.hpp
 * @brief Per-combatant repeating basic-attack timers
 *
 * One entry per Engaged combatant. Each entry carries a cancellation token:
 * starting a fresh ticker or cancelling one invalidates every fire already
 * collected for it, so a batch that was queued before a cancel can never
 * strike with a stale entry.
 *
 * collectDue() hands back the fires that are due, grouped by room, and
 * advances each entry's phase by its interval. The caller resolves each
 * fire under the room's lock after checking it with confirm().
 */

#include "entities/EntityHandle.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class TickerStart : uint8_t {
    Started,           // New ticker, first fire one interval from now
    AlreadyTargeting,  // Same target, nothing changed
    Retargeted         // Target swapped, phase kept
};

struct TickerEntry {
    EntityHandle combatant;
    EntityHandle target;
    std::string roomId;
    double interval{3.0};
    double nextFireAt{0.0};
    uint64_t token{0};
    uint64_t fires{0};
};

struct TickerFire {
    EntityHandle combatant;
    EntityHandle target;
    std::string roomId;
    double fireAt{0.0};
    uint64_t token{0};
};

class AttackTicker {
public:
    // Fires collected per entry per call when the server fell behind
    static constexpr int MAX_CATCH_UP = 4;

    AttackTicker() = default;

    /**
     * @brief Start or retarget a combatant's ticker.
     */
    TickerStart start(EntityHandle combatant, EntityHandle target, const std::string& roomId,
                      double interval, double now);

    /**
     * @brief Remove a ticker. Pending fires for it become stale.
     * @return false if there was no ticker
     */
    bool cancel(EntityHandle combatant);

    /**
     * @brief Cancel every ticker aimed at target.
     * @return Combatants whose ticker was cancelled
     */
    std::vector<EntityHandle> cancelTargeting(EntityHandle target);

    /**
     * @brief Push the next fire back (maneuver action cost).
     */
    bool addDelay(EntityHandle combatant, double seconds);

    /**
     * @brief Change the interval used from the next reschedule on.
     */
    bool setInterval(EntityHandle combatant, double interval);

    /**
     * @brief Collect due fires grouped by room id and advance their entries.
     */
    std::map<std::string, std::vector<TickerFire>> collectDue(double now);

    /**
     * @brief Current target if the fire's token is still live.
     */
    [[nodiscard]] std::optional<EntityHandle> confirm(const TickerFire& fire) const;

    [[nodiscard]] std::optional<TickerEntry> get(EntityHandle combatant) const;
    [[nodiscard]] bool isTicking(EntityHandle combatant) const;
    [[nodiscard]] size_t size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::unordered_map<EntityHandle, TickerEntry> m_entries;
    uint64_t m_nextToken{1};
};

#endif // ATTACK_TICKER_HPP
