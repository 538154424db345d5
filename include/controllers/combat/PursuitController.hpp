/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PURSUIT_CONTROLLER_HPP
#define PURSUIT_CONTROLLER_HPP

/**
 * @file PursuitController.hpp
 * @brief Disengage checks, room departure rules and leashed pursuit
 *
 * A fighter leaves a room in two steps: disengage (contested check, opens a
 * flee window on success) then move. When the move goes through, hostiles
 * aimed at the mover may follow according to their pursuit tag, as long as
 * the destination allows it and their leash still holds. Pursuers walk
 * back to their post when the leash runs out or the fight is over.
 *
 * With pursuit.leave_ends_combat set, leaving simply ends the mover's part
 * in the fight and nobody follows.
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include "controllers/combat/CombatTypes.hpp"
#include "core/RuntimeSettings.hpp"
#include "entities/EntityHandle.hpp"
#include "world/WorldData.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

class CombatController;
class RoomLock;
class WeatherController;

namespace AnchorMud {
class DiceRoller;
}

struct PursuitState {
    EntityHandle quarry;
    std::string homeRoom;
    int roomsAway{0};
    double startedAt{0.0};
    int leashRooms{0};
    double leashSeconds{0.0};
};

class PursuitController : public ControllerBase, public IUpdatable
{
public:
    PursuitController(CombatController& combat, const AnchorMud::RuntimeSettings& settings = {},
                      WeatherController* weather = nullptr);

    /**
     * @brief Forget pursuers that despawn
     */
    void subscribe() override;

    [[nodiscard]] std::string_view getName() const override { return "PursuitController"; }

    void update(double worldSeconds) override;

    /**
     * @brief Contested break-away attempt (caller holds the room lock).
     *
     * Readied OnDisengage reactions strike first. Success opens a flee
     * window of pursuit.flee_window_seconds; failure leaves the combatant
     * Engaged on the same target and spends its primary action.
     */
    ActionResult disengage(RoomLock& room, EntityHandle actor, double now);

    /**
     * @brief Whether actor may walk out of the room right now.
     * Observing and Disengaging fighters may; anyone still fighting must
     * disengage first unless leaving ends combat.
     */
    ActionResult checkDeparture(RoomLock& room, EntityHandle actor, double now) const;

    /**
     * @brief The mover has been placed in the destination room. Drops it
     * from the origin session and moves whichever hostiles follow.
     *
     * Caller holds both rooms.
     * @return Pursuers that followed
     */
    std::vector<EntityHandle> onCombatantLeft(RoomLock& from, RoomLock& to, EntityHandle mover,
                                              const std::string& direction, double now);

    /**
     * @brief Whether hostile would follow its quarry from one room into
     * another (tag, room flags, leash)
     */
    [[nodiscard]] bool canPursue(EntityHandle hostile, const std::string& fromRoom,
                                 const std::string& toRoom, double now) const;

    /**
     * @brief Send pursuers home whose time leash ran out or who have
     * nothing left to fight. Takes room locks itself.
     * @return Pursuers returned
     */
    size_t enforceLeashes(double now);

    [[nodiscard]] std::optional<PursuitState> getPursuit(EntityHandle pursuer) const;
    [[nodiscard]] bool isPursuing(EntityHandle pursuer) const;
    [[nodiscard]] size_t getPursuerCount() const;
    void forget(EntityHandle pursuer);

    /**
     * @brief Leash for a behavior profile: the template's own values, or the
     * pursuit mode's defaults from settings. Zero rooms means no pursuit.
     */
    [[nodiscard]] static std::pair<int, double> leashFor(const AnchorMud::BehaviorProfile& behavior,
                                                         const AnchorMud::RuntimeSettings& settings);

    void setDiceRoller(AnchorMud::DiceRoller* roller) { m_roller = roller; }

private:
    AnchorMud::DiceRoller& dice() const;
    void returnHome(EntityHandle pursuer, const PursuitState& state, double now);

    CombatController& m_combat;
    AnchorMud::RuntimeSettings m_settings;
    WeatherController* mp_weather{nullptr};
    AnchorMud::DiceRoller* m_roller{nullptr};

    mutable std::mutex m_mutex;
    std::unordered_map<EntityHandle, PursuitState> m_pursuers;
};

#endif // PURSUIT_CONTROLLER_HPP
