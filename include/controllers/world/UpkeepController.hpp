/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UPKEEP_CONTROLLER_HPP
#define UPKEEP_CONTROLLER_HPP

/**
 * @file UpkeepController.hpp
 * @brief Recurring background work that keeps the world tidy
 *
 * Runs once per server tick and fans out on its own intervals:
 * - Expiry sweep and idle room cleanup every rooms.sweep_interval_seconds
 * - Schedule resolution whenever the minute of day changes
 * - Weather evaluation for occupied regions every weather.evaluation_interval
 * - Removal of disconnected players once their grace period ends
 *
 * Nothing here simulates empty rooms; it only retires state that is no
 * longer needed and nudges the rooms players are standing in.
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include "core/RuntimeSettings.hpp"
#include "entities/EntityHandle.hpp"
#include "managers/ScheduleResolver.hpp"
#include <functional>
#include <string_view>
#include <vector>

class CombatController;
class WeatherController;

struct UpkeepStats {
    size_t sweeps{0};
    size_t expired{0};
    size_t roomsRetired{0};
    size_t scheduleMoves{0};
    size_t playersRemoved{0};
};

class UpkeepController : public ControllerBase, public IUpdatable
{
public:
    /// Returns true if it removed the player, false if it reconnected first
    using DisconnectHandler = std::function<bool(EntityHandle)>;

    UpkeepController(const AnchorMud::RuntimeSettings& settings, CombatController& combat,
                     WeatherController* weather = nullptr);

    // Driven by the tick only; no event handlers
    void subscribe() override;

    [[nodiscard]] std::string_view getName() const override { return "UpkeepController"; }

    void update(double worldSeconds) override;

    /**
     * @brief Run everything that is due at this instant
     */
    void tick(double now);

    /**
     * @brief Expired instances and idle rooms
     * @return Instances and records removed
     */
    size_t runSweep(double now);

    /**
     * @brief Resolve schedules for a minute of day and apply the moves:
     * spawn, walk between rooms, or leave the world.
     */
    std::vector<ScheduleMove> applySchedules(int minuteOfDay, double now);

    /**
     * @brief Resolve weather for every region that has a player in it
     * @return Regions evaluated
     */
    size_t evaluateWeather(double now);

    /**
     * @brief Hand players whose disconnect grace ran out to the handler.
     * Without a handler the body is destroyed here, after the grace is
     * confirmed again under its room lock.
     * @return Players removed
     */
    std::vector<EntityHandle> sweepDisconnected(double now);

    void setDisconnectHandler(DisconnectHandler handler) { m_onGraceExpired = std::move(handler); }

    [[nodiscard]] const UpkeepStats& getStats() const { return m_stats; }

private:
    void moveScheduledNpc(const ScheduleMove& move, double now);

    bool removeIfStillExpired(EntityHandle player, double now);

    AnchorMud::RuntimeSettings m_settings;
    CombatController& m_combat;
    WeatherController* mp_weather{nullptr};
    DisconnectHandler m_onGraceExpired;

    double m_lastSweepAt{0.0};
    double m_lastWeatherAt{0.0};
    int m_lastMinute{-1};
    UpkeepStats m_stats;
};

#endif // UPKEEP_CONTROLLER_HPP
