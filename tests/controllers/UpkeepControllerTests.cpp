/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file UpkeepControllerTests.cpp
 * @brief Tests for the periodic world upkeep pass
 *
 * Tests cover:
 * - Expired items removed by the sweep
 * - Idle room records retired only when empty
 * - Schedule-bound NPCs placed, moved and sent home
 * - Scheduled moves after the NPC was pushed elsewhere
 * - Disconnected players removed after the grace period
 * - Weather evaluation for occupied regions
 * - Tick cadence
 */

#define BOOST_TEST_MODULE UpkeepControllerTests
#include <boost/test/unit_test.hpp>

#include "common/TestWorldFixture.hpp"
#include "controllers/combat/CombatController.hpp"
#include "controllers/world/UpkeepController.hpp"
#include "controllers/world/WeatherController.hpp"
#include "events/PresenceEvent.hpp"
#include "managers/ScheduleResolver.hpp"

using namespace TestWorld;

struct UpkeepFixture : WorldFixture
{
    UpkeepFixture() : combat(settings), weather(settings), upkeep(settings, combat, &weather)
    {
        ScheduleResolver::Instance().init();
        ScheduleResolver::Instance().loadSchedules(ContentRegistry::Instance().getSchedules());
    }

    ~UpkeepFixture() { ScheduleResolver::Instance().clean(); }

    void disconnect(EntityHandle player, double at)
    {
        EntityRegistry::Instance().modifyInstance(player, [at](EntityInstance& instance) {
            instance.player()->connected = false;
            instance.player()->disconnectedAt = at;
        });
    }

    EventRecorder recorder;
    CombatController combat;
    WeatherController weather;
    UpkeepController upkeep;
};

// ============================================================================
// Sweeps
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SweepTests, UpkeepFixture)

BOOST_AUTO_TEST_CASE(TestExpiredItemsRemoved)
{
    EntityHandle pelt;
    {
        auto room = RoomStateManager::Instance().lockRoom("gate");
        pelt = SpawnLootEngine::Instance().spawnItem("pelt", "gate", 1, 10.0);
    }
    BOOST_REQUIRE(pelt.isValid());

    BOOST_CHECK_EQUAL(upkeep.runSweep(5.0), 0u);
    BOOST_CHECK(EntityRegistry::Instance().isValidHandle(pelt));

    BOOST_CHECK_EQUAL(upkeep.runSweep(11.0), 1u);
    BOOST_CHECK(!EntityRegistry::Instance().isValidHandle(pelt));

    UpkeepStats stats = upkeep.getStats();
    BOOST_CHECK_EQUAL(stats.sweeps, 2u);
    BOOST_CHECK_EQUAL(stats.expired, 1u);
}

BOOST_AUTO_TEST_CASE(TestIdleRoomsRetiredWhenEmpty)
{
    addPlayer("Wren", "start");
    { auto room = RoomStateManager::Instance().lockRoom("start"); }
    { auto room = RoomStateManager::Instance().lockRoom("den"); }
    BOOST_REQUIRE_EQUAL(RoomStateManager::Instance().getRecordCount(), 2u);

    // Still inside the idle horizon
    BOOST_CHECK_EQUAL(upkeep.runSweep(60.0), 0u);

    const double later = static_cast<double>(settings.idleHorizonSeconds) + 1.0;
    BOOST_CHECK_EQUAL(upkeep.runSweep(later), 1u);
    BOOST_CHECK(!RoomStateManager::Instance().hasRecord("den"));
    BOOST_CHECK(RoomStateManager::Instance().hasRecord("start"));
    BOOST_CHECK_EQUAL(upkeep.getStats().roomsRetired, 1u);
}

BOOST_AUTO_TEST_CASE(TestDisconnectGrace)
{
    EntityHandle wren = addPlayer("Wren", "start");
    disconnect(wren, 10.0);

    BOOST_CHECK(upkeep.sweepDisconnected(20.0).empty());

    auto removed = upkeep.sweepDisconnected(10.0 + settings.disconnectGraceSeconds);
    BOOST_REQUIRE_EQUAL(removed.size(), 1u);
    BOOST_CHECK_EQUAL(removed[0], wren);
    BOOST_CHECK(!EntityRegistry::Instance().isValidHandle(wren));
    BOOST_CHECK_EQUAL(upkeep.getStats().playersRemoved, 1u);
}

BOOST_AUTO_TEST_CASE(TestDisconnectHandlerTakesOver)
{
    EntityHandle wren = addPlayer("Wren", "start");
    EntityHandle mira = addPlayer("Mira", "start");
    disconnect(wren, 0.0);

    std::vector<EntityHandle> handed;
    upkeep.setDisconnectHandler([&handed](EntityHandle player) {
        handed.push_back(player);
        return false;
    });

    BOOST_CHECK(upkeep.sweepDisconnected(100.0).empty());
    BOOST_CHECK_EQUAL(upkeep.getStats().playersRemoved, 0u);
    BOOST_REQUIRE_EQUAL(handed.size(), 1u);
    BOOST_CHECK_EQUAL(handed[0], wren);
    // The handler owns removal
    BOOST_CHECK(EntityRegistry::Instance().isValidHandle(wren));
    BOOST_CHECK(EntityRegistry::Instance().isValidHandle(mira));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Schedules
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ScheduleTests, UpkeepFixture)

BOOST_AUTO_TEST_CASE(TestSmithFollowsSchedule)
{
    auto& schedules = ScheduleResolver::Instance();

    auto moves = upkeep.applySchedules(9 * 60, 0.0);
    BOOST_REQUIRE_EQUAL(moves.size(), 1u);
    BOOST_CHECK(moves[0].toRoom && *moves[0].toRoom == "forge");

    EntityHandle smith = schedules.getHandle("smith");
    BOOST_REQUIRE(smith.isValid());
    BOOST_CHECK_EQUAL(roomOf(smith), "forge");
    BOOST_CHECK(schedules.isShopOpen("forge"));

    recorder.pump();
    BOOST_CHECK(recorder.sawMessage("the smith arrives."));
    recorder.clear();

    BOOST_CHECK(upkeep.applySchedules(10 * 60, 0.0).empty());

    upkeep.applySchedules(18 * 60 + 5, 0.0);
    BOOST_CHECK_EQUAL(schedules.getHandle("smith"), smith);
    BOOST_CHECK_EQUAL(roomOf(smith), "start");
    BOOST_CHECK(!schedules.isShopOpen("forge"));
    recorder.pump();
    BOOST_CHECK(recorder.sawMessage("the smith heads off."));
    recorder.clear();

    upkeep.applySchedules(21 * 60, 0.0);
    BOOST_CHECK(!EntityRegistry::Instance().isValidHandle(smith));
    BOOST_CHECK(!schedules.getHandle("smith").isValid());
    recorder.pump();
    BOOST_CHECK(recorder.sawMessage("the smith leaves for the day."));

    BOOST_CHECK_EQUAL(upkeep.getStats().scheduleMoves, 3u);
}

BOOST_AUTO_TEST_CASE(TestKilledNpcRespawnedOnNextShift)
{
    upkeep.applySchedules(9 * 60, 0.0);
    EntityHandle first = ScheduleResolver::Instance().getHandle("smith");
    BOOST_REQUIRE(EntityRegistry::Instance().destroyEntity(first));

    upkeep.applySchedules(18 * 60 + 5, 0.0);
    EntityHandle second = ScheduleResolver::Instance().getHandle("smith");
    BOOST_REQUIRE(second.isValid());
    BOOST_CHECK(second != first);
    BOOST_CHECK_EQUAL(roomOf(second), "start");
}

BOOST_AUTO_TEST_CASE(TestScheduledMoveStartsFromWhereTheNpcIs)
{
    upkeep.applySchedules(9 * 60, 0.0);
    EntityHandle smith = ScheduleResolver::Instance().getHandle("smith");
    BOOST_REQUIRE(smith.isValid());

    // Chased out of the forge before the evening move
    BOOST_REQUIRE(EntityRegistry::Instance().moveTo(smith, "gate", std::nullopt));
    recorder.pump();
    recorder.clear();

    upkeep.applySchedules(18 * 60 + 5, 0.0);
    BOOST_CHECK_EQUAL(roomOf(smith), "start");
    BOOST_CHECK_EQUAL(EntityRegistry::Instance().countInRoom("gate", EntityKind::NPC), 0u);
    BOOST_CHECK_EQUAL(EntityRegistry::Instance().countInRoom("forge", EntityKind::NPC), 0u);
    BOOST_CHECK_EQUAL(EntityRegistry::Instance().countInRoom("start", EntityKind::NPC), 1u);

    recorder.pump();
    bool leftGate = false;
    for (const auto& presence : recorder.ofType<PresenceEvent>()) {
        if (presence->getEntity() == smith && presence->getRoomId() == "gate" &&
            presence->getMessage() == "the smith heads off.") {
            leftGate = true;
        }
    }
    BOOST_CHECK(leftGate);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Weather and cadence
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(CadenceTests, UpkeepFixture)

BOOST_AUTO_TEST_CASE(TestWeatherOnlyForOccupiedRegions)
{
    BOOST_CHECK_EQUAL(upkeep.evaluateWeather(0.0), 0u);
    BOOST_CHECK_EQUAL(weather.getRegionCount(), 0u);

    addPlayer("Wren", "gate");
    addPlayer("Mira", "road");
    BOOST_CHECK_EQUAL(upkeep.evaluateWeather(0.0), 1u);
    BOOST_CHECK_EQUAL(weather.getRegionCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestSweepCadence)
{
    upkeep.tick(1.0);
    BOOST_CHECK_EQUAL(upkeep.getStats().sweeps, 0u);

    upkeep.update(settings.sweepIntervalSeconds);
    BOOST_CHECK_EQUAL(upkeep.getStats().sweeps, 1u);

    upkeep.tick(settings.sweepIntervalSeconds + 1.0);
    BOOST_CHECK_EQUAL(upkeep.getStats().sweeps, 1u);

    upkeep.tick(settings.sweepIntervalSeconds * 2.0);
    BOOST_CHECK_EQUAL(upkeep.getStats().sweeps, 2u);
}

BOOST_AUTO_TEST_SUITE_END()
