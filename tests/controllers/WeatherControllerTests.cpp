/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file WeatherControllerTests.cpp
 * @brief Tests for lazily resolved regional weather
 *
 * Tests cover:
 * - Region records created on first sight with the region's initial type
 * - No transition before the next-change time, reproducible transitions after
 * - Forced weather, intensity clamping and change events
 * - Overlays and modifiers by exposure
 * - Weighted table rolls and table cleanup
 * - Resolution triggered by players entering rooms
 */

#define BOOST_TEST_MODULE WeatherControllerTests
#include <boost/test/unit_test.hpp>

#include "common/TestWorldFixture.hpp"
#include "controllers/world/WeatherController.hpp"
#include "events/PresenceEvent.hpp"
#include "events/WeatherEvent.hpp"
#include "mocks/MockDiceRoller.hpp"

using namespace TestWorld;

struct WeatherFixture : WorldFixture
{
    WeatherFixture() : weather(settings) {}

    EventRecorder recorder;
    WeatherController weather;
};

// ============================================================================
// Region records
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(RegionTests, WeatherFixture)

BOOST_AUTO_TEST_CASE(TestFirstSightCreatesRecord)
{
    BOOST_CHECK(!weather.peekRegion("coast"));

    RegionWeather coast = weather.resolveRegion("coast", 100.0);
    BOOST_CHECK_EQUAL(coast.type, "clear");
    BOOST_CHECK_EQUAL(coast.intensity, 0);
    BOOST_CHECK_EQUAL(coast.transitions, 0u);
    BOOST_CHECK_CLOSE(coast.nextChangeAt, 1000.0, 0.001);
    BOOST_CHECK_EQUAL(weather.getRegionCount(), 1u);

    RegionWeather later = weather.resolveRegion("coast", 999.0);
    BOOST_CHECK_EQUAL(later.transitions, 0u);
    BOOST_CHECK(weather.peekRegion("coast"));
}

BOOST_AUTO_TEST_CASE(TestResolveForRoom)
{
    auto viaRoom = weather.resolveForRoom("road", 0.0);
    BOOST_REQUIRE(viaRoom);
    BOOST_CHECK_EQUAL(viaRoom->region, "coast");
    BOOST_CHECK(!weather.resolveForRoom("nowhere", 0.0));
}

BOOST_AUTO_TEST_CASE(TestTransitionsAreReproducible)
{
    WeatherController other(settings);

    RegionWeather first = weather.resolveRegion("coast", 0.0);
    other.resolveRegion("coast", 0.0);

    RegionWeather a = weather.resolveRegion("coast", first.nextChangeAt);
    RegionWeather b = other.resolveRegion("coast", first.nextChangeAt);

    BOOST_CHECK_EQUAL(a.transitions, 1u);
    BOOST_CHECK_EQUAL(a.type, b.type);
    BOOST_CHECK_CLOSE(a.nextChangeAt, b.nextChangeAt, 0.001);
    BOOST_CHECK_GE(a.nextChangeAt - first.nextChangeAt,
                   static_cast<double>(settings.weatherMinDuration));
    BOOST_CHECK_LE(a.nextChangeAt - first.nextChangeAt,
                   static_cast<double>(settings.weatherMaxDuration));
}

BOOST_AUTO_TEST_CASE(TestForcedWeather)
{
    weather.setWeather("coast", "fog", 2, 10.0);
    recorder.pump();

    auto changes = recorder.ofType<WeatherEvent>();
    BOOST_REQUIRE_EQUAL(changes.size(), 1u);
    BOOST_CHECK_EQUAL(changes[0]->getPreviousWeather(), "clear");
    BOOST_CHECK_EQUAL(changes[0]->getWeather(), "fog");
    BOOST_CHECK_EQUAL(changes[0]->getIntensity(), 2);
    BOOST_CHECK_EQUAL(changes[0]->getMessage(), "A fog creeps in and thickens.");

    // Same type again: record updated, nothing announced
    recorder.clear();
    weather.setWeather("coast", "fog", 9, 20.0);
    recorder.pump();
    BOOST_CHECK(recorder.ofType<WeatherEvent>().empty());
    BOOST_CHECK_EQUAL(weather.peekRegion("coast")->intensity, 3);
}

BOOST_AUTO_TEST_CASE(TestPlayerEntryResolvesRegion)
{
    weather.subscribe();

    auto crab = std::make_shared<PresenceEvent>(PresenceChange::Entered,
                                                EntityHandle(5, EntityKind::Creature, 1),
                                                "a shore crab");
    crab->setRoomId("gate");
    EventManager::Instance().dispatchEvent(crab);
    recorder.pump();
    BOOST_CHECK_EQUAL(weather.getRegionCount(), 0u);

    auto player = std::make_shared<PresenceEvent>(PresenceChange::Entered,
                                                  EntityHandle(6, EntityKind::Player, 1), "Wren",
                                                  "south");
    player->setRoomId("gate");
    EventManager::Instance().dispatchEvent(player);
    recorder.pump();
    BOOST_CHECK_EQUAL(weather.getRegionCount(), 1u);

    weather.unsubscribe();
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Room effects
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(EffectTests, WeatherFixture)

BOOST_AUTO_TEST_CASE(TestOverlayByExposure)
{
    BOOST_CHECK_EQUAL(weather.getOverlay("gate", 0.0), "The air is still and clear.");

    weather.setWeather("coast", "fog", 1, 0.0);
    BOOST_CHECK_EQUAL(weather.getOverlay("road", 0.0),
                      "Sea fog hangs over the water, cold and wet.");
    BOOST_CHECK_EQUAL(weather.getOverlay("gate", 0.0),
                      "Fog muffles every sound and hides anything far off.");
    BOOST_CHECK(weather.getOverlay("forge", 0.0).empty());
}

BOOST_AUTO_TEST_CASE(TestRoomModifiers)
{
    weather.setWeather("coast", "fog", 3, 0.0);
    BOOST_CHECK_EQUAL(weather.getModifiers("gate", 0.0).farRangedAccuracy, -15);
    BOOST_CHECK(!weather.getModifiers("forge", 0.0).any());
}

BOOST_AUTO_TEST_CASE(TestModifierScaling)
{
    BOOST_CHECK_EQUAL(WeatherController::modifiersFor("fog", 0, Exposure::Outdoor).farRangedAccuracy,
                      -3);
    BOOST_CHECK_EQUAL(WeatherController::modifiersFor("squall", 1, Exposure::Coastal).disengagePenalty,
                      10);
    BOOST_CHECK_CLOSE(WeatherController::modifiersFor("salt_rain", 1, Exposure::Outdoor).extraWearChance,
                      0.5f, 0.001);
    BOOST_CHECK_EQUAL(WeatherController::modifiersFor("cold_snap", 3, Exposure::Coastal).staminaDrain,
                      2);
    BOOST_CHECK_EQUAL(WeatherController::modifiersFor("cold_snap", 3, Exposure::Sheltered).staminaDrain,
                      0);
    BOOST_CHECK(!WeatherController::modifiersFor("squall", 3, Exposure::Indoor).any());
    BOOST_CHECK(!WeatherController::modifiersFor("clear", 3, Exposure::Outdoor).any());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Transition tables
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TableTests, WeatherFixture)

BOOST_AUTO_TEST_CASE(TestWeightedRoll)
{
    const WeatherWeights row{{"clear", 50}, {"fog", 30}, {"wind", 20}};
    MockDiceRoller dice;
    dice.queueRolls({1, 50, 51, 80, 81, 100});

    BOOST_CHECK_EQUAL(WeatherController::rollNextWeather(row, dice), "clear");
    BOOST_CHECK_EQUAL(WeatherController::rollNextWeather(row, dice), "clear");
    BOOST_CHECK_EQUAL(WeatherController::rollNextWeather(row, dice), "fog");
    BOOST_CHECK_EQUAL(WeatherController::rollNextWeather(row, dice), "fog");
    BOOST_CHECK_EQUAL(WeatherController::rollNextWeather(row, dice), "wind");
    BOOST_CHECK_EQUAL(WeatherController::rollNextWeather(row, dice), "wind");

    BOOST_CHECK_EQUAL(WeatherController::rollNextWeather({{"fog", 0}}, dice), "clear");
}

BOOST_AUTO_TEST_CASE(TestCustomTable)
{
    WeatherTransitionTable table{
        {"clear", {{"fog", 0}}},
        {"fog", {{"squall", 10}}},
    };
    weather.setTransitionTable(table);

    // The clear row had no positive weight and was dropped
    RegionWeather start = weather.resolveRegion("coast", 0.0);
    RegionWeather next = weather.resolveRegion("coast", start.nextChangeAt);
    BOOST_CHECK_EQUAL(next.type, "clear");
    BOOST_CHECK_EQUAL(next.transitions, 1u);

    weather.setWeather("coast", "fog", 1, next.nextChangeAt);
    RegionWeather forced = *weather.peekRegion("coast");
    RegionWeather after = weather.resolveRegion("coast", forced.nextChangeAt);
    BOOST_CHECK_EQUAL(after.type, "squall");
    BOOST_CHECK_EQUAL(after.intensity, 2);
}

BOOST_AUTO_TEST_CASE(TestDefaultTableCoversEveryType)
{
    const auto& table = WeatherController::defaultTransitions();
    for (const char* type : {"clear", "fog", "wind", "squall", "cold_snap", "salt_rain"}) {
        BOOST_CHECK_MESSAGE(table.count(type) == 1, std::string("missing row for ") + type);
        BOOST_CHECK(!WeatherController::changeMessage(type).empty());
    }
}

BOOST_AUTO_TEST_SUITE_END()
