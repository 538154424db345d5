/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file EventTypesTests.cpp
 * @brief Tests for the text and metadata of each runtime event
 *
 * Tests cover:
 * - Combat strike, death and breakage wording
 * - Presence, loot, state-change and round digest messages
 * - Room broadcast versus single recipient addressing
 */

#define BOOST_TEST_MODULE EventTypesTests
#include <boost/test/unit_test.hpp>

#include "events/CombatEvent.hpp"
#include "events/CombatStateEvent.hpp"
#include "events/LootEvent.hpp"
#include "events/NoticeEvent.hpp"
#include "events/PresenceEvent.hpp"
#include "events/RoundSummaryEvent.hpp"
#include "events/WeatherEvent.hpp"

namespace {

const EntityHandle WREN(1, EntityKind::Player, 1);
const EntityHandle CRAB(2, EntityKind::Creature, 1);

CombatEvent strike(CombatEventType type, int damage, const std::string& verb)
{
    CombatEvent event(type, WREN, CRAB, damage);
    event.setNames("Wren", "a marsh crab");
    event.setVerb(verb);
    return event;
}

} // namespace

BOOST_AUTO_TEST_SUITE(CombatEventTests)

BOOST_AUTO_TEST_CASE(TestStrikeWording)
{
    BOOST_CHECK_EQUAL(strike(CombatEventType::Hit, 4, "slash").getMessage(),
                      "Wren slashes a marsh crab for 4 damage.");
    BOOST_CHECK_EQUAL(strike(CombatEventType::Hit, 1, "punch").getMessage(),
                      "Wren punches a marsh crab for 1 damage.");
    BOOST_CHECK_EQUAL(strike(CombatEventType::Hit, 2, "bite").getMessage(),
                      "Wren bites a marsh crab for 2 damage.");
    BOOST_CHECK_EQUAL(strike(CombatEventType::CriticalHit, 8, "slash").getMessage(),
                      "Wren lands a critical slash on a marsh crab for 8 damage!");
    BOOST_CHECK_EQUAL(strike(CombatEventType::GlancingHit, 1, "slash").getMessage(),
                      "Wren's slash glances off a marsh crab for 1 damage.");
    BOOST_CHECK_EQUAL(strike(CombatEventType::Miss, 0, "slash").getMessage(),
                      "Wren misses a marsh crab.");
    BOOST_CHECK_EQUAL(strike(CombatEventType::Killed, 0, "slash").getMessage(),
                      "a marsh crab is slain by Wren!");
}

BOOST_AUTO_TEST_CASE(TestDetailWording)
{
    CombatEvent armor = strike(CombatEventType::ArmorBroken, 0, "hit");
    armor.setDetail("crab shell");
    BOOST_CHECK_EQUAL(armor.getMessage(), "a marsh crab's crab shell breaks apart.");

    CombatEvent weapon = strike(CombatEventType::WeaponBroken, 0, "hit");
    weapon.setDetail("rusty cutlass");
    BOOST_CHECK_EQUAL(weapon.getMessage(), "Wren's rusty cutlass shatters!");

    CombatEvent maneuver = strike(CombatEventType::ManeuverUsed, 0, "hit");
    maneuver.setDetail("pin");
    BOOST_CHECK_EQUAL(maneuver.getMessage(), "Wren uses pin on a marsh crab.");
}

BOOST_AUTO_TEST_CASE(TestMetadataAndReset)
{
    CombatEvent event = strike(CombatEventType::CriticalHit, 8, "slash");
    event.setRawDamage(10);
    event.setRemainingHealth(0);
    BOOST_CHECK_EQUAL(event.getName(), "CombatEvent_CriticalHit");
    BOOST_CHECK(event.getTypeId() == EventTypeId::Combat);
    BOOST_CHECK_EQUAL(event.getRawDamage(), 10);
    BOOST_CHECK_EQUAL(event.getAttacker(), WREN);

    event.reset();
    BOOST_CHECK_EQUAL(event.getDamage(), 0);
    BOOST_CHECK(!event.getAttacker().isValid());
    BOOST_CHECK(!event.getTarget().isValid());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PresenceEventTests)

BOOST_AUTO_TEST_CASE(TestPresenceWording)
{
    BOOST_CHECK_EQUAL(PresenceEvent(PresenceChange::Entered, WREN, "Wren", "south").getMessage(),
                      "Wren arrives from the south.");
    BOOST_CHECK_EQUAL(PresenceEvent(PresenceChange::Entered, WREN, "Wren").getMessage(),
                      "Wren arrives.");
    BOOST_CHECK_EQUAL(PresenceEvent(PresenceChange::Left, WREN, "Wren", "north").getMessage(),
                      "Wren leaves heading north.");
    BOOST_CHECK_EQUAL(PresenceEvent(PresenceChange::Pursued, CRAB, "a marsh crab").getMessage(),
                      "a marsh crab charges in, giving chase!");
    BOOST_CHECK_EQUAL(PresenceEvent(PresenceChange::Returned, CRAB, "a marsh crab").getMessage(),
                      "a marsh crab gives up the chase and returns.");
    BOOST_CHECK_EQUAL(PresenceEvent(PresenceChange::Despawned, CRAB, "a marsh crab").getMessage(),
                      "a marsh crab is gone.");
    BOOST_CHECK_EQUAL(PresenceEvent(PresenceChange::Scheduled, CRAB, "Brannock",
                                    "opens the smithy.").getMessage(),
                      "Brannock opens the smithy.");
    BOOST_CHECK_EQUAL(PresenceEvent(PresenceChange::Scheduled, CRAB, "Brannock").getMessage(),
                      "Brannock heads off.");
}

BOOST_AUTO_TEST_CASE(TestAudience)
{
    PresenceEvent event(PresenceChange::Spawned, CRAB, "a marsh crab");
    event.setRoomId("reed_flats");
    BOOST_CHECK(event.isRoomBroadcast());
    BOOST_CHECK_EQUAL(event.getRoomId(), "reed_flats");

    NoticeEvent notice(WREN, "You have no one to fight.", ActionStatus::InvalidTarget);
    BOOST_CHECK(!notice.isRoomBroadcast());
    BOOST_CHECK_EQUAL(notice.getRecipient(), WREN);
    BOOST_CHECK_EQUAL(notice.getStatus(), ActionStatus::InvalidTarget);
    BOOST_CHECK_EQUAL(notice.getMessage(), "You have no one to fight.");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(OutcomeEventTests)

BOOST_AUTO_TEST_CASE(TestLootWording)
{
    LootEvent none(CRAB, "a marsh crab", "crab_parts");
    BOOST_CHECK_EQUAL(none.getMessage(), "a marsh crab leaves nothing of value.");

    LootEvent one(CRAB, "a marsh crab", "crab_parts");
    one.addItem(EntityHandle(10, EntityKind::Item, 1), "a crab shell");
    BOOST_CHECK_EQUAL(one.getMessage(), "a marsh crab drops a crab shell.");

    LootEvent three(CRAB, "a wrecker", "wreck_spoils");
    three.addItem(EntityHandle(10, EntityKind::Item, 1), "a gaff hook");
    three.addItem(EntityHandle(11, EntityKind::Item, 1), "a crab shell");
    three.addItem(EntityHandle(12, EntityKind::Item, 1), "a tarnished silver coin");
    BOOST_CHECK_EQUAL(three.getMessage(),
                      "a wrecker drops a gaff hook, a crab shell and a tarnished silver coin.");
    BOOST_CHECK_EQUAL(three.getItems().size(), 3u);
}

BOOST_AUTO_TEST_CASE(TestCombatStateWording)
{
    CombatStateEvent engaged(WREN, "Wren", CombatState::Observing, CombatState::Engaged);
    BOOST_CHECK_EQUAL(engaged.getMessage(), "Wren is engaged in combat.");

    CombatStateEvent fled(WREN, "Wren", CombatState::Disengaging, CombatState::Observing,
                          "fled north");
    BOOST_CHECK_EQUAL(fled.getMessage(), "Wren is no longer fighting. (fled north)");
    BOOST_CHECK(fled.getFrom() == CombatState::Disengaging);
}

BOOST_AUTO_TEST_CASE(TestRoundSummaryWording)
{
    RoundSummaryEvent single(3, 1, {"Wren: 14/20 hp"});
    BOOST_CHECK_EQUAL(single.getMessage(), "[Round 3] 1 hostile remains.\n  Wren: 14/20 hp");

    RoundSummaryEvent many(4, 2, {});
    BOOST_CHECK_EQUAL(many.getMessage(), "[Round 4] 2 hostiles remain.");
}

BOOST_AUTO_TEST_CASE(TestWeatherEvent)
{
    WeatherEvent event("saltmarsh_coast", "clear", "fog", 2);
    event.setMessage("A grey fog rolls in off the marsh.");
    BOOST_CHECK_EQUAL(event.getName(), "WeatherEvent_saltmarsh_coast");
    BOOST_CHECK_EQUAL(event.getPreviousWeather(), "clear");
    BOOST_CHECK_EQUAL(event.getWeather(), "fog");
    BOOST_CHECK_EQUAL(event.getIntensity(), 2);
    BOOST_CHECK_EQUAL(event.getMessage(), "A grey fog rolls in off the marsh.");

    event.reset();
    BOOST_CHECK(event.getWeather().empty());
    BOOST_CHECK(event.getMessage().empty());
}

BOOST_AUTO_TEST_SUITE_END()
