/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file AttackTickerTests.cpp
 * @brief Tests for per-combatant basic attack timers
 *
 * Tests cover:
 * - Start, retarget and duplicate start results
 * - Due collection grouped by room and ordered by fire time
 * - Catch-up cap and backlog skipping
 * - Token invalidation on cancel and restart
 * - Delays and interval changes
 */

#define BOOST_TEST_MODULE AttackTickerTests
#include <boost/test/unit_test.hpp>

#include "controllers/combat/AttackTicker.hpp"

namespace {
const EntityHandle HERO(1, EntityKind::Player, 1);
const EntityHandle SIDEKICK(2, EntityKind::Player, 1);
const EntityHandle RAT(3, EntityKind::Creature, 1);
const EntityHandle WOLF(4, EntityKind::Creature, 1);
} // namespace

BOOST_AUTO_TEST_SUITE(StartTests)

BOOST_AUTO_TEST_CASE(TestFirstFireIsOneIntervalOut)
{
    AttackTicker ticker;
    BOOST_CHECK(ticker.start(HERO, RAT, "den", 3.0, 10.0) == TickerStart::Started);

    auto entry = ticker.get(HERO);
    BOOST_REQUIRE(entry.has_value());
    BOOST_CHECK_EQUAL(entry->target, RAT);
    BOOST_CHECK_CLOSE(entry->nextFireAt, 13.0, 0.001);
    BOOST_CHECK(ticker.isTicking(HERO));
    BOOST_CHECK_EQUAL(ticker.size(), 1u);

    BOOST_CHECK(ticker.collectDue(12.9).empty());
}

BOOST_AUTO_TEST_CASE(TestSameTargetIsANoOp)
{
    AttackTicker ticker;
    ticker.start(HERO, RAT, "den", 3.0, 0.0);
    BOOST_CHECK(ticker.start(HERO, RAT, "den", 5.0, 2.0) == TickerStart::AlreadyTargeting);
    BOOST_CHECK_CLOSE(ticker.get(HERO)->nextFireAt, 3.0, 0.001);
    BOOST_CHECK_CLOSE(ticker.get(HERO)->interval, 3.0, 0.001);
}

BOOST_AUTO_TEST_CASE(TestRetargetKeepsPhaseAndToken)
{
    AttackTicker ticker;
    ticker.start(HERO, RAT, "den", 3.0, 0.0);
    uint64_t token = ticker.get(HERO)->token;

    BOOST_CHECK(ticker.start(HERO, WOLF, "den", 3.0, 2.0) == TickerStart::Retargeted);
    auto entry = ticker.get(HERO);
    BOOST_CHECK_EQUAL(entry->target, WOLF);
    BOOST_CHECK_CLOSE(entry->nextFireAt, 3.0, 0.001);
    BOOST_CHECK_EQUAL(entry->token, token);
}

BOOST_AUTO_TEST_CASE(TestNewRoomStartsFresh)
{
    AttackTicker ticker;
    ticker.start(HERO, RAT, "den", 3.0, 0.0);
    uint64_t token = ticker.get(HERO)->token;

    BOOST_CHECK(ticker.start(HERO, RAT, "gate", 3.0, 2.0) == TickerStart::Started);
    auto entry = ticker.get(HERO);
    BOOST_CHECK_EQUAL(entry->roomId, "gate");
    BOOST_CHECK_CLOSE(entry->nextFireAt, 5.0, 0.001);
    BOOST_CHECK_NE(entry->token, token);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CollectTests)

BOOST_AUTO_TEST_CASE(TestFiresGroupedByRoomInTimeOrder)
{
    AttackTicker ticker;
    ticker.start(HERO, RAT, "den", 2.0, 0.0);
    ticker.start(SIDEKICK, RAT, "den", 1.5, 0.0);
    ticker.start(WOLF, HERO, "gate", 1.0, 0.0);

    auto due = ticker.collectDue(2.0);
    BOOST_REQUIRE_EQUAL(due.size(), 2u);

    const auto& den = due["den"];
    BOOST_REQUIRE_EQUAL(den.size(), 2u);
    BOOST_CHECK_EQUAL(den[0].combatant, SIDEKICK);
    BOOST_CHECK_CLOSE(den[0].fireAt, 1.5, 0.001);
    BOOST_CHECK_EQUAL(den[1].combatant, HERO);

    const auto& gate = due["gate"];
    BOOST_REQUIRE_EQUAL(gate.size(), 2u);
    BOOST_CHECK_CLOSE(gate[0].fireAt, 1.0, 0.001);
    BOOST_CHECK_CLOSE(gate[1].fireAt, 2.0, 0.001);

    BOOST_CHECK_CLOSE(ticker.get(WOLF)->nextFireAt, 3.0, 0.001);
    BOOST_CHECK_EQUAL(ticker.get(WOLF)->fires, 2u);
}

BOOST_AUTO_TEST_CASE(TestTiesBreakByCombatant)
{
    AttackTicker ticker;
    ticker.start(SIDEKICK, RAT, "den", 2.0, 0.0);
    ticker.start(HERO, RAT, "den", 2.0, 0.0);

    auto due = ticker.collectDue(2.0);
    BOOST_REQUIRE_EQUAL(due["den"].size(), 2u);
    BOOST_CHECK_EQUAL(due["den"][0].combatant, HERO);
    BOOST_CHECK_EQUAL(due["den"][1].combatant, SIDEKICK);
}

BOOST_AUTO_TEST_CASE(TestCatchUpIsCappedAndBacklogDropped)
{
    AttackTicker ticker;
    ticker.start(HERO, RAT, "den", 1.0, 0.0);

    auto due = ticker.collectDue(10.0);
    BOOST_CHECK_EQUAL(due["den"].size(), static_cast<size_t>(AttackTicker::MAX_CATCH_UP));
    BOOST_CHECK_CLOSE(ticker.get(HERO)->nextFireAt, 11.0, 0.001);

    BOOST_CHECK(ticker.collectDue(10.5).empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TokenTests)

BOOST_AUTO_TEST_CASE(TestConfirmLiveFire)
{
    AttackTicker ticker;
    ticker.start(HERO, RAT, "den", 1.0, 0.0);
    auto due = ticker.collectDue(1.0);
    BOOST_REQUIRE_EQUAL(due["den"].size(), 1u);

    auto target = ticker.confirm(due["den"][0]);
    BOOST_REQUIRE(target.has_value());
    BOOST_CHECK_EQUAL(*target, RAT);
}

BOOST_AUTO_TEST_CASE(TestConfirmSeesRetarget)
{
    AttackTicker ticker;
    ticker.start(HERO, RAT, "den", 1.0, 0.0);
    auto due = ticker.collectDue(1.0);
    ticker.start(HERO, WOLF, "den", 1.0, 1.0);

    auto target = ticker.confirm(due["den"][0]);
    BOOST_REQUIRE(target.has_value());
    BOOST_CHECK_EQUAL(*target, WOLF);
}

BOOST_AUTO_TEST_CASE(TestCancelledFiresAreStale)
{
    AttackTicker ticker;
    ticker.start(HERO, RAT, "den", 1.0, 0.0);
    auto due = ticker.collectDue(1.0);

    BOOST_CHECK(ticker.cancel(HERO));
    BOOST_CHECK(!ticker.cancel(HERO));
    BOOST_CHECK(!ticker.confirm(due["den"][0]).has_value());

    // Restarting issues a fresh token, so the old fire stays stale
    ticker.start(HERO, RAT, "den", 1.0, 1.0);
    BOOST_CHECK(!ticker.confirm(due["den"][0]).has_value());
}

BOOST_AUTO_TEST_CASE(TestCancelTargeting)
{
    AttackTicker ticker;
    ticker.start(SIDEKICK, RAT, "den", 1.0, 0.0);
    ticker.start(HERO, RAT, "den", 1.0, 0.0);
    ticker.start(WOLF, HERO, "den", 1.0, 0.0);

    auto cancelled = ticker.cancelTargeting(RAT);
    BOOST_REQUIRE_EQUAL(cancelled.size(), 2u);
    BOOST_CHECK_EQUAL(cancelled[0], HERO);
    BOOST_CHECK_EQUAL(cancelled[1], SIDEKICK);
    BOOST_CHECK(ticker.isTicking(WOLF));
    BOOST_CHECK_EQUAL(ticker.size(), 1u);

    ticker.clear();
    BOOST_CHECK_EQUAL(ticker.size(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PacingTests)

BOOST_AUTO_TEST_CASE(TestAddDelay)
{
    AttackTicker ticker;
    ticker.start(HERO, RAT, "den", 3.0, 0.0);

    BOOST_CHECK(ticker.addDelay(HERO, 1.5));
    BOOST_CHECK_CLOSE(ticker.get(HERO)->nextFireAt, 4.5, 0.001);
    BOOST_CHECK(!ticker.addDelay(HERO, 0.0));
    BOOST_CHECK(!ticker.addDelay(HERO, -1.0));
    BOOST_CHECK(!ticker.addDelay(WOLF, 1.0));

    BOOST_CHECK(ticker.collectDue(3.0).empty());
    BOOST_CHECK_EQUAL(ticker.collectDue(4.5)["den"].size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestSetIntervalAppliesFromNextReschedule)
{
    AttackTicker ticker;
    ticker.start(HERO, RAT, "den", 3.0, 0.0);

    BOOST_CHECK(ticker.setInterval(HERO, 1.0));
    BOOST_CHECK(!ticker.setInterval(HERO, 0.0));
    BOOST_CHECK(!ticker.setInterval(WOLF, 1.0));
    BOOST_CHECK_CLOSE(ticker.get(HERO)->nextFireAt, 3.0, 0.001);

    ticker.collectDue(3.0);
    BOOST_CHECK_CLOSE(ticker.get(HERO)->nextFireAt, 4.0, 0.001);
}

BOOST_AUTO_TEST_SUITE_END()
