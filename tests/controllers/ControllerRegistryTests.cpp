/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file ControllerRegistryTests.cpp
 * @brief Unit tests for ControllerRegistry
 *
 * Tests cover:
 * - Registration and typed lookup
 * - Tick order, suspension and world-second propagation
 * - Handler tokens removed on unsubscribe
 * - Newest-first teardown
 */

#define BOOST_TEST_MODULE ControllerRegistryTests
#include <boost/test/unit_test.hpp>

#include "controllers/ControllerBase.hpp"
#include "controllers/ControllerRegistry.hpp"
#include "controllers/IUpdatable.hpp"
#include "managers/EventManager.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace {

// Shared journal of ticks and destructions across mock controllers
std::vector<std::string> g_journal;

} // namespace

/**
 * @brief Event-only controller listening for notices
 */
class NoticeListener : public ControllerBase
{
public:
    ~NoticeListener() override { g_journal.push_back("~NoticeListener"); }

    void subscribe() override
    {
        if (checkAlreadySubscribed()) {
            return;
        }
        ++m_subscribeCount;
        addHandlerToken(EventManager::Instance().registerHandlerWithToken(
            EventTypeId::Notice, [](const EventData&) {}));
        setSubscribed(true);
    }

    [[nodiscard]] std::string_view getName() const override { return "NoticeListener"; }

    int subscribeCount() const { return m_subscribeCount; }

private:
    int m_subscribeCount{0};
};

/**
 * @brief Ticked controller that records the world time it was handed
 */
class RoundKeeper : public ControllerBase, public IUpdatable
{
public:
    ~RoundKeeper() override { g_journal.push_back("~RoundKeeper"); }

    void subscribe() override { setSubscribed(true); }

    void update(double worldSeconds) override
    {
        g_journal.push_back("RoundKeeper");
        m_lastSeconds = worldSeconds;
        ++m_ticks;
    }

    [[nodiscard]] std::string_view getName() const override { return "RoundKeeper"; }

    int ticks() const { return m_ticks; }
    double lastSeconds() const { return m_lastSeconds; }

private:
    int m_ticks{0};
    double m_lastSeconds{0.0};
};

/**
 * @brief Ticked controller that borrows a RoundKeeper
 */
class LeashKeeper : public ControllerBase, public IUpdatable
{
public:
    explicit LeashKeeper(RoundKeeper& rounds) : m_rounds(rounds) {}
    ~LeashKeeper() override
    {
        // Still valid: the registry destroys newer controllers first
        g_journal.push_back("~LeashKeeper saw " + std::to_string(m_rounds.ticks()));
    }

    void subscribe() override { setSubscribed(true); }

    void update(double) override { g_journal.push_back("LeashKeeper"); }

    [[nodiscard]] std::string_view getName() const override { return "LeashKeeper"; }

private:
    RoundKeeper& m_rounds;
};

struct RegistryFixture
{
    RegistryFixture()
    {
        g_journal.clear();
        EventManager::Instance().init();
    }

    ~RegistryFixture()
    {
        registry.clear();
        EventManager::Instance().clean();
    }

    ControllerRegistry registry;
};

// ============================================================================
// Registration
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(RegistrationTests, RegistryFixture)

BOOST_AUTO_TEST_CASE(TestAddAndGet)
{
    BOOST_CHECK(registry.empty());
    auto& rounds = registry.add<RoundKeeper>();
    registry.add<NoticeListener>();

    BOOST_CHECK_EQUAL(registry.size(), 2u);
    BOOST_CHECK(registry.has<RoundKeeper>());
    BOOST_CHECK(!registry.has<LeashKeeper>());
    BOOST_CHECK_EQUAL(registry.get<RoundKeeper>(), &rounds);
    BOOST_CHECK(registry.get<LeashKeeper>() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestDuplicateAddReturnsExisting)
{
    auto& first = registry.add<RoundKeeper>();
    auto& second = registry.add<RoundKeeper>();
    BOOST_CHECK_EQUAL(&first, &second);
    BOOST_CHECK_EQUAL(registry.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestNamesInRegistrationOrder)
{
    auto& rounds = registry.add<RoundKeeper>();
    registry.add<LeashKeeper>(rounds);
    registry.add<NoticeListener>();

    std::vector<std::string> expected{"RoundKeeper", "LeashKeeper", "NoticeListener"};
    std::vector<std::string> names = registry.names();
    BOOST_CHECK_EQUAL_COLLECTIONS(names.begin(), names.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Ticks
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TickTests, RegistryFixture)

BOOST_AUTO_TEST_CASE(TestUpdateOrderAndWorldSeconds)
{
    auto& rounds = registry.add<RoundKeeper>();
    registry.add<NoticeListener>();
    registry.add<LeashKeeper>(rounds);

    registry.updateAll(28803.5);
    std::vector<std::string> expected{"RoundKeeper", "LeashKeeper"};
    BOOST_CHECK_EQUAL_COLLECTIONS(g_journal.begin(), g_journal.end(), expected.begin(),
                                  expected.end());
    BOOST_CHECK_CLOSE(rounds.lastSeconds(), 28803.5, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestSuspendedControllersSkipped)
{
    auto& rounds = registry.add<RoundKeeper>();
    registry.updateAll(1.0);
    rounds.suspend();
    registry.updateAll(2.0);
    BOOST_CHECK_EQUAL(rounds.ticks(), 1);

    registry.suspendAll();
    registry.resumeAll();
    registry.updateAll(3.0);
    BOOST_CHECK_EQUAL(rounds.ticks(), 2);
    BOOST_CHECK_CLOSE(rounds.lastSeconds(), 3.0, 0.0001);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Subscriptions and teardown
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(LifecycleTests, RegistryFixture)

BOOST_AUTO_TEST_CASE(TestSubscribeIsIdempotent)
{
    auto& listener = registry.add<NoticeListener>();
    registry.subscribeAll();
    registry.subscribeAll();

    BOOST_CHECK(listener.isSubscribed());
    BOOST_CHECK_EQUAL(listener.subscribeCount(), 1);
    BOOST_CHECK_EQUAL(EventManager::Instance().getHandlerCount(EventTypeId::Notice), 1u);

    registry.unsubscribeAll();
    BOOST_CHECK(!listener.isSubscribed());
    BOOST_CHECK_EQUAL(EventManager::Instance().getHandlerCount(EventTypeId::Notice), 0u);
}

BOOST_AUTO_TEST_CASE(TestClearDestroysNewestFirst)
{
    auto& rounds = registry.add<RoundKeeper>();
    registry.add<LeashKeeper>(rounds);
    registry.add<NoticeListener>();
    registry.subscribeAll();
    registry.updateAll(1.0);
    g_journal.clear();

    registry.clear();
    std::vector<std::string> expected{"~NoticeListener", "~LeashKeeper saw 1", "~RoundKeeper"};
    BOOST_CHECK_EQUAL_COLLECTIONS(g_journal.begin(), g_journal.end(), expected.begin(),
                                  expected.end());
    BOOST_CHECK(registry.empty());
    BOOST_CHECK_EQUAL(EventManager::Instance().getHandlerCount(EventTypeId::Notice), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
