/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file ThreadSystemTests.cpp
 * @brief Tests for the prioritized worker pool
 *
 * Tests cover:
 * - Lifecycle (init, re-init, clean, Exists)
 * - Task results and exception propagation through futures
 * - Priority ordering on a single worker
 * - Tasks submitted after shutdown
 */

#define BOOST_TEST_MODULE ThreadSystemTests
#include <boost/test/unit_test.hpp>

#include "core/ThreadSystem.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace AnchorMud;

namespace {

bool waitUntil(const std::function<bool()>& condition,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return condition();
}

} // namespace

struct ThreadSystemFixture
{
    ThreadSystemFixture(unsigned int threads = 2)
    {
        BOOST_REQUIRE(ThreadSystem::Instance().init(threads));
    }
    ~ThreadSystemFixture() { ThreadSystem::Instance().clean(); }
};

struct SingleWorkerFixture : ThreadSystemFixture
{
    SingleWorkerFixture() : ThreadSystemFixture(1) {}
};

// ============================================================================
// Lifecycle
// ============================================================================

BOOST_AUTO_TEST_SUITE(LifecycleTests)

BOOST_AUTO_TEST_CASE(TestInitAndClean)
{
    BOOST_CHECK(!ThreadSystem::Exists());
    BOOST_REQUIRE(ThreadSystem::Instance().init(3));
    BOOST_CHECK(ThreadSystem::Exists());
    BOOST_CHECK_EQUAL(ThreadSystem::Instance().getThreadCount(), 3u);

    // Second init keeps the running pool
    BOOST_CHECK(ThreadSystem::Instance().init(5));
    BOOST_CHECK_EQUAL(ThreadSystem::Instance().getThreadCount(), 3u);

    ThreadSystem::Instance().clean();
    BOOST_CHECK(!ThreadSystem::Exists());
    BOOST_CHECK_EQUAL(ThreadSystem::Instance().getQueueSize(), 0u);
    BOOST_CHECK(!ThreadSystem::Instance().isBusy());
}

BOOST_AUTO_TEST_CASE(TestTasksAfterShutdown)
{
    std::atomic<int> ran{0};
    ThreadSystem::Instance().enqueueTask([&ran]() { ran.fetch_add(1); });
    BOOST_CHECK_EQUAL(ran.load(), 0);

    BOOST_CHECK_THROW(ThreadSystem::Instance().enqueueTaskWithResult([]() { return 1; }),
                      std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Execution
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ExecutionTests, ThreadSystemFixture)

BOOST_AUTO_TEST_CASE(TestAllTasksRun)
{
    std::atomic<int> counter{0};
    for (int i = 0; i < 200; ++i) {
        ThreadSystem::Instance().enqueueTask([&counter]() { counter.fetch_add(1); },
                                             TaskPriority::Normal, "count");
    }
    BOOST_CHECK(waitUntil([&counter]() { return counter.load() == 200; }));
    BOOST_CHECK(waitUntil([]() { return !ThreadSystem::Instance().isBusy(); }));
    BOOST_CHECK_EQUAL(ThreadSystem::Instance().getTotalTasksProcessed(), 200u);
}

BOOST_AUTO_TEST_CASE(TestResultFutures)
{
    auto sum = ThreadSystem::Instance().enqueueTaskWithResult(
        [](int a, int b) { return a + b; }, TaskPriority::High, "sum", 17, 25);
    BOOST_CHECK_EQUAL(sum.get(), 42);

    auto failing = ThreadSystem::Instance().enqueueTaskWithResult(
        []() -> int { throw std::runtime_error("room batch failed"); });
    BOOST_CHECK_THROW(failing.get(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(TestThrowingTaskKeepsWorkerAlive)
{
    std::atomic<bool> after{false};
    ThreadSystem::Instance().enqueueTask([]() { throw std::runtime_error("bad fire"); },
                                         TaskPriority::Normal, "throws");
    ThreadSystem::Instance().enqueueTask([&after]() { after.store(true); });
    BOOST_CHECK(waitUntil([&after]() { return after.load(); }));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Priorities
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(PriorityTests, SingleWorkerFixture)

BOOST_AUTO_TEST_CASE(TestHigherPriorityServedFirst)
{
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<bool> blocking{false};

    // Occupy the only worker so later submissions queue up
    ThreadSystem::Instance().enqueueTask([opened, &blocking]() {
        blocking.store(true);
        opened.wait();
    });
    BOOST_REQUIRE(waitUntil([&blocking]() { return blocking.load(); }));

    std::mutex orderMutex;
    std::vector<int> order;
    auto record = [&orderMutex, &order](int tag) {
        return [&orderMutex, &order, tag]() {
            std::lock_guard<std::mutex> lock(orderMutex);
            order.push_back(tag);
        };
    };

    ThreadSystem::Instance().enqueueTask(record(4), TaskPriority::Idle);
    ThreadSystem::Instance().enqueueTask(record(3), TaskPriority::Low);
    ThreadSystem::Instance().enqueueTask(record(2), TaskPriority::Normal);
    ThreadSystem::Instance().enqueueTask(record(21), TaskPriority::Normal);
    ThreadSystem::Instance().enqueueTask(record(0), TaskPriority::Critical);
    BOOST_CHECK_EQUAL(ThreadSystem::Instance().getQueueSize(), 5u);

    gate.set_value();
    BOOST_REQUIRE(waitUntil([&orderMutex, &order]() {
        std::lock_guard<std::mutex> lock(orderMutex);
        return order.size() == 5;
    }));

    std::vector<int> expected{0, 2, 21, 3, 4};
    BOOST_CHECK_EQUAL_COLLECTIONS(order.begin(), order.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_SUITE_END()
