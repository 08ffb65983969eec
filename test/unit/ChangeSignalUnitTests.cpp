/**
 * @file ChangeSignalUnitTests.cpp
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 * @brief Contains unit tests for the ChangeSignal class.
 */

#include <catch2/catch.hpp>

#include <ChangeSignal.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

TEST_CASE("ChangeSignal invokes subscribers exactly once", "[signal]")
{
    auto signal = std::make_shared<ChangeSignal>();
    int callCount = 0;
    signal->Subscribe([&callCount]() { ++callCount; });

    REQUIRE(signal->HasFired() == false);
    REQUIRE(callCount == 0);

    REQUIRE(signal->Fire() == true);
    REQUIRE(signal->HasFired() == true);
    REQUIRE(callCount == 1);

    // Firing again is fine, but does nothing
    REQUIRE(signal->Fire() == false);
    REQUIRE(callCount == 1);
}

TEST_CASE("ChangeSignal invokes subscribers in registration order", "[signal]")
{
    auto signal = std::make_shared<ChangeSignal>();
    std::vector<int> order;
    for (int i = 0; i < 5; ++i)
    {
        signal->Subscribe([&order, i]() { order.push_back(i); });
    }
    signal->Fire();
    REQUIRE(order == std::vector<int>{ 0, 1, 2, 3, 4 });
}

TEST_CASE("Subscribing to a fired ChangeSignal runs the callback immediately", "[signal]")
{
    auto signal = std::make_shared<ChangeSignal>();
    signal->Fire();

    bool called = false;
    ChangeSignal::Registration registration = signal->Subscribe([&called]() { called = true; });
    REQUIRE(called == true);
    REQUIRE(registration.IsActive() == false);

    // SubscribeIfArmed never runs the callback itself
    called = false;
    auto maybeRegistration = signal->SubscribeIfArmed([&called]() { called = true; });
    REQUIRE(maybeRegistration.has_value() == false);
    REQUIRE(called == false);
}

TEST_CASE("Unsubscribed callbacks are not invoked", "[signal]")
{
    auto signal = std::make_shared<ChangeSignal>();
    bool firstCalled = false;
    bool secondCalled = false;
    ChangeSignal::Registration first = signal->Subscribe([&firstCalled]() { firstCalled = true; });
    signal->Subscribe([&secondCalled]() { secondCalled = true; });
    REQUIRE(first.IsActive() == true);
    REQUIRE(signal->GetSubscriberCount() == 2);

    first.Unsubscribe();
    REQUIRE(first.IsActive() == false);
    REQUIRE(signal->GetSubscriberCount() == 1);

    // Unsubscribing twice is harmless
    first.Unsubscribe();

    signal->Fire();
    REQUIRE(firstCalled == false);
    REQUIRE(secondCalled == true);
    REQUIRE(signal->GetSubscriberCount() == 0);
}

TEST_CASE("Registrations outliving their ChangeSignal are inert", "[signal]")
{
    ChangeSignal::Registration registration;
    {
        auto signal = std::make_shared<ChangeSignal>();
        registration = signal->Subscribe([]() { });
        REQUIRE(registration.IsActive() == true);
    }
    REQUIRE(registration.IsActive() == false);
    registration.Unsubscribe();
}

TEST_CASE("ChangeSignal callbacks may subscribe to and fire signals", "[signal]")
{
    auto signal = std::make_shared<ChangeSignal>();
    auto nextSignal = std::make_shared<ChangeSignal>();
    int lateCalls = 0;
    bool nextFired = false;
    nextSignal->Subscribe([&nextFired]() { nextFired = true; });
    signal->Subscribe(
        [&]()
        {
            // Our own signal has already fired, so this runs right away
            signal->Subscribe([&lateCalls]() { ++lateCalls; });
            // Re-entrant fire of the same signal is a no-op
            REQUIRE(signal->Fire() == false);
            nextSignal->Fire();
        });

    signal->Fire();
    REQUIRE(lateCalls == 1);
    REQUIRE(nextFired == true);
}

TEST_CASE("A throwing ChangeSignal callback doesn't starve other callbacks", "[signal]")
{
    auto signal = std::make_shared<ChangeSignal>();
    bool before = false;
    bool after = false;
    signal->Subscribe([&before]() { before = true; });
    signal->Subscribe([]() { throw std::runtime_error("subscriber failure"); });
    signal->Subscribe([]() { throw std::logic_error("second subscriber failure"); });
    signal->Subscribe([&after]() { after = true; });

    REQUIRE_THROWS_AS(signal->Fire(), std::runtime_error);
    REQUIRE(before == true);
    REQUIRE(after == true);
    REQUIRE(signal->HasFired() == true);
}

TEST_CASE("Never signal ignores Fire", "[signal]")
{
    std::shared_ptr<ChangeSignal> never = ChangeSignal::Never();
    REQUIRE(never == ChangeSignal::Never());

    bool called = false;
    ChangeSignal::Registration registration = never->Subscribe([&called]() { called = true; });
    REQUIRE(never->Fire() == false);
    REQUIRE(never->HasFired() == false);
    REQUIRE(called == false);
    REQUIRE(never->GetSubscriberCount() == 0);
    REQUIRE(never->WaitFor(std::chrono::milliseconds(1)) == false);
}

TEST_CASE("ChangeSignal can be waited on from another thread", "[signal]")
{
    auto signal = std::make_shared<ChangeSignal>();
    REQUIRE(signal->WaitFor(std::chrono::milliseconds(1)) == false);

    std::thread waiter(
        [signal]()
        {
            signal->Wait();
        });
    signal->Fire();
    waiter.join();
    REQUIRE(signal->WaitFor(std::chrono::milliseconds(0)) == true);
}

TEST_CASE("Concurrent Fire calls fire exactly once", "[signal]")
{
    const int numIterations = 200;
    const int numThreads = 8;
    for (int iteration = 0; iteration < numIterations; ++iteration)
    {
        auto signal = std::make_shared<ChangeSignal>();
        std::atomic<int> callCount = 0;
        std::atomic<int> firedCount = 0;
        signal->Subscribe([&callCount]() { ++callCount; });

        std::vector<std::thread> threads;
        for (int i = 0; i < numThreads; ++i)
        {
            threads.emplace_back(
                [&signal, &firedCount]()
                {
                    if (signal->Fire())
                    {
                        ++firedCount;
                    }
                });
        }
        for (auto& thread : threads)
        {
            thread.join();
        }
        REQUIRE(callCount.load() == 1);
        REQUIRE(firedCount.load() == 1);
    }
}
