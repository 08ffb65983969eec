/**
 * @file SourceWatcherUnitTests.cpp
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 * @brief Contains unit tests for the SourceWatcher class.
 */

#include <catch2/catch.hpp>

#include "../TestLogging.h"
#include "../mocks/MockEndpointProvider.h"

#include <ChangeSignal.h>
#include <SourceWatcher.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    std::shared_ptr<SourceWatcher> watchProvider(
        const std::shared_ptr<MockEndpointProvider>& provider,
        change_cb_t onChanged)
    {
        return std::make_shared<SourceWatcher>(
            [provider]()
            {
                return provider->GetChangeSignal();
            },
            onChanged);
    }
}

TEST_CASE("SourceWatcher follows a source across signal rotations", "[watcher]")
{
    auto provider = std::make_shared<MockEndpointProvider>(std::vector<std::string>{ "/a" });
    std::vector<std::vector<std::string>> observed;
    auto watcher = watchProvider(provider,
        [&observed, provider]()
        {
            observed.push_back(provider->GetEndpoints());
        });
    watcher->Start();
    REQUIRE(watcher->IsWatching() == true);
    REQUIRE(observed.empty());

    provider->MockFireChange({ "/b" });
    provider->MockFireChange({ "/c" });
    provider->MockFireChange({ "/d" });

    REQUIRE(observed.size() == 3);
    REQUIRE(observed[0] == std::vector<std::string>{ "/b" });
    REQUIRE(observed[2] == std::vector<std::string>{ "/d" });

    // Always exactly one registration on the live signal
    REQUIRE(provider->GetMockSubscriberCount() == 1);
}

TEST_CASE("SourceWatcher stops observing after Stop", "[watcher]")
{
    auto provider = std::make_shared<MockEndpointProvider>();
    int changeCount = 0;
    auto watcher = watchProvider(provider, [&changeCount]() { ++changeCount; });
    watcher->Start();

    provider->MockFireChange({ "/a" });
    REQUIRE(changeCount == 1);

    watcher->Stop();
    REQUIRE(watcher->IsWatching() == false);
    REQUIRE(provider->GetMockSubscriberCount() == 0);
    provider->MockFireChange({ "/b" });
    REQUIRE(changeCount == 1);

    // Stopping twice is fine
    watcher->Stop();
}

TEST_CASE("SourceWatcher started from a fired signal reports the change right away", "[watcher]")
{
    auto provider = std::make_shared<MockEndpointProvider>();
    std::shared_ptr<ChangeSignal> staleSignal = provider->GetChangeSignal();
    provider->MockFireChange({ "/a" });

    int changeCount = 0;
    auto watcher = watchProvider(provider, [&changeCount]() { ++changeCount; });
    watcher->Start(staleSignal);
    REQUIRE(changeCount == 1);
    REQUIRE(watcher->IsWatching() == true);

    provider->MockFireChange({ "/b" });
    REQUIRE(changeCount == 2);
}

TEST_CASE("SourceWatcher can only be started once", "[watcher]")
{
    auto provider = std::make_shared<MockEndpointProvider>();
    auto watcher = watchProvider(provider, []() { });
    watcher->Start();
    REQUIRE_THROWS_AS(watcher->Start(), std::runtime_error);
}

TEST_CASE("SourceWatcher keeps watching when its callback throws", "[watcher]")
{
    auto provider = std::make_shared<MockEndpointProvider>();
    int changeCount = 0;
    auto watcher = watchProvider(provider,
        [&changeCount]()
        {
            ++changeCount;
            if (changeCount == 1)
            {
                throw std::runtime_error("callback failure");
            }
        });
    watcher->Start();

    // The error surfaces to whoever fired the change
    REQUIRE_THROWS_AS(provider->MockFireChange({ "/a" }), std::runtime_error);
    REQUIRE(changeCount == 1);

    provider->MockFireChange({ "/b" });
    REQUIRE(changeCount == 2);
}

TEST_CASE("SourceWatcher gives up on a source that never rotates its signal", "[watcher]")
{
    ScopedLogCapture logCapture;
    auto provider = std::make_shared<MockEndpointProvider>();
    int changeCount = 0;
    auto watcher = watchProvider(provider, [&changeCount]() { ++changeCount; });
    watcher->Start();

    // Without protection this would spin forever on the same fired signal
    provider->MockFireChangeWithoutRotating({ "/a" });
    REQUIRE(changeCount == 1);
    REQUIRE(watcher->IsWatching() == false);
    REQUIRE(logCapture.GetRecordedProblems().size() == 1);
}

TEST_CASE("SourceWatcher does not keep its owner alive", "[watcher]")
{
    auto provider = std::make_shared<MockEndpointProvider>();
    int changeCount = 0;
    auto watcher = watchProvider(provider, [&changeCount]() { ++changeCount; });
    watcher->Start();
    std::weak_ptr<SourceWatcher> weakWatcher(watcher);

    // Dropping the last reference to the watcher quietly ends the watch
    watcher = nullptr;
    REQUIRE(weakWatcher.expired());
    provider->MockFireChange({ "/a" });
    REQUIRE(changeCount == 0);
}
