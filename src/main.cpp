/**
 * @file main.cpp
 * @author Hayden McAfee (hayden@outlook.com)
 * @date 2020-10-18
 * @copyright Copyright (c) 2020 Hayden McAfee
 *
 */

#include "ChangeSignal.h"
#include "CompositeEndpointProvider.h"
#include "Configuration.h"
#include "DefaultEndpointProvider.h"
#include "Endpoint.h"
#include "EndpointProviderCollection.h"
#include "MutableEndpointProvider.h"
#include "SourceWatcher.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <thread>
#include <vector>

/**
 * @brief Generates the endpoints a demo provider exposes at a given generation
 */
std::vector<Endpoint> generateEndpoints(uint32_t providerIndex, uint32_t generation)
{
    std::vector<Endpoint> returnVal;
    for (uint32_t i = 0; i < 2; ++i)
    {
        returnVal.push_back(Endpoint
            {
                .DisplayName = fmt::format("Provider {} item {} (v{})", providerIndex, i, generation),
                .RoutePattern = fmt::format("/provider{}/v{}/items/{{id}}", providerIndex, generation),
                .RouteName = fmt::format("provider{}-item{}", providerIndex, i),
                .Order = static_cast<int>(i),
                .HttpMethods = { "GET" },
                .Defaults = { { "id", std::to_string(i) } },
            });
    }
    return returnVal;
}

/**
 * @brief Entrypoint for the program binary.
 *
 * @return int exit status
 */
int main()
{
    std::unique_ptr<Configuration> configuration = std::make_unique<Configuration>();
    configuration->Load();
    spdlog::set_level(configuration->GetLogLevel());

    // Set up our providers - one that never changes, and a few that change constantly
    auto collection = std::make_shared<EndpointProviderCollection<Endpoint>>();
    collection->Add(std::make_shared<DefaultEndpointProvider<Endpoint>>(
        std::vector<Endpoint>
        {
            Endpoint { .DisplayName = "Health check", .RoutePattern = "/health" },
            Endpoint { .DisplayName = "Fallback" },
        }));
    std::vector<std::shared_ptr<MutableEndpointProvider<Endpoint>>> mutableProviders;
    for (uint32_t i = 0; i < configuration->GetDemoProviderCount(); ++i)
    {
        auto provider = std::make_shared<MutableEndpointProvider<Endpoint>>(generateEndpoints(i, 0));
        mutableProviders.push_back(provider);
        collection->Add(provider);
    }

    CompositeEndpointProvider<Endpoint> composite(collection);
    composite.SetOnRecomputeError(
        [](std::exception_ptr)
        {
            spdlog::error("Composite endpoints went stale after a failed recompute");
        });

    // Follow the composite the way a router would - re-read on every change
    std::atomic<uint32_t> notificationCount = 0;
    auto consumer = std::make_shared<SourceWatcher>(
        [&composite]()
        {
            return composite.GetChangeSignal();
        },
        [&composite, &notificationCount]()
        {
            ++notificationCount;
            spdlog::debug("Endpoints changed, now {} endpoints", composite.GetSnapshot()->size());
        });
    consumer->Start();
    spdlog::info("Initial endpoints:\n{}", composite.GetDebugString());

    // Off we go - change every provider from its own thread
    std::vector<std::thread> changeThreads;
    for (uint32_t i = 0; i < mutableProviders.size(); ++i)
    {
        changeThreads.emplace_back(
            [i, &mutableProviders, &configuration]()
            {
                for (uint32_t generation = 1;
                    generation <= configuration->GetDemoChangeCount();
                    ++generation)
                {
                    mutableProviders[i]->SetEndpoints(generateEndpoints(i, generation));
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
            });
    }
    for (auto& thread : changeThreads)
    {
        thread.join();
    }

    // Membership changes count as changes too
    auto lateProvider = std::make_shared<MutableEndpointProvider<Endpoint>>(
        generateEndpoints(configuration->GetDemoProviderCount(), 0));
    composite.AddProvider(lateProvider);
    composite.RemoveProvider(mutableProviders.front());

    spdlog::info("Final endpoints:\n{}", composite.GetDebugString());
    spdlog::info(
        "Observed {} change notifications across {} providers",
        notificationCount.load(),
        composite.GetProviders().size());

    consumer->Stop();
    return 0;
}
