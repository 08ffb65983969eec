/**
 * @file CompositeEndpointProvider.h
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#pragma once

#include "ChangeSignal.h"
#include "EndpointProviderCollection.h"
#include "IEndpointProvider.h"
#include "SourceWatcher.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/* Callback types */
typedef std::function<void(std::exception_ptr)> recompute_error_cb_t;

/**
 * @brief
 *  CompositeEndpointProvider merges the endpoints of any number of providers into a single
 *  cached snapshot, and hands out one ChangeSignal that fires whenever any provider changes
 *  or the set of providers itself changes.
 *
 *  The snapshot is computed lazily on the first read, and recomputed in full on every
 *  change after that. Each recompute publishes the new snapshot and a new signal before
 *  firing the old signal, so a consumer reacting to the old signal will always pick up
 *  the new one.
 */
template <class TEndpoint>
class CompositeEndpointProvider : public IEndpointProvider<TEndpoint>
{
public:
    typedef std::shared_ptr<IEndpointProvider<TEndpoint>> provider_ptr_t;

    /**
     * @brief A snapshot of endpoints along with the signal that fires when it goes stale
     */
    struct Epoch
    {
        std::shared_ptr<const std::vector<TEndpoint>> Endpoints;
        std::shared_ptr<ChangeSignal> Signal;
    };

    /* Constructor/Destructor */
    /**
     * @brief Creates a composite over a list of providers owned by this composite
     * @param providers providers to merge, in the order their endpoints should appear
     */
    CompositeEndpointProvider(std::vector<provider_ptr_t> providers) :
        state(std::make_shared<State>())
    {
        for (const auto& provider : providers)
        {
            if (!provider)
            {
                throw std::invalid_argument(
                    "CompositeEndpointProvider can not be created with a null provider");
            }
        }
        state->providers = std::move(providers);
    }

    /**
     * @brief
     *  Creates a composite over a shared collection of providers. Providers added to or
     *  removed from the collection are picked up automatically.
     * @param collection collection to follow
     */
    CompositeEndpointProvider(std::shared_ptr<EndpointProviderCollection<TEndpoint>> collection) :
        state(std::make_shared<State>())
    {
        if (!collection)
        {
            throw std::invalid_argument(
                "CompositeEndpointProvider can not be created with a null collection");
        }
        state->collection = std::move(collection);
    }

    ~CompositeEndpointProvider() override
    {
        // Take the watchers out under lock, but stop them outside of it - a watcher may be
        // in the middle of a callback that is waiting on our lock.
        std::vector<std::shared_ptr<SourceWatcher>> watchersToStop;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->isDisposed = true;
            for (const auto& [provider, watcher] : state->watchers)
            {
                watchersToStop.push_back(watcher);
            }
            state->watchers.clear();
            if (state->membershipWatcher)
            {
                watchersToStop.push_back(state->membershipWatcher);
                state->membershipWatcher = nullptr;
            }
        }
        for (const auto& watcher : watchersToStop)
        {
            watcher->Stop();
        }
    }

    CompositeEndpointProvider(const CompositeEndpointProvider&) = delete;
    CompositeEndpointProvider& operator=(const CompositeEndpointProvider&) = delete;

    /* IEndpointProvider */
    std::vector<TEndpoint> GetEndpoints() override
    {
        return *GetSnapshot();
    }

    std::shared_ptr<ChangeSignal> GetChangeSignal() override
    {
        ensureInitialized(state);
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->changeSignal;
    }

    /* Public methods */
    /**
     * @brief Returns the current snapshot of endpoints without copying it
     */
    std::shared_ptr<const std::vector<TEndpoint>> GetSnapshot()
    {
        ensureInitialized(state);
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->endpoints;
    }

    /**
     * @brief Returns the current snapshot and its change signal, read together
     */
    Epoch GetEpoch()
    {
        ensureInitialized(state);
        std::lock_guard<std::mutex> lock(state->mutex);
        return Epoch
        {
            .Endpoints = state->endpoints,
            .Signal = state->changeSignal,
        };
    }

    /**
     * @brief
     *  Appends a provider. If endpoints have already been handed out, they are recomputed
     *  and the current change signal fires.
     *  If the new provider fails to produce its endpoints, the error is thrown and
     *  nothing is changed.
     *  When following a collection, the provider is added to the collection. Only the new
     *  provider is read up front, other providers failing during the resulting recompute
     *  are handled like any other background recompute failure.
     * @param provider provider to add
     */
    void AddProvider(provider_ptr_t provider)
    {
        if (!provider)
        {
            throw std::invalid_argument("Can not add a null provider to CompositeEndpointProvider");
        }
        if (state->collection)
        {
            if (IsInitialized())
            {
                // The collection is shared, so make sure the provider can be read before
                // anyone else gets to see it.
                provider->GetChangeSignal();
                provider->GetEndpoints();
            }
            state->collection->Add(std::move(provider));
            return;
        }

        PendingWork work;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            std::vector<provider_ptr_t> newProviders = state->providers;
            newProviders.push_back(std::move(provider));
            if (!state->endpoints)
            {
                // Nobody has seen any endpoints yet, so there's nobody to tell
                state->providers = std::move(newProviders);
                return;
            }
            work = rebuildLocked(state, std::move(newProviders), true);
        }
        spdlog::debug("CompositeEndpointProvider: Provider added, endpoints recomputed");
        runPendingWork(work);
    }

    /**
     * @brief
     *  Removes the first occurrence of a provider. If endpoints have already been handed
     *  out, they are recomputed and the current change signal fires.
     *  When following a collection, the provider is removed from the collection and any
     *  recompute failure is handled like any other background recompute failure.
     * @param provider provider to remove
     * @return bool true if the provider was found and removed
     */
    bool RemoveProvider(const provider_ptr_t& provider)
    {
        if (state->collection)
        {
            return state->collection->Remove(provider);
        }

        PendingWork work;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            std::vector<provider_ptr_t> newProviders = state->providers;
            auto it = std::find(newProviders.begin(), newProviders.end(), provider);
            if (it == newProviders.end())
            {
                spdlog::warn(
                    "CompositeEndpointProvider: Attempt to remove a provider that is not a member");
                return false;
            }
            newProviders.erase(it);
            if (!state->endpoints)
            {
                state->providers = std::move(newProviders);
                return true;
            }
            work = rebuildLocked(state, std::move(newProviders), true);
        }
        spdlog::debug("CompositeEndpointProvider: Provider removed, endpoints recomputed");
        runPendingWork(work);
        return true;
    }

    /**
     * @brief Returns the providers currently merged by this composite, in order
     */
    std::vector<provider_ptr_t> GetProviders()
    {
        if (state->collection)
        {
            return state->collection->GetProviders();
        }
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->providers;
    }

    /**
     * @brief Whether endpoints have been computed yet
     */
    bool IsInitialized()
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        return (state->endpoints != nullptr);
    }

    /**
     * @brief
     *  Returns a human-readable dump of the current endpoints, one per line.
     *  Does not trigger initialization.
     */
    std::string GetDebugString()
    {
        std::shared_ptr<const std::vector<TEndpoint>> endpoints;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            endpoints = state->endpoints;
        }
        if (!endpoints)
        {
            return "No endpoints";
        }

        fmt::memory_buffer out;
        for (const auto& endpoint : *endpoints)
        {
            fmt::format_to(std::back_inserter(out), "{}\n", endpoint);
        }
        return fmt::to_string(out);
    }

    /**
     * @brief
     *  Sets the callback that will fire when endpoints could not be recomputed after a
     *  provider changed. In that case the last known endpoints are kept.
     *  Note that this may be called on whatever thread the provider changed on.
     * @param onRecomputeError callback to fire with the error
     */
    void SetOnRecomputeError(recompute_error_cb_t onRecomputeError)
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->onRecomputeError = std::move(onRecomputeError);
    }

private:
    /**
     * @brief
     *  Everything watchers need to reach. Watchers only hold a weak reference to this,
     *  so they go quiet once the composite is gone.
     */
    struct State
    {
        std::mutex mutex;
        std::vector<provider_ptr_t> providers;
        std::shared_ptr<EndpointProviderCollection<TEndpoint>> collection;
        bool isMembershipStale = false;
        // null until the first read
        std::shared_ptr<const std::vector<TEndpoint>> endpoints;
        std::shared_ptr<ChangeSignal> changeSignal = std::make_shared<ChangeSignal>();
        std::map<provider_ptr_t, std::shared_ptr<SourceWatcher>> watchers;
        std::shared_ptr<SourceWatcher> membershipWatcher;
        recompute_error_cb_t onRecomputeError;
        bool isDisposed = false;
    };

    /**
     * @brief Work that has to happen after the state lock is released
     */
    struct PendingWork
    {
        std::vector<std::shared_ptr<SourceWatcher>> WatchersToStop;
        std::vector<std::pair<std::shared_ptr<SourceWatcher>, std::shared_ptr<ChangeSignal>>>
            WatchersToStart;
        std::shared_ptr<ChangeSignal> SignalToFire;
    };

    /* Private members */
    const std::shared_ptr<State> state;

    /* Private methods */
    static void ensureInitialized(const std::shared_ptr<State>& state)
    {
        PendingWork work;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->endpoints)
            {
                return;
            }

            std::vector<provider_ptr_t> providers = state->providers;
            std::shared_ptr<ChangeSignal> membershipSignal;
            if (state->collection)
            {
                // Grab the signal first, so a membership change that lands between these two
                // calls still gets noticed.
                membershipSignal = state->collection->GetMembershipSignal();
                providers = state->collection->GetProviders();
            }

            // First read isn't a change, so there's no signal to fire
            work = rebuildLocked(state, std::move(providers), false);

            if (membershipSignal)
            {
                std::weak_ptr<State> weakState(state);
                std::shared_ptr<EndpointProviderCollection<TEndpoint>> collection =
                    state->collection;
                state->membershipWatcher = std::make_shared<SourceWatcher>(
                    [collection]()
                    {
                        return collection->GetMembershipSignal();
                    },
                    [weakState]()
                    {
                        handleChange(weakState, true);
                    });
                work.WatchersToStart.emplace_back(state->membershipWatcher, membershipSignal);
            }
            spdlog::debug(
                "CompositeEndpointProvider: Initialized with {} endpoints from {} providers",
                state->endpoints->size(),
                state->providers.size());
        }
        runPendingWork(work);
    }

    /**
     * @brief Recomputes endpoints after a provider or membership change
     */
    static void handleChange(const std::weak_ptr<State>& weakState, bool isMembershipChange)
    {
        std::shared_ptr<State> state = weakState.lock();
        if (!state)
        {
            return;
        }

        PendingWork work;
        std::exception_ptr error;
        recompute_error_cb_t onRecomputeError;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->isDisposed || !state->endpoints)
            {
                return;
            }

            try
            {
                std::vector<provider_ptr_t> providers = state->providers;
                if (state->collection && (isMembershipChange || state->isMembershipStale))
                {
                    providers = state->collection->GetProviders();
                }
                work = rebuildLocked(state, std::move(providers), true);
                state->isMembershipStale = false;
            }
            catch (...)
            {
                error = std::current_exception();
            }

            if (error)
            {
                // Nobody is waiting on this recompute, so keep serving what we had
                spdlog::error(
                    "CompositeEndpointProvider: Failed to recompute endpoints after a change, "
                    "keeping the last known endpoints: {}",
                    describeError(error));
                if (isMembershipChange)
                {
                    state->isMembershipStale = true;
                }
                onRecomputeError = state->onRecomputeError;
            }
        }

        if (error)
        {
            if (onRecomputeError)
            {
                onRecomputeError(error);
            }
            return;
        }

        spdlog::trace("CompositeEndpointProvider: Endpoints recomputed after a change");
        runPendingWork(work);
    }

    /**
     * @brief
     *  Builds a new snapshot from the given providers and commits it, along with the
     *  provider list. Must be called with the state mutex held.
     *  If any provider throws, the exception propagates and the state is left untouched.
     * @param rotateSignal whether to publish a new change signal and hand back the old one
     */
    static PendingWork rebuildLocked(
        const std::shared_ptr<State>& state,
        std::vector<provider_ptr_t> providers,
        bool rotateSignal)
    {
        // Each provider's signal is captured before its endpoints are read. If the provider
        // changes in between, the watcher starts from an already-fired signal and we
        // recompute again right away.
        std::vector<std::shared_ptr<ChangeSignal>> providerSignals;
        auto endpoints = std::make_shared<std::vector<TEndpoint>>();
        for (const auto& provider : providers)
        {
            providerSignals.push_back(provider->GetChangeSignal());
            std::vector<TEndpoint> providerEndpoints = provider->GetEndpoints();
            endpoints->insert(
                endpoints->end(),
                std::make_move_iterator(providerEndpoints.begin()),
                std::make_move_iterator(providerEndpoints.end()));
        }

        // The full snapshot is built, commit it
        PendingWork work;
        state->providers = std::move(providers);
        state->endpoints = std::move(endpoints);
        if (rotateSignal)
        {
            // Publish the new signal before the old one fires. Anyone re-subscribing from
            // inside a callback on the old signal lands on this one, rather than on the
            // signal that is firing.
            work.SignalToFire = state->changeSignal;
            state->changeSignal = std::make_shared<ChangeSignal>();
        }

        std::weak_ptr<State> weakState(state);
        for (size_t i = 0; i < state->providers.size(); ++i)
        {
            const provider_ptr_t& provider = state->providers[i];
            if (state->watchers.count(provider) > 0)
            {
                continue;
            }
            auto watcher = std::make_shared<SourceWatcher>(
                [provider]()
                {
                    return provider->GetChangeSignal();
                },
                [weakState]()
                {
                    handleChange(weakState, false);
                });
            state->watchers[provider] = watcher;
            work.WatchersToStart.emplace_back(watcher, providerSignals[i]);
        }
        for (auto it = state->watchers.begin(); it != state->watchers.end();)
        {
            if (std::find(state->providers.begin(), state->providers.end(), it->first) ==
                state->providers.end())
            {
                work.WatchersToStop.push_back(it->second);
                it = state->watchers.erase(it);
            }
            else
            {
                ++it;
            }
        }
        return work;
    }

    static void runPendingWork(PendingWork& work)
    {
        for (const auto& watcher : work.WatchersToStop)
        {
            watcher->Stop();
        }

        // A watcher starting from a fired signal recomputes right away, and that can
        // throw. The old signal has to fire regardless, so hold on to the first error.
        std::exception_ptr firstError;
        for (const auto& [watcher, initialSignal] : work.WatchersToStart)
        {
            try
            {
                watcher->Start(initialSignal);
            }
            catch (...)
            {
                if (!firstError)
                {
                    firstError = std::current_exception();
                }
            }
        }

        // Fire last - consumer callbacks may call right back into us
        if (work.SignalToFire)
        {
            try
            {
                work.SignalToFire->Fire();
            }
            catch (...)
            {
                if (!firstError)
                {
                    firstError = std::current_exception();
                }
            }
        }

        if (firstError)
        {
            std::rethrow_exception(firstError);
        }
    }

    static std::string describeError(const std::exception_ptr& error)
    {
        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception& e)
        {
            return e.what();
        }
        catch (...)
        {
            return "unknown error";
        }
    }
};
