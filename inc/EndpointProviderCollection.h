/**
 * @file EndpointProviderCollection.h
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#pragma once

#include "ChangeSignal.h"
#include "IEndpointProvider.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

/**
 * @brief
 *  EndpointProviderCollection is a mutable, ordered set of endpoint providers that can be
 *  shared between CompositeEndpointProviders. Adding or removing a provider fires the
 *  collection's membership signal, which is separate from the providers' own signals.
 */
template <class TEndpoint>
class EndpointProviderCollection
{
public:
    /* Constructor/Destructor */
    EndpointProviderCollection(
        std::vector<std::shared_ptr<IEndpointProvider<TEndpoint>>> providers =
            std::vector<std::shared_ptr<IEndpointProvider<TEndpoint>>>()) :
        providers(std::move(providers)),
        membershipSignal(std::make_shared<ChangeSignal>())
    {
        for (const auto& provider : this->providers)
        {
            if (!provider)
            {
                throw std::invalid_argument("EndpointProviderCollection can not hold a null provider");
            }
        }
    }

    /* Public methods */
    /**
     * @brief Appends a provider to the end of the collection
     * @param provider provider to add
     */
    void Add(std::shared_ptr<IEndpointProvider<TEndpoint>> provider)
    {
        if (!provider)
        {
            throw std::invalid_argument("EndpointProviderCollection can not hold a null provider");
        }

        std::shared_ptr<ChangeSignal> oldSignal;
        {
            std::lock_guard<std::mutex> lock(mutex);
            providers.push_back(std::move(provider));
            oldSignal = rotateSignal();
        }
        oldSignal->Fire();
    }

    /**
     * @brief Removes the first occurrence of a provider from the collection
     * @param provider provider to remove
     * @return bool true if the provider was found and removed
     */
    bool Remove(const std::shared_ptr<IEndpointProvider<TEndpoint>>& provider)
    {
        std::shared_ptr<ChangeSignal> oldSignal;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = std::find(providers.begin(), providers.end(), provider);
            if (it == providers.end())
            {
                spdlog::warn(
                    "EndpointProviderCollection: Attempt to remove a provider that is not a member");
                return false;
            }
            providers.erase(it);
            oldSignal = rotateSignal();
        }
        oldSignal->Fire();
        return true;
    }

    /**
     * @brief Returns a copy of the providers currently in the collection, in order
     */
    std::vector<std::shared_ptr<IEndpointProvider<TEndpoint>>> GetProviders()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return providers;
    }

    /**
     * @brief Returns the signal that fires the next time a provider is added or removed
     */
    std::shared_ptr<ChangeSignal> GetMembershipSignal()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return membershipSignal;
    }

private:
    std::mutex mutex;
    std::vector<std::shared_ptr<IEndpointProvider<TEndpoint>>> providers;
    std::shared_ptr<ChangeSignal> membershipSignal;

    // Must be called with mutex held. Returns the signal that the caller should fire.
    std::shared_ptr<ChangeSignal> rotateSignal()
    {
        std::shared_ptr<ChangeSignal> oldSignal = membershipSignal;
        membershipSignal = std::make_shared<ChangeSignal>();
        return oldSignal;
    }
};
