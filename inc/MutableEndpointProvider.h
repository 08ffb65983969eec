/**
 * @file MutableEndpointProvider.h
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#pragma once

#include "ChangeSignal.h"
#include "IEndpointProvider.h"

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

/**
 * @brief
 *  Provides a set of endpoints that can be replaced at runtime. Every replacement
 *  fires the signal that was handed out for the previous set.
 */
template <class TEndpoint>
class MutableEndpointProvider : public IEndpointProvider<TEndpoint>
{
public:
    /* Constructor/Destructor */
    MutableEndpointProvider(std::vector<TEndpoint> endpoints = std::vector<TEndpoint>()) :
        endpoints(std::move(endpoints)),
        changeSignal(std::make_shared<ChangeSignal>())
    { }

    /* Public methods */
    /**
     * @brief Replaces the endpoints of this provider and notifies anyone watching
     * @param newEndpoints the new set of endpoints
     */
    void SetEndpoints(std::vector<TEndpoint> newEndpoints)
    {
        std::shared_ptr<ChangeSignal> oldSignal;
        {
            std::lock_guard<std::mutex> lock(mutex);
            endpoints = std::move(newEndpoints);
            oldSignal = changeSignal;
            changeSignal = std::make_shared<ChangeSignal>();
        }

        // Fire outside of our lock so watchers can read our new endpoints right away
        oldSignal->Fire();
    }

    /* IEndpointProvider */
    std::vector<TEndpoint> GetEndpoints() override
    {
        std::lock_guard<std::mutex> lock(mutex);
        return endpoints;
    }

    std::shared_ptr<ChangeSignal> GetChangeSignal() override
    {
        std::lock_guard<std::mutex> lock(mutex);
        return changeSignal;
    }

private:
    std::mutex mutex;
    std::vector<TEndpoint> endpoints;
    std::shared_ptr<ChangeSignal> changeSignal;
};
