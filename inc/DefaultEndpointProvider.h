/**
 * @file DefaultEndpointProvider.h
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#pragma once

#include "ChangeSignal.h"
#include "IEndpointProvider.h"

#include <memory>
#include <utility>
#include <vector>

/**
 * @brief Provides a fixed set of endpoints that never changes
 */
template <class TEndpoint>
class DefaultEndpointProvider : public IEndpointProvider<TEndpoint>
{
public:
    /* Constructor/Destructor */
    DefaultEndpointProvider(std::vector<TEndpoint> endpoints) :
        endpoints(std::move(endpoints))
    { }

    /* IEndpointProvider */
    std::vector<TEndpoint> GetEndpoints() override
    {
        return endpoints;
    }

    std::shared_ptr<ChangeSignal> GetChangeSignal() override
    {
        return ChangeSignal::Never();
    }

private:
    const std::vector<TEndpoint> endpoints;
};
