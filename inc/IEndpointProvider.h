/**
 * @file IEndpointProvider.h
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#pragma once

#include "ChangeSignal.h"

#include <memory>
#include <vector>

/**
 * @brief
 *  IEndpointProvider describes a source of endpoints that can change over time.
 *  Whenever the set of endpoints changes, the provider fires the ChangeSignal it was
 *  handing out and starts handing out a fresh one.
 */
template <class TEndpoint>
class IEndpointProvider
{
public:
    virtual ~IEndpointProvider() = default;

    /**
     * @brief Returns a snapshot of the endpoints this provider currently has
     */
    virtual std::vector<TEndpoint> GetEndpoints() = 0;

    /**
     * @brief
     *  Returns the signal for the current set of endpoints. Once this signal has fired
     *  it will never be reset, callers should fetch a new one.
     */
    virtual std::shared_ptr<ChangeSignal> GetChangeSignal() = 0;
};
