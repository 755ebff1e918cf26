/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file BackendService.h
 * @brief Request-execution backend invoked by the data servicer
 */

#pragma once

#include <functional>
#include <optional>

#include "../Core/DatapathTypes.h"
#include "../Protocol/Messages.h"

namespace Datapath::Streaming {

/**
 * @brief Object store and runtime services behind the data stream
 *
 * Application-level failures (unknown object, timeout) are reported inside
 * the response payload (valid = false, error text) so that the client can
 * tell them apart from session failures. Anything thrown, a DatapathFault or
 * otherwise, ends the dispatch loop of the calling connection.
 *
 * All methods may be called concurrently from different connections.
 */
class BackendService : public Core::EntropyObject {
public:
    /// Delivers the result of an asynchronous get once it is ready
    using GetCompletion = std::function<void(GetResponse)>;

    ~BackendService() override = default;

    virtual InitResponse init(const InitRequest& request) = 0;

    virtual GetResponse getObject(const GetRequest& request, const ClientId& clientId) = 0;

    /**
     * @brief Start a get that may complete later
     *
     * @param request Get request with asynchronous set
     * @param clientId Requesting client
     * @param reqId Request id the eventual response answers
     * @param completion Called exactly once, on any thread, if the result is
     *                   not returned directly
     * @return The response if it is available now, otherwise std::nullopt
     */
    virtual std::optional<GetResponse> asyncGetObject(const GetRequest& request, const ClientId& clientId,
                                                      RequestId reqId, GetCompletion completion) = 0;

    virtual PutResponse putObject(const PutRequest& request, const ClientId& clientId) = 0;

    /**
     * @brief Drop one reference the client holds on an object
     * @return true if the client held a reference
     */
    virtual bool release(const ClientId& clientId, const ObjectId& id) = 0;

    /**
     * @brief Drop every reference the client holds
     */
    virtual void releaseAll(const ClientId& clientId) = 0;

    virtual PrepRuntimeEnvResponse prepRuntimeEnv(const PrepRuntimeEnvRequest& request) = 0;

    /**
     * @brief Shut down shared state once no client is left
     *
     * Called with the session registry lock held.
     */
    virtual void shutdown() = 0;

    const char* className() const noexcept override {
        return "BackendService";
    }
};

} // namespace Datapath::Streaming
