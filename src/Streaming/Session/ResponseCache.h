/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file ResponseCache.h
 * @brief Per-client cache of outbound responses for replay across reconnects
 */

#pragma once

#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <variant>

#include "../Core/DatapathFault.h"
#include "../Core/DatapathTypes.h"
#include "../Protocol/Messages.h"

namespace Datapath::Streaming {

/**
 * @brief Outcome of a cache lookup
 *
 * - std::monostate: nothing cached; the caller now owns the slot and must
 *   compute the response
 * - DataResponse: previously emitted response, replay it as-is
 * - DatapathFault: recorded failure, the caller re-raises it
 */
using CacheLookup = std::variant<std::monostate, DataResponse, DatapathFault>;

/**
 * @brief Ordered response cache of one client session
 *
 * Responses are keyed by request id and stored at most once (first write
 * wins). A lookup miss reserves the id as in flight; a second lookup of an
 * in-flight id, typically from a reconnected stream racing the old one,
 * blocks until the slot is filled, acknowledged or invalidated.
 *
 * Once invalidated the cache is permanently broken: every later lookup
 * returns the recorded fault, for any id.
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * @code
 * auto hit = cache.check(req.reqId);
 * if (auto* resp = std::get_if<DataResponse>(&hit)) {
 *     stream.write(*resp);
 * } else if (auto* fault = std::get_if<DatapathFault>(&hit)) {
 *     throw *fault;
 * } else {
 *     auto resp = handle(req);
 *     cache.update(req.reqId, resp);
 * }
 * @endcode
 */
class ResponseCache {
public:
    ResponseCache() = default;

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    /**
     * @brief Look up a request id, reserving it on a miss
     * @param reqId Request id of the incoming request
     * @return Cached response, recorded failure, or std::monostate
     */
    CacheLookup check(RequestId reqId);

    /**
     * @brief Store the response for a request id
     *
     * Fills an in-flight slot or inserts a new entry. A no-op when a response
     * or failure is already stored for the id.
     */
    void update(RequestId reqId, const DataResponse& response);

    /**
     * @brief Drop the entry of an acknowledged request id; no-op if absent
     */
    void cleanup(RequestId reqId);

    /**
     * @brief Permanently mark the cache broken with a fault
     *
     * Slots still in flight are filled with the fault and their waiters are
     * woken.
     *
     * @param fault The fault that ended the dispatch loop
     * @return true if the cache was already invalid or an in-flight response
     *         was lost; the session cannot be resumed in either case
     */
    bool invalidate(const DatapathFault& fault);

    bool invalidated() const;

    /// Number of stored or in-flight entries
    size_t size() const;

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::map<RequestId, CacheLookup> _entries;      // monostate = in flight
    std::optional<DatapathFault> _invalidation;
};

} // namespace Datapath::Streaming
