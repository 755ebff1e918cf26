/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file SessionRegistry.h
 * @brief Process-wide registry of client sessions and the live-client count
 *
 * The registry gates admission of new stream connections, tracks when each
 * client was last seen, and performs the locked half of session teardown.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../Core/DatapathTypes.h"
#include "../Core/ErrorCodes.h"
#include "../Core/TimeUtils.h"
#include "ResponseCache.h"

namespace Datapath::Streaming {

/**
 * @brief Proof of admission handed to one connection
 *
 * The epoch is unique per accepted connection. Teardown compares it (and the
 * start time) against the session to detect a reconnect that happened while
 * this connection was waiting out its grace period.
 */
struct AdmissionTicket {
    ClientId clientId;
    uint64_t epoch = 0;
    SessionClock::time_point startTime;
    bool resumed = false;                       ///< Joined an existing session
    std::shared_ptr<ResponseCache> cache;       ///< Session cache, shared across reconnects
};

/**
 * @brief Result of the locked teardown step
 */
enum class TeardownOutcome {
    AlreadyRemoved,     ///< Another connection already cleaned the session up
    Reconnected,        ///< A newer connection owns the session; nothing done
    Removed,            ///< Session removed, other clients remain
    RemovedLastClient   ///< Session removed and the shutdown callback ran
};

const char* teardownOutcomeToString(TeardownOutcome outcome) noexcept;

/**
 * @brief Snapshot of one registered session
 */
struct SessionInfo {
    ClientId clientId;
    uint64_t epoch = 0;
    SessionClock::time_point lastSeen;
    std::optional<int32_t> gracePeriodSeconds;
    size_t cachedResponses = 0;
};

/**
 * @brief Registry of live and recently disconnected client sessions
 *
 * State per client id: UNKNOWN -> ACTIVE -> (reconnect window) -> ACTIVE | REMOVED.
 *
 * A single mutex guards the session map and the active-client count. The
 * shutdown callback runs while that mutex is held, only on the transition of
 * the count to zero, so it can never race an admission.
 *
 * Thread Safety: All public methods are thread-safe. Callbacks passed to
 * runLocked() and finishConnection() must not call back into the registry.
 *
 * @code
 * SessionRegistry registry(config.clientThreshold(), [&]() { backend.shutdown(); });
 *
 * auto ticket = registry.admit("c1", false, SessionClock::now());
 * if (ticket.failed()) {
 *     stream->finish(StatusCode::ResourceExhausted, ticket.errorMessage);
 *     return;
 * }
 * // ... serve the connection ...
 * registry.finishConnection(ticket.value, [&](const ClientId& id) { backend.releaseAll(id); });
 * @endcode
 */
class SessionRegistry : public Core::EntropyObject {
public:
    using ShutdownCallback = std::function<void()>;
    using ReleaseAllCallback = std::function<void(const ClientId&)>;

    /**
     * @brief Constructs an empty registry
     *
     * @param clientThreshold Number of concurrently active sessions admitted
     * @param onLastClientRemoved Invoked under the registry lock when the last
     *                            active session is removed; may be empty
     */
    SessionRegistry(size_t clientThreshold, ShutdownCallback onLastClientRemoved);
    ~SessionRegistry() override = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Admit a new stream connection for a client
     *
     * - known client id: the session is resumed, last-seen refreshed, and a
     *   new epoch stamped; the count is unchanged
     * - unknown client id, reconnecting: SessionNotFound
     * - unknown client id, count at threshold: ResourceExhausted, and no
     *   session is created
     * - otherwise a new session is created and the count incremented
     *
     * @param clientId Client id from the connection metadata
     * @param reconnecting Whether the client claims an existing session
     * @param startTime Start time of this connection; becomes last-seen
     * @return Ticket for the connection, or the rejection
     */
    Result<AdmissionTicket> admit(const ClientId& clientId, bool reconnecting,
                                  SessionClock::time_point startTime);

    /**
     * @brief Record the reconnect grace period requested by init
     * @return false if the client has no session
     */
    bool setGracePeriod(const ClientId& clientId, int32_t seconds);

    /**
     * @brief Grace period on record for a client, if init set one
     */
    std::optional<int32_t> gracePeriod(const ClientId& clientId) const;

    /**
     * @brief Locked teardown step of a connection
     *
     * Removes the session unless it is already gone or was reclaimed by a
     * newer connection. Removal releases all backend resources of the client
     * through releaseAll, erases the session with its cache and grace period,
     * decrements the count, and runs the shutdown callback when the count
     * reaches zero. All of it happens in one critical section.
     *
     * @param ticket Ticket issued to the finishing connection
     * @param releaseAll Releases the client's backend resources
     * @return What the teardown did
     */
    TeardownOutcome finishConnection(const AdmissionTicket& ticket, const ReleaseAllCallback& releaseAll);

    /**
     * @brief Run a function while holding the registry lock
     *
     * Used for backend operations that must not interleave with admission or
     * the last-client shutdown.
     */
    template<typename Fn>
    auto runLocked(Fn&& fn) -> decltype(fn()) {
        std::lock_guard<std::mutex> lock(_mutex);
        return fn();
    }

    size_t activeCount() const;
    size_t clientThreshold() const noexcept { return _clientThreshold; }
    bool contains(const ClientId& clientId) const;
    std::vector<SessionInfo> snapshot() const;

    // EntropyObject interface
    const char* className() const noexcept override {
        return "SessionRegistry";
    }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    struct Session {
        SessionClock::time_point lastSeen;
        uint64_t epoch = 0;
        std::optional<int32_t> gracePeriodSeconds;
        std::shared_ptr<ResponseCache> cache;
    };

    mutable std::mutex _mutex;
    std::unordered_map<ClientId, Session> _sessions;
    size_t _activeCount = 0;
    uint64_t _nextEpoch = 1;
    const size_t _clientThreshold;
    ShutdownCallback _onLastClientRemoved;
};

} // namespace Datapath::Streaming
