/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file DataServicer.h
 * @brief Serves bidirectional data streams on top of the session registry
 *
 * One datapath() call serves one stream connection from admission to
 * teardown. Any number of calls may run concurrently, one per connection.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../Core/DatapathFault.h"
#include "../Core/ServerConfig.h"
#include "../Service/BackendService.h"
#include "../Transport/DataStream.h"
#include "RequestQueue.h"
#include "SessionRegistry.h"

namespace Datapath::Streaming {

/**
 * @brief Data-plane servicer multiplexing client requests over one stream
 *
 * Per connection the servicer:
 * 1. Admits the client through the SessionRegistry (new session, resumed
 *    session, or rejection with ResourceExhausted / NotFound)
 * 2. Starts an IntakeReader that drains the stream into a RequestQueue
 * 3. Runs the dispatch loop: replays cached responses, calls the backend,
 *    caches and emits responses in dequeue order
 * 4. On exit, finishes the stream with its status, joins the reader and
 *    either cleans the session up at once or after the client's grace period
 *
 * Responses of everything except get, acknowledge and connection_cleanup are
 * cached while reconnection is enabled, so a client replaying a request id
 * after a reconnect receives the original response without a second backend
 * call. An init with a grace period of 0 disables reconnection and caching.
 *
 * A fault escaping a request invalidates the session cache. If the fault is
 * unrecoverable, or the cache had already failed or lost an in-flight
 * response, the stream finishes with FailedPrecondition and the session is
 * removed without waiting for the grace period.
 *
 * Thread Safety: datapath() is safe to call concurrently; stop() may be
 * called from any thread.
 *
 * @code
 * auto backend = std::make_shared<InMemoryBackend>(&asyncGets);
 * DataServicer servicer(backend, ServerConfig{});
 *
 * // One thread per accepted connection
 * std::thread([&servicer, stream]() { servicer.datapath(stream); }).detach();
 *
 * // Server shutdown: cut grace periods short
 * servicer.stop();
 * @endcode
 */
class DataServicer : public Core::EntropyObject {
public:
    /**
     * @brief Constructs a servicer
     *
     * @param backend Request-execution backend shared by all connections
     * @param config Client threshold and reader join timeout
     * @param onLastClientRemoved Run under the registry lock when the last
     *                            session is removed; defaults to backend->shutdown()
     */
    DataServicer(std::shared_ptr<BackendService> backend,
                 ServerConfig config = {},
                 SessionRegistry::ShutdownCallback onLastClientRemoved = {});
    ~DataServicer() override = default;

    DataServicer(const DataServicer&) = delete;
    DataServicer& operator=(const DataServicer&) = delete;

    /**
     * @brief Serve one stream connection until it ends and is torn down
     *
     * Blocks for the whole lifetime of the connection, including any grace
     * period wait after it drops.
     *
     * @param stream Stream to serve
     */
    void datapath(std::shared_ptr<DataStream> stream);

    /**
     * @brief Signal server shutdown
     *
     * Wakes every teardown waiting out a grace period so it cleans up now.
     */
    void stop();

    bool stopped() const;

    /**
     * @brief Connection info as reported to clients
     */
    ConnectionInfoResponse connectionInfo() const;

    SessionRegistry& registry() noexcept { return _registry; }
    const SessionRegistry& registry() const noexcept { return _registry; }

    // EntropyObject interface
    const char* className() const noexcept override {
        return "DataServicer";
    }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    struct Connection {
        AdmissionTicket ticket;
        std::shared_ptr<DataStream> stream;
        std::shared_ptr<RequestQueue> queue;
        bool reconnectEnabled = true;
        bool cleanupRequested = false;
        StreamStatus status;
    };

    void dispatchLoop(Connection& conn);

    /// Run one request against the backend; std::nullopt when nothing is emitted now
    std::optional<DataResponse> handleRequest(const DataRequest& request, Connection& conn);

    /// @return false if the stream is gone
    bool emit(Connection& conn, const DataResponse& response);

    void handleFault(Connection& conn, const DatapathFault& fault);
    void teardown(Connection& conn);

    /// Wait up to the duration or until stop(); true if stopped
    bool waitForStop(std::chrono::milliseconds duration);

    std::shared_ptr<BackendService> _backend;
    ServerConfig _config;
    SessionRegistry _registry;

    mutable std::mutex _stopMutex;
    std::condition_variable _stopCv;
    bool _stopped = false;
};

} // namespace Datapath::Streaming
