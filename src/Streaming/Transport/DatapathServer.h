/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file DatapathServer.h
 * @brief Accept loop serving DataServicer streams over a Unix socket
 */

#pragma once

#include <atomic>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "../Core/ServerConfig.h"
#include "../Session/DataServicer.h"
#include "UnixSocketServer.h"

namespace Datapath::Streaming {

/**
 * @brief Listens on the configured socket path and runs one servicer call per connection
 *
 * Each accepted connection gets its own thread, which reads the metadata
 * frame and then blocks in DataServicer::datapath() until the connection is
 * torn down (including any grace period).
 *
 * @code
 * auto servicer = std::make_shared<DataServicer>(backend, config);
 * DatapathServer server(servicer, config);
 * if (server.start().failed()) { ... }
 * // ...
 * server.stop();
 * @endcode
 */
class DatapathServer : public Core::EntropyObject {
public:
    DatapathServer(std::shared_ptr<DataServicer> servicer, ServerConfig config);
    ~DatapathServer() override;

    DatapathServer(const DatapathServer&) = delete;
    DatapathServer& operator=(const DatapathServer&) = delete;

    /**
     * @brief Bind the socket and start accepting
     */
    Result<void> start();

    /**
     * @brief Stop accepting, cut grace periods short, cancel live streams and
     *        wait for every connection thread
     */
    void stop();

    bool isRunning() const noexcept {
        return _running.load(std::memory_order_acquire);
    }

    /// Connections whose thread has not finished yet
    size_t connectionCount() const;

    // EntropyObject interface
    const char* className() const noexcept override {
        return "DatapathServer";
    }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    struct Worker {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void acceptLoop();
    void serveConnection(uint64_t connectionId, std::shared_ptr<FramedSocket> socket, Worker* worker);
    void reapFinishedWorkers();

    std::shared_ptr<DataServicer> _servicer;
    ServerConfig _config;
    UnixSocketServer _listener;

    std::atomic<bool> _running{false};
    std::thread _acceptThread;

    mutable std::mutex _mutex;
    std::map<uint64_t, std::shared_ptr<FramedSocket>> _liveSockets;
    std::list<Worker> _workers;
    uint64_t _nextConnectionId = 1;
};

} // namespace Datapath::Streaming
