/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "../Core/DatapathTypes.h"
#include "../Core/ErrorCodes.h"
#include "FramedSocket.h"

namespace Datapath::Streaming
{

/**
 * @brief Configuration for a Unix socket listener
 */
struct UnixSocketServerConfig {
    int backlog = 128;                 ///< listen() backlog
    int acceptPollIntervalMs = 500;    ///< poll interval of the accept loop
    int chmodMode = -1;                ///< if >= 0, chmod the socket path to this mode
    bool unlinkOnStart = true;         ///< if true, unlink socket path before bind
    size_t maxMessageSize = DEFAULT_MAX_MESSAGE_SIZE;  ///< Frame limit of accepted sockets
};

/**
 * @brief Unix domain socket listener
 *
 * Handles socket creation, binding, listening, and accepting connections.
 * accept() polls so that close() from another thread ends it promptly. The
 * listening descriptor is closed only once no accept() is using it.
 */
class UnixSocketServer : public Core::EntropyObject
{
public:
    explicit UnixSocketServer(std::string socketPath);
    UnixSocketServer(std::string socketPath, UnixSocketServerConfig config);
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    Result<void> listen();

    /**
     * @brief Wait for the next connection
     * @return Accepted socket, or nullptr once the server is closed or accept fails
     */
    std::shared_ptr<FramedSocket> accept();

    Result<void> close();

    bool isListening() const {
        return _listening.load(std::memory_order_acquire);
    }

    const std::string& socketPath() const noexcept {
        return _socketPath;
    }

    // EntropyObject interface
    const char* className() const noexcept override {
        return "UnixSocketServer";
    }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    /// One poll/accept round; false once accept() should give up
    bool waitForClient(int serverSocket, int& clientSocket);

    /// _fdMutex must be held
    void closeListenerLocked();

    std::string _socketPath;
    std::mutex _fdMutex;
    int _serverSocket = -1;
    size_t _activeAccepts = 0;
    std::atomic<bool> _listening{false};
    UnixSocketServerConfig _config{};
};

}  // namespace Datapath::Streaming
