/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file FramedSocket.h
 * @brief Length-prefixed message framing over a connected Unix domain socket
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../Core/DatapathTypes.h"
#include "../Core/ErrorCodes.h"

namespace Datapath::Streaming {

/**
 * @brief Connected stream socket exchanging framed messages
 *
 * Frame layout: [4-byte big-endian length][payload]. The socket is kept
 * non-blocking; sends and receives poll, so shutdown() from another thread
 * wakes a blocked receiveFrame().
 *
 * Thread Safety: one sender and one receiver may run concurrently; sends are
 * serialized internally.
 */
class FramedSocket {
public:
    /**
     * @brief Adopt an already connected socket
     * @param fd Connected socket; owned from now on
     * @param maxMessageSize Largest frame accepted in either direction
     */
    FramedSocket(int fd, size_t maxMessageSize);
    ~FramedSocket();

    FramedSocket(const FramedSocket&) = delete;
    FramedSocket& operator=(const FramedSocket&) = delete;

    /**
     * @brief Connect to a listening Unix socket
     * @param socketPath Filesystem path of the server socket
     * @param maxMessageSize Largest frame accepted in either direction
     * @param connectTimeoutMs Connect timeout
     */
    static Result<std::shared_ptr<FramedSocket>> connect(const std::string& socketPath,
                                                         size_t maxMessageSize,
                                                         int connectTimeoutMs = 5000);

    /**
     * @brief Send one frame, blocking until it is fully written
     */
    Result<void> sendFrame(const std::vector<uint8_t>& payload);

    /**
     * @brief Block until one frame arrives
     * @return The payload, std::nullopt once the peer closed (or shutdown()
     *         was called) between frames, or an error
     */
    Result<std::optional<std::vector<uint8_t>>> receiveFrame();

    /**
     * @brief Shut both directions down and wake a blocked receiver
     *
     * The descriptor stays allocated until destruction.
     */
    void shutdown();

    /**
     * @brief Half-close: signal end of stream to the peer, keep receiving
     */
    void shutdownWrite();

    bool isOpen() const noexcept {
        return !_shutdown.load(std::memory_order_acquire);
    }

private:
    Result<void> sendAll(const uint8_t* data, size_t size, int flags);

    int _fd;
    size_t _maxMessageSize;
    std::atomic<bool> _shutdown{false};

    std::mutex _sendMutex;
    std::mutex _receiveMutex;
    std::vector<uint8_t> _pending;      // received bytes not yet returned as a frame

    int _pollIntervalMs = 100;
    int _sendPollTimeoutMs = 1000;
    int _sendMaxPolls = 30;
};

} // namespace Datapath::Streaming
