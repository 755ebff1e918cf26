/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file DatapathClient.h
 * @brief Client side of a data stream over a Unix domain socket
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "../Protocol/MessageCodec.h"
#include "FramedSocket.h"

namespace Datapath::Streaming {

/// One message received by a client: a response, or the final stream status
using ClientEvent = std::variant<DataResponse, StreamStatus>;

/**
 * @brief Connects to a DatapathServer and exchanges requests and responses
 *
 * The client does not assign request ids; callers choose them so that a
 * request replayed after reconnecting carries its original id.
 *
 * Thread Safety: send() and receive() may be used from different threads.
 *
 * @code
 * DatapathClient client;
 * client.connect("/tmp/datapath.sock", "c1", false);
 *
 * DataRequest put;
 * put.reqId = 1;
 * put.payload = PutRequest{{1, 2, 3}, {}};
 * auto resp = client.call(put);
 * @endcode
 */
class DatapathClient : public Core::EntropyObject {
public:
    explicit DatapathClient(CodecOptions options = {});
    ~DatapathClient() override;

    DatapathClient(const DatapathClient&) = delete;
    DatapathClient& operator=(const DatapathClient&) = delete;

    /**
     * @brief Open a stream and send the connection metadata
     *
     * @param socketPath Server socket path
     * @param clientId Client id of the session
     * @param reconnecting True when resuming a session after a dropped stream
     */
    Result<void> connect(const std::string& socketPath, const ClientId& clientId, bool reconnecting);

    Result<void> send(const DataRequest& request);

    /**
     * @brief Block until the next response or the final status arrives
     * @return The event, or ConnectionClosed if the stream ended without status
     */
    Result<ClientEvent> receive();

    /**
     * @brief Send a request and wait for the next response
     *
     * A final status instead of a response is returned as ConnectionClosed
     * with the status details; lastStatus() holds the status.
     */
    Result<DataResponse> call(const DataRequest& request);

    /**
     * @brief Stop sending; the server finishes the stream once it drained the requests
     *
     * receive() keeps working until the final status arrives.
     */
    void closeSend();

    /**
     * @brief Drop the stream at once, without waiting for a status
     */
    void disconnect();

    bool isConnected() const noexcept {
        return _socket && _socket->isOpen();
    }

    const std::optional<StreamStatus>& lastStatus() const noexcept {
        return _lastStatus;
    }

    const ClientId& clientId() const noexcept {
        return _clientId;
    }

    // EntropyObject interface
    const char* className() const noexcept override {
        return "DatapathClient";
    }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    CodecOptions _options;
    std::shared_ptr<FramedSocket> _socket;
    ClientId _clientId;
    std::optional<StreamStatus> _lastStatus;
};

} // namespace Datapath::Streaming
