/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file DataStream.h
 * @brief Abstract server side of one bidirectional request/response stream
 */

#pragma once

#include <optional>
#include <string>

#include "../Core/DatapathTypes.h"
#include "../Core/ErrorCodes.h"
#include "../Protocol/ConnectionMetadata.h"
#include "../Protocol/Messages.h"

namespace Datapath::Streaming {

/**
 * @brief One physical stream connection as seen by the servicer
 *
 * Implementations wrap a concrete transport (Unix socket, in-process test
 * double). The servicer reads from one thread (the intake reader) and writes
 * and finishes from another (the dispatch loop), so read() must tolerate a
 * concurrent write(), finish() or cancel().
 *
 * Lifecycle:
 * 1. metadata() is available as soon as the stream exists
 * 2. read() until it returns std::nullopt (peer closed) or an error
 * 3. finish() reports the final status exactly once and closes the stream;
 *    a read() still blocked returns std::nullopt afterwards
 */
class DataStream : public Core::EntropyObject {
public:
    ~DataStream() override = default;

    /**
     * @brief Invocation metadata sent by the client when opening the stream
     */
    virtual const ConnectionMetadata& metadata() const = 0;

    /**
     * @brief Block until the next request arrives
     * @return The request, std::nullopt on a clean end of stream, or an error
     */
    virtual Result<std::optional<DataRequest>> read() = 0;

    /**
     * @brief Send one response to the client
     * @return ConnectionClosed once the peer is gone
     */
    virtual Result<void> write(const DataResponse& response) = 0;

    /**
     * @brief Report the final status and close the stream
     *
     * Only the first call has an effect.
     */
    virtual void finish(StatusCode code, const std::string& details) = 0;

    /**
     * @brief Abort the stream without a status, unblocking read()
     */
    virtual void cancel() = 0;

    const char* className() const noexcept override {
        return "DataStream";
    }
};

} // namespace Datapath::Streaming
