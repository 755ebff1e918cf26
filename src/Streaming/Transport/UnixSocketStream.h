/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file UnixSocketStream.h
 * @brief Server-side DataStream over an accepted Unix domain socket
 */

#pragma once

#include <atomic>
#include <memory>

#include "../Protocol/MessageCodec.h"
#include "DataStream.h"
#include "FramedSocket.h"

namespace Datapath::Streaming {

/**
 * @brief DataStream backed by a FramedSocket
 *
 * The client opens the stream by sending a metadata frame, followed by any
 * number of request frames. The server sends response frames and, when it is
 * done, one status frame before shutting the socket down.
 */
class UnixSocketStream : public DataStream {
public:
    /**
     * @brief Read the metadata frame and wrap the socket
     * @param socket Accepted socket
     * @param options Codec limits
     * @return The stream, or an error if the first frame is not metadata
     */
    static Result<std::shared_ptr<UnixSocketStream>> open(std::shared_ptr<FramedSocket> socket,
                                                          CodecOptions options = {});

    UnixSocketStream(std::shared_ptr<FramedSocket> socket, ConnectionMetadata metadata, CodecOptions options);
    ~UnixSocketStream() override;

    // DataStream interface
    const ConnectionMetadata& metadata() const override {
        return _metadata;
    }
    Result<std::optional<DataRequest>> read() override;
    Result<void> write(const DataResponse& response) override;
    void finish(StatusCode code, const std::string& details) override;
    void cancel() override;

    bool finished() const noexcept {
        return _finished.load(std::memory_order_acquire);
    }

    // EntropyObject interface
    const char* className() const noexcept override {
        return "UnixSocketStream";
    }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    std::shared_ptr<FramedSocket> _socket;
    ConnectionMetadata _metadata;
    CodecOptions _options;
    std::atomic<bool> _finished{false};
};

} // namespace Datapath::Streaming
