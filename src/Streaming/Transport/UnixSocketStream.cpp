/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "UnixSocketStream.h"

#include <Logging/Logger.h>

#include <format>

namespace Datapath::Streaming {

Result<std::shared_ptr<UnixSocketStream>> UnixSocketStream::open(std::shared_ptr<FramedSocket> socket,
                                                                 CodecOptions options) {
    using R = Result<std::shared_ptr<UnixSocketStream>>;

    auto first = socket->receiveFrame();
    if (first.failed()) {
        return R::err(first.error, first.errorMessage);
    }
    if (!first.value) {
        return R::err(DatapathError::ConnectionClosed, "Connection closed before metadata was sent");
    }

    auto frame = decodeFrame(*first.value, options);
    if (frame.failed()) {
        return R::err(frame.error, frame.errorMessage);
    }

    auto* metadata = std::get_if<ConnectionMetadata>(&frame.value);
    if (!metadata) {
        return R::err(DatapathError::InvalidMessage, "First frame of a stream must carry connection metadata");
    }

    return R::ok(std::make_shared<UnixSocketStream>(std::move(socket), std::move(*metadata), options));
}

UnixSocketStream::UnixSocketStream(std::shared_ptr<FramedSocket> socket, ConnectionMetadata metadata,
                                   CodecOptions options)
    : _socket(std::move(socket))
    , _metadata(std::move(metadata))
    , _options(options)
{
}

UnixSocketStream::~UnixSocketStream() {
    _socket->shutdown();
}

Result<std::optional<DataRequest>> UnixSocketStream::read() {
    using R = Result<std::optional<DataRequest>>;

    auto bytes = _socket->receiveFrame();
    if (bytes.failed()) {
        return R::err(bytes.error, bytes.errorMessage);
    }
    if (!bytes.value) {
        return R::ok(std::nullopt);
    }

    auto request = decodeRequest(*bytes.value, _options);
    if (request.failed()) {
        return R::err(request.error, request.errorMessage);
    }
    return R::ok(std::move(request.value));
}

Result<void> UnixSocketStream::write(const DataResponse& response) {
    if (finished()) {
        return Result<void>::err(DatapathError::ConnectionClosed, "Stream already finished");
    }

    auto bytes = encodeResponse(response, _options);
    if (bytes.failed()) {
        return Result<void>::err(bytes.error, bytes.errorMessage);
    }
    return _socket->sendFrame(bytes.value);
}

void UnixSocketStream::finish(StatusCode code, const std::string& details) {
    if (_finished.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    StreamStatus status;
    status.code = code;
    status.details = details;

    auto bytes = encodeStatus(status);
    if (bytes.success()) {
        auto sent = _socket->sendFrame(bytes.value);
        if (sent.failed()) {
            ENTROPY_LOG_DEBUG_CAT("UnixSocketStream",
                std::format("Could not deliver final status {}: {}", statusCodeToString(code), sent.errorMessage));
        }
    } else {
        ENTROPY_LOG_ERROR_CAT("UnixSocketStream", std::format("Encoding final status failed: {}", bytes.errorMessage));
    }

    _socket->shutdown();
}

void UnixSocketStream::cancel() {
    _finished.store(true, std::memory_order_release);
    _socket->shutdown();
}

uint64_t UnixSocketStream::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<UnixSocketStream>().id);
    return hash;
}

std::string UnixSocketStream::toString() const {
    return std::format("{}@{}(client={}, finished={})", className(), static_cast<const void*>(this),
                       _metadata.clientId().value_or("<none>"), finished() ? "true" : "false");
}

} // namespace Datapath::Streaming
