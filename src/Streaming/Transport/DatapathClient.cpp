/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "DatapathClient.h"

#include <Logging/Logger.h>

#include <format>

namespace Datapath::Streaming {

DatapathClient::DatapathClient(CodecOptions options)
    : _options(options)
{
}

DatapathClient::~DatapathClient() {
    disconnect();
}

Result<void> DatapathClient::connect(const std::string& socketPath, const ClientId& clientId, bool reconnecting) {
    // A previous stream of this client is abandoned, as after a lost connection
    disconnect();

    auto socket = FramedSocket::connect(socketPath, _options.maxMessageSize);
    if (socket.failed()) {
        return Result<void>::err(socket.error, socket.errorMessage);
    }

    auto metadata = encodeMetadata(ConnectionMetadata::forClient(clientId, reconnecting));
    if (metadata.failed()) {
        return Result<void>::err(metadata.error, metadata.errorMessage);
    }

    auto sent = socket.value->sendFrame(metadata.value);
    if (sent.failed()) {
        return sent;
    }

    _socket = std::move(socket.value);
    _clientId = clientId;
    _lastStatus.reset();
    ENTROPY_LOG_DEBUG_CAT("DatapathClient",
        std::format("{} {} to {}", clientId, reconnecting ? "reconnected" : "connected", socketPath));
    return Result<void>::ok();
}

Result<void> DatapathClient::send(const DataRequest& request) {
    if (!_socket) {
        return Result<void>::err(DatapathError::ConnectionClosed, "Not connected");
    }

    auto bytes = encodeRequest(request, _options);
    if (bytes.failed()) {
        return Result<void>::err(bytes.error, bytes.errorMessage);
    }
    return _socket->sendFrame(bytes.value);
}

Result<ClientEvent> DatapathClient::receive() {
    if (!_socket) {
        return Result<ClientEvent>::err(DatapathError::ConnectionClosed, "Not connected");
    }

    auto bytes = _socket->receiveFrame();
    if (bytes.failed()) {
        return Result<ClientEvent>::err(bytes.error, bytes.errorMessage);
    }
    if (!bytes.value) {
        return Result<ClientEvent>::err(DatapathError::ConnectionClosed, "Stream ended without a status");
    }

    auto frame = decodeFrame(*bytes.value, _options);
    if (frame.failed()) {
        return Result<ClientEvent>::err(frame.error, frame.errorMessage);
    }

    if (auto* response = std::get_if<DataResponse>(&frame.value)) {
        return Result<ClientEvent>::ok(ClientEvent{std::move(*response)});
    }
    if (auto* status = std::get_if<StreamStatus>(&frame.value)) {
        _lastStatus = *status;
        return Result<ClientEvent>::ok(ClientEvent{std::move(*status)});
    }
    return Result<ClientEvent>::err(DatapathError::InvalidMessage, "Unexpected frame from server");
}

Result<DataResponse> DatapathClient::call(const DataRequest& request) {
    auto sent = send(request);
    if (sent.failed()) {
        return Result<DataResponse>::err(sent.error, sent.errorMessage);
    }

    auto event = receive();
    if (event.failed()) {
        return Result<DataResponse>::err(event.error, event.errorMessage);
    }
    if (auto* status = std::get_if<StreamStatus>(&event.value)) {
        return Result<DataResponse>::err(DatapathError::ConnectionClosed,
            std::format("Stream finished with {}: {}", statusCodeToString(status->code), status->details));
    }
    return Result<DataResponse>::ok(std::get<DataResponse>(std::move(event.value)));
}

void DatapathClient::closeSend() {
    if (_socket) {
        _socket->shutdownWrite();
    }
}

void DatapathClient::disconnect() {
    if (_socket) {
        _socket->shutdown();
        _socket.reset();
    }
}

uint64_t DatapathClient::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<DatapathClient>().id);
    return hash;
}

std::string DatapathClient::toString() const {
    return std::format("{}@{}(client={}, connected={})", className(), static_cast<const void*>(this),
                       _clientId, isConnected() ? "true" : "false");
}

} // namespace Datapath::Streaming
