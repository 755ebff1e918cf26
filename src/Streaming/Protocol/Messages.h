/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file Messages.h
 * @brief In-memory request and response messages of the data stream
 *
 * Each request and response is a request id plus a tagged payload. The wire
 * encoding lives in MessageCodec; everything above the transport works with
 * these types.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "../Core/DatapathTypes.h"
#include "../Core/ErrorCodes.h"

namespace Datapath::Streaming {

// Request payloads

struct InitRequest {
    std::vector<uint8_t> jobConfig;
    std::string initOptions;            ///< Serialized init keyword options
    int32_t reconnectGracePeriod = 0;   ///< Seconds; 0 disables reconnection

    bool operator==(const InitRequest&) const = default;
};

struct GetRequest {
    std::vector<ObjectId> ids;
    double timeoutSeconds = -1.0;       ///< Negative waits indefinitely
    bool asynchronous = false;

    bool operator==(const GetRequest&) const = default;
};

struct PutRequest {
    std::vector<uint8_t> data;
    std::vector<uint8_t> clientRefId;

    bool operator==(const PutRequest&) const = default;
};

struct ReleaseRequest {
    std::vector<ObjectId> ids;

    bool operator==(const ReleaseRequest&) const = default;
};

struct ConnectionInfoRequest {
    bool operator==(const ConnectionInfoRequest&) const = default;
};

struct PrepRuntimeEnvRequest {
    std::vector<uint8_t> jobConfig;

    bool operator==(const PrepRuntimeEnvRequest&) const = default;
};

struct ConnectionCleanupRequest {
    bool operator==(const ConnectionCleanupRequest&) const = default;
};

struct AcknowledgeRequest {
    RequestId reqId = 0;

    bool operator==(const AcknowledgeRequest&) const = default;
};

// Response payloads

struct InitResponse {
    bool ok = false;
    std::string message;

    bool operator==(const InitResponse&) const = default;
};

struct GetResponse {
    bool valid = false;
    std::vector<uint8_t> data;
    std::string error;

    bool operator==(const GetResponse&) const = default;
};

struct PutResponse {
    ObjectId id;
    bool valid = false;
    std::string error;

    bool operator==(const PutResponse&) const = default;
};

struct ReleaseResponse {
    std::vector<bool> ok;               ///< One flag per requested id, in request order

    bool operator==(const ReleaseResponse&) const = default;
};

struct ConnectionInfoResponse {
    int32_t numClients = 0;
    std::string runtimeVersion;
    std::string serverVersion;
    std::string serverCommit;
    int32_t protocolVersion = 0;

    bool operator==(const ConnectionInfoResponse&) const = default;
};

struct PrepRuntimeEnvResponse {
    std::vector<uint8_t> jobConfig;

    bool operator==(const PrepRuntimeEnvResponse&) const = default;
};

struct ConnectionCleanupResponse {
    bool operator==(const ConnectionCleanupResponse&) const = default;
};

/**
 * @brief Request payload; std::monostate marks a payload of no known kind
 */
using RequestPayload = std::variant<std::monostate,
                                    InitRequest,
                                    GetRequest,
                                    PutRequest,
                                    ReleaseRequest,
                                    ConnectionInfoRequest,
                                    PrepRuntimeEnvRequest,
                                    ConnectionCleanupRequest,
                                    AcknowledgeRequest>;

using ResponsePayload = std::variant<InitResponse,
                                     GetResponse,
                                     PutResponse,
                                     ReleaseResponse,
                                     ConnectionInfoResponse,
                                     PrepRuntimeEnvResponse,
                                     ConnectionCleanupResponse>;

struct DataRequest {
    RequestId reqId = 0;
    RequestPayload payload;

    bool operator==(const DataRequest&) const = default;
};

struct DataResponse {
    RequestId reqId = 0;
    ResponsePayload payload;

    bool operator==(const DataResponse&) const = default;
};

/**
 * @brief Final status of a stream as reported to the peer
 */
struct StreamStatus {
    StatusCode code = StatusCode::Ok;
    std::string details;

    bool operator==(const StreamStatus&) const = default;
};

/**
 * @brief Discriminant of a request payload
 */
enum class RequestKind {
    Unknown,
    Init,
    Get,
    Put,
    Release,
    ConnectionInfo,
    PrepRuntimeEnv,
    ConnectionCleanup,
    Acknowledge
};

RequestKind requestKind(const DataRequest& request) noexcept;
const char* requestKindToString(RequestKind kind) noexcept;

/**
 * @brief Whether the response to a request is stored for replay
 *
 * Gets, acknowledgments and cleanup requests are idempotent and are never
 * cached; get responses can also be large.
 */
bool shouldCache(const DataRequest& request) noexcept;

} // namespace Datapath::Streaming
