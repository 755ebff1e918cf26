/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file ErrorCodes.h
 * @brief Error handling types for the Datapath servicer
 *
 * Defines plumbing error codes, per-connection status codes and the result
 * types used throughout the streaming layer.
 */

#pragma once

#include <optional>
#include <string>

namespace Datapath {
namespace Streaming {

/**
 * @brief Error codes for plumbing operations
 */
enum class DatapathError {
    None,                       ///< No error
    InvalidMessage,             ///< Malformed or invalid message
    SerializationFailed,        ///< Failed to serialize message
    DeserializationFailed,      ///< Failed to deserialize message
    CompressionFailed,          ///< Failed to compress data
    DecompressionFailed,        ///< Failed to decompress data
    ConnectionClosed,           ///< Stream was closed
    Timeout,                    ///< Operation timed out
    InvalidParameter,           ///< Invalid parameter provided
    ResourceExhausted,          ///< Client threshold reached, admission refused
    SessionNotFound             ///< Reconnect to a session that was already cleaned up
};

/**
 * @brief Convert error code to human-readable string
 * @param error The error code
 * @return Description of the error
 */
inline const char* errorToString(DatapathError error) {
    switch (error) {
        case DatapathError::None: return "No error";
        case DatapathError::InvalidMessage: return "Invalid message";
        case DatapathError::SerializationFailed: return "Serialization failed";
        case DatapathError::DeserializationFailed: return "Deserialization failed";
        case DatapathError::CompressionFailed: return "Compression failed";
        case DatapathError::DecompressionFailed: return "Decompression failed";
        case DatapathError::ConnectionClosed: return "Connection closed";
        case DatapathError::Timeout: return "Timeout";
        case DatapathError::InvalidParameter: return "Invalid parameter";
        case DatapathError::ResourceExhausted: return "Resource exhausted";
        case DatapathError::SessionNotFound: return "Session not found";
        default: return "Unknown error";
    }
}

/**
 * @brief Final status reported to the peer when a stream ends
 *
 * Mirrors the status codes of common streaming RPC stacks so that a client can
 * tell an admission rejection from a session that can no longer be resumed.
 */
enum class StatusCode {
    Ok,
    Cancelled,
    InvalidArgument,
    DeadlineExceeded,
    NotFound,
    ResourceExhausted,
    FailedPrecondition,
    Aborted,
    Unimplemented,
    Internal,
    Unavailable
};

inline const char* statusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::Ok: return "OK";
        case StatusCode::Cancelled: return "CANCELLED";
        case StatusCode::InvalidArgument: return "INVALID_ARGUMENT";
        case StatusCode::DeadlineExceeded: return "DEADLINE_EXCEEDED";
        case StatusCode::NotFound: return "NOT_FOUND";
        case StatusCode::ResourceExhausted: return "RESOURCE_EXHAUSTED";
        case StatusCode::FailedPrecondition: return "FAILED_PRECONDITION";
        case StatusCode::Aborted: return "ABORTED";
        case StatusCode::Unimplemented: return "UNIMPLEMENTED";
        case StatusCode::Internal: return "INTERNAL";
        case StatusCode::Unavailable: return "UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Status codes after which a session must not be resumed
 */
inline bool isUnrecoverableStatus(StatusCode code) {
    return code == StatusCode::InvalidArgument ||
           code == StatusCode::NotFound ||
           code == StatusCode::FailedPrecondition ||
           code == StatusCode::Aborted;
}

/**
 * @brief Result type for operations that may fail
 *
 * Encapsulates a value and an error code. Check success() before accessing value.
 *
 * @code
 * auto result = registry.admit(clientId, reconnecting, now);
 * if (result.success()) {
 *     useTicket(result.value);
 * } else {
 *     reject(result.error, result.errorMessage);
 * }
 * @endcode
 */
template<typename T>
struct Result {
    T value;                    ///< Result value (valid only if error == None)
    DatapathError error;        ///< Error code
    std::string errorMessage;   ///< Optional detailed error message

    bool success() const {
        return error == DatapathError::None;
    }

    bool failed() const {
        return error != DatapathError::None;
    }

    static Result<T> ok(T val) {
        return Result<T>{std::move(val), DatapathError::None, ""};
    }

    static Result<T> err(DatapathError err, std::string message = "") {
        return Result<T>{T{}, err, std::move(message)};
    }
};

/**
 * @brief Result specialization for void operations
 */
template<>
struct Result<void> {
    DatapathError error;
    std::string errorMessage;

    bool success() const { return error == DatapathError::None; }
    bool failed() const { return error != DatapathError::None; }

    static Result<void> ok() {
        return Result<void>{DatapathError::None, ""};
    }

    static Result<void> err(DatapathError err, std::string message = "") {
        return Result<void>{err, std::move(message)};
    }
};

} // namespace Streaming
} // namespace Datapath
