/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file MessageCodec.h
 * @brief Conversion between in-memory messages and Cap'n Proto frames
 *
 * Every frame on the wire is a Wire::Frame carrying exactly one of: connection
 * metadata, a request, a response, or the final stream status.
 */

#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "../Core/DatapathTypes.h"
#include "../Core/ErrorCodes.h"
#include "ConnectionMetadata.h"
#include "Messages.h"

namespace Datapath::Streaming {

struct CodecOptions {
    size_t compressionThreshold = DEFAULT_COMPRESSION_THRESHOLD;  ///< Object payloads above this are compressed
    size_t maxMessageSize = DEFAULT_MAX_MESSAGE_SIZE;             ///< Upper bound for decompressed payloads
};

/// One decoded frame
using DecodedFrame = std::variant<ConnectionMetadata, DataRequest, DataResponse, StreamStatus>;

Result<std::vector<uint8_t>> encodeMetadata(const ConnectionMetadata& metadata);
Result<std::vector<uint8_t>> encodeRequest(const DataRequest& request, const CodecOptions& options = {});
Result<std::vector<uint8_t>> encodeResponse(const DataResponse& response, const CodecOptions& options = {});
Result<std::vector<uint8_t>> encodeStatus(const StreamStatus& status);

/**
 * @brief Decode one frame
 *
 * A request whose payload kind is not known to this build decodes to a
 * DataRequest with an empty (std::monostate) payload; the dispatch loop
 * rejects it.
 *
 * @param bytes Serialized frame
 * @param options Decompression limits
 * @return Result with the decoded frame, or DeserializationFailed/InvalidMessage
 */
Result<DecodedFrame> decodeFrame(const std::vector<uint8_t>& bytes, const CodecOptions& options = {});

/// Decode a frame that must carry a request
Result<DataRequest> decodeRequest(const std::vector<uint8_t>& bytes, const CodecOptions& options = {});

/// Decode a frame that must carry a response
Result<DataResponse> decodeResponse(const std::vector<uint8_t>& bytes, const CodecOptions& options = {});

} // namespace Datapath::Streaming
