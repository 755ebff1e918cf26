/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file MessageSerializer.h
 * @brief Cap'n Proto flat-array serialization and zstd compression helpers
 */

#pragma once

#include <capnp/message.h>
#include <capnp/serialize.h>

#include <cstdint>
#include <vector>

#include "../Core/ErrorCodes.h"

namespace Datapath
{
namespace Streaming
{

/**
 * @brief Flatten a built frame into bytes ready for FramedSocket::sendFrame()
 */
Result<std::vector<uint8_t>> serialize(capnp::MessageBuilder& builder);

/**
 * @brief Copy a serialized message into word-aligned storage
 *
 * The returned words can be handed to capnp::FlatArrayMessageReader.
 *
 * @param buffer Serialized message bytes
 * @return Result containing the aligned words, or DeserializationFailed
 */
Result<kj::Array<capnp::word>> deserialize(const std::vector<uint8_t>& buffer);

/**
 * @brief zstd-compress an object payload that crossed the compression threshold
 * @param compressionLevel zstd level, 1-22
 */
Result<std::vector<uint8_t>> compress(const std::vector<uint8_t>& data, int compressionLevel = 3);

/**
 * @brief Decompress zstd-compressed data
 *
 * @param compressedData Compressed data
 * @param maxSize Largest decompressed size accepted
 * @return Result containing decompressed data or error
 */
Result<std::vector<uint8_t>> decompress(const std::vector<uint8_t>& compressedData, size_t maxSize);

}  // namespace Streaming
}  // namespace Datapath
