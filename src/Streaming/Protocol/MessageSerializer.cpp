/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "MessageSerializer.h"
#include <zstd.h>
#include <kj/array.h>
#include <kj/exception.h>

#include <cstring>

namespace Datapath {
namespace Streaming {

Result<std::vector<uint8_t>> serialize(capnp::MessageBuilder& builder) {
    try {
        kj::Array<capnp::word> words = capnp::messageToFlatArray(builder);

        const uint8_t* bytes = reinterpret_cast<const uint8_t*>(words.begin());
        size_t byteSize = words.size() * sizeof(capnp::word);

        std::vector<uint8_t> result(bytes, bytes + byteSize);
        return Result<std::vector<uint8_t>>::ok(std::move(result));

    } catch (const kj::Exception& e) {
        return Result<std::vector<uint8_t>>::err(
            DatapathError::SerializationFailed,
            std::string("Serialization failed: ") + e.getDescription().cStr()
        );
    } catch (const std::exception& e) {
        return Result<std::vector<uint8_t>>::err(
            DatapathError::SerializationFailed,
            std::string("Serialization failed: ") + e.what()
        );
    }
}

Result<kj::Array<capnp::word>> deserialize(const std::vector<uint8_t>& buffer) {
    if (buffer.empty()) {
        return Result<kj::Array<capnp::word>>::err(
            DatapathError::DeserializationFailed,
            "Empty buffer"
        );
    }

    // Ensure buffer size is multiple of word size
    if (buffer.size() % sizeof(capnp::word) != 0) {
        return Result<kj::Array<capnp::word>>::err(
            DatapathError::DeserializationFailed,
            "Buffer size not aligned to word boundary"
        );
    }

    size_t wordCount = buffer.size() / sizeof(capnp::word);
    auto words = kj::heapArray<capnp::word>(wordCount);
    std::memcpy(words.begin(), buffer.data(), buffer.size());

    return Result<kj::Array<capnp::word>>::ok(kj::mv(words));
}

Result<std::vector<uint8_t>> compress(const std::vector<uint8_t>& data, int compressionLevel) {
    size_t maxCompressedSize = ZSTD_compressBound(data.size());
    std::vector<uint8_t> compressed(maxCompressedSize);

    size_t compressedSize = ZSTD_compress(
        compressed.data(),
        compressed.size(),
        data.data(),
        data.size(),
        compressionLevel
    );

    if (ZSTD_isError(compressedSize)) {
        return Result<std::vector<uint8_t>>::err(
            DatapathError::CompressionFailed,
            std::string("Compression failed: ") + ZSTD_getErrorName(compressedSize)
        );
    }

    compressed.resize(compressedSize);
    return Result<std::vector<uint8_t>>::ok(std::move(compressed));
}

Result<std::vector<uint8_t>> decompress(const std::vector<uint8_t>& compressedData, size_t maxSize) {
    unsigned long long decompressedSize = ZSTD_getFrameContentSize(
        compressedData.data(),
        compressedData.size()
    );

    if (decompressedSize == ZSTD_CONTENTSIZE_ERROR) {
        return Result<std::vector<uint8_t>>::err(
            DatapathError::DecompressionFailed,
            "Not compressed by zstd"
        );
    }

    if (decompressedSize == ZSTD_CONTENTSIZE_UNKNOWN) {
        return Result<std::vector<uint8_t>>::err(
            DatapathError::DecompressionFailed,
            "Original size unknown"
        );
    }

    if (decompressedSize > maxSize) {
        return Result<std::vector<uint8_t>>::err(
            DatapathError::DecompressionFailed,
            "Decompressed size exceeds message limit"
        );
    }

    std::vector<uint8_t> decompressed(static_cast<size_t>(decompressedSize));

    size_t actualSize = ZSTD_decompress(
        decompressed.data(),
        decompressed.size(),
        compressedData.data(),
        compressedData.size()
    );

    if (ZSTD_isError(actualSize)) {
        return Result<std::vector<uint8_t>>::err(
            DatapathError::DecompressionFailed,
            std::string("Decompression failed: ") + ZSTD_getErrorName(actualSize)
        );
    }

    decompressed.resize(actualSize);
    return Result<std::vector<uint8_t>>::ok(std::move(decompressed));
}

} // namespace Streaming
} // namespace Datapath
