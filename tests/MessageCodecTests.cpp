/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../src/Streaming/Protocol/MessageCodec.h"
#include "../src/Streaming/Protocol/MessageSerializer.h"

using namespace Datapath::Streaming;

TEST(MessageCodecTests, MetadataFrameCarriesClientIdAndFlag) {
    auto encoded = encodeMetadata(ConnectionMetadata::forClient("worker-7", true));
    ASSERT_TRUE(encoded.success()) << encoded.errorMessage;

    auto decoded = decodeFrame(encoded.value);
    ASSERT_TRUE(decoded.success()) << decoded.errorMessage;
    ASSERT_TRUE(std::holds_alternative<ConnectionMetadata>(decoded.value));

    const auto& metadata = std::get<ConnectionMetadata>(decoded.value);
    EXPECT_EQ(metadata.clientId(), std::optional<std::string>("worker-7"));
    EXPECT_TRUE(metadata.reconnecting());
}

TEST(ConnectionMetadataTests, MalformedReconnectingIsFalse) {
    ConnectionMetadata metadata;
    metadata.set(METADATA_CLIENT_ID, "c1");
    EXPECT_FALSE(metadata.reconnecting());

    metadata.set(METADATA_RECONNECTING, "true");
    EXPECT_FALSE(metadata.reconnecting());

    metadata.set(METADATA_RECONNECTING, "True");
    EXPECT_TRUE(metadata.reconnecting());

    EXPECT_FALSE(ConnectionMetadata{}.clientId().has_value());
}

TEST(MessageCodecTests, GetRequestKeepsIdsAndOptions) {
    DataRequest request;
    request.reqId = 42;
    GetRequest get;
    get.ids = {{0x01, 0x02}, {0xFF}};
    get.timeoutSeconds = 2.5;
    get.asynchronous = true;
    request.payload = get;

    auto encoded = encodeRequest(request);
    ASSERT_TRUE(encoded.success()) << encoded.errorMessage;

    auto decoded = decodeRequest(encoded.value);
    ASSERT_TRUE(decoded.success()) << decoded.errorMessage;
    EXPECT_EQ(decoded.value, request);
    EXPECT_EQ(requestKind(decoded.value), RequestKind::Get);
    EXPECT_FALSE(shouldCache(decoded.value));
}

TEST(MessageCodecTests, AcknowledgeAndInitDecode) {
    DataRequest ack;
    ack.reqId = 5;
    ack.payload = AcknowledgeRequest{3};

    DataRequest init;
    init.reqId = 6;
    InitRequest initPayload;
    initPayload.jobConfig = {1, 2, 3};
    initPayload.initOptions = "{\"namespace\": \"test\"}";
    initPayload.reconnectGracePeriod = 30;
    init.payload = initPayload;

    for (const auto& request : {ack, init}) {
        auto encoded = encodeRequest(request);
        ASSERT_TRUE(encoded.success());
        auto decoded = decodeRequest(encoded.value);
        ASSERT_TRUE(decoded.success()) << decoded.errorMessage;
        EXPECT_EQ(decoded.value, request);
    }
}

TEST(MessageCodecTests, UnsetRequestDecodesToUnknownKind) {
    DataRequest request;
    request.reqId = 9;

    auto encoded = encodeRequest(request);
    ASSERT_TRUE(encoded.success());

    auto decoded = decodeRequest(encoded.value);
    ASSERT_TRUE(decoded.success()) << decoded.errorMessage;
    EXPECT_TRUE(std::holds_alternative<std::monostate>(decoded.value.payload));
    EXPECT_EQ(requestKind(decoded.value), RequestKind::Unknown);
}

TEST(MessageCodecTests, LargePutIsCompressedOnTheWire) {
    CodecOptions options;
    options.compressionThreshold = 64;

    DataRequest request;
    request.reqId = 1;
    PutRequest put;
    put.data.assign(64 * 1024, 0x5A);
    put.clientRefId = {0x10, 0x20};
    request.payload = put;

    auto encoded = encodeRequest(request, options);
    ASSERT_TRUE(encoded.success()) << encoded.errorMessage;
    EXPECT_LT(encoded.value.size(), put.data.size() / 4);

    auto decoded = decodeRequest(encoded.value, options);
    ASSERT_TRUE(decoded.success()) << decoded.errorMessage;
    EXPECT_EQ(std::get<PutRequest>(decoded.value.payload), put);
}

TEST(MessageCodecTests, OversizedDecompressedPayloadIsRejected) {
    CodecOptions sender;
    sender.compressionThreshold = 64;

    DataResponse response;
    response.reqId = 2;
    GetResponse get;
    get.valid = true;
    get.data.assign(8192, 0x00);
    response.payload = get;

    auto encoded = encodeResponse(response, sender);
    ASSERT_TRUE(encoded.success());

    CodecOptions receiver;
    receiver.maxMessageSize = 1024;
    auto decoded = decodeResponse(encoded.value, receiver);
    ASSERT_TRUE(decoded.failed());
    EXPECT_EQ(decoded.error, DatapathError::DecompressionFailed);
}

TEST(MessageCodecTests, ConnectionInfoResponseDecodes) {
    DataResponse response;
    response.reqId = 77;
    ConnectionInfoResponse info;
    info.numClients = 3;
    info.runtimeVersion = "C++ 202002";
    info.serverVersion = "1.2.3";
    info.serverCommit = "abc123";
    info.protocolVersion = PROTOCOL_VERSION;
    response.payload = info;

    auto encoded = encodeResponse(response);
    ASSERT_TRUE(encoded.success());
    auto decoded = decodeResponse(encoded.value);
    ASSERT_TRUE(decoded.success()) << decoded.errorMessage;
    EXPECT_EQ(decoded.value, response);
}

TEST(MessageCodecTests, StatusFrameDecodes) {
    auto encoded = encodeStatus(StreamStatus{StatusCode::NotFound, "gone"});
    ASSERT_TRUE(encoded.success());

    auto decoded = decodeFrame(encoded.value);
    ASSERT_TRUE(decoded.success());
    ASSERT_TRUE(std::holds_alternative<StreamStatus>(decoded.value));
    EXPECT_EQ(std::get<StreamStatus>(decoded.value).code, StatusCode::NotFound);
    EXPECT_EQ(std::get<StreamStatus>(decoded.value).details, "gone");
}

TEST(MessageCodecTests, WrongFrameKindIsInvalidMessage) {
    auto status = encodeStatus(StreamStatus{StatusCode::Ok, ""});
    ASSERT_TRUE(status.success());

    auto asRequest = decodeRequest(status.value);
    ASSERT_TRUE(asRequest.failed());
    EXPECT_EQ(asRequest.error, DatapathError::InvalidMessage);

    auto asResponse = decodeResponse(status.value);
    ASSERT_TRUE(asResponse.failed());
    EXPECT_EQ(asResponse.error, DatapathError::InvalidMessage);
}

TEST(MessageCodecTests, GarbageIsRejected) {
    EXPECT_TRUE(decodeFrame({}).failed());
    EXPECT_TRUE(decodeFrame({1, 2, 3}).failed());

    std::vector<uint8_t> junk(64, 0xFF);
    auto decoded = decodeFrame(junk);
    EXPECT_TRUE(decoded.failed());
}

TEST(MessageSerializerTests, CompressRoundTripAndLimit) {
    std::vector<uint8_t> data(10000, 0x42);
    auto compressed = compress(data);
    ASSERT_TRUE(compressed.success());
    EXPECT_LT(compressed.value.size(), data.size());

    auto restored = decompress(compressed.value, data.size());
    ASSERT_TRUE(restored.success());
    EXPECT_EQ(restored.value, data);

    EXPECT_TRUE(decompress(compressed.value, data.size() - 1).failed());
    EXPECT_TRUE(decompress({0x00, 0x01, 0x02, 0x03}, 1024).failed());
}
