/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "../src/Streaming/Session/IntakeReader.h"
#include "../src/Streaming/Session/RequestQueue.h"
#include "MockDataStream.h"

using namespace Datapath::Streaming;
using namespace Datapath::Streaming::Tests;

TEST(RequestQueueTests, PopsInPushOrder) {
    RequestQueue queue;
    DataRequest a; a.reqId = 1;
    DataResponse b; b.reqId = 2;
    queue.push(a);
    queue.push(b);
    queue.push(EndOfStream{});
    EXPECT_EQ(queue.size(), 3u);

    auto first = queue.pop();
    ASSERT_TRUE(std::holds_alternative<DataRequest>(first));
    EXPECT_EQ(std::get<DataRequest>(first).reqId, 1);

    auto second = queue.pop();
    ASSERT_TRUE(std::holds_alternative<DataResponse>(second));
    EXPECT_EQ(std::get<DataResponse>(second).reqId, 2);

    EXPECT_TRUE(std::holds_alternative<EndOfStream>(queue.pop()));
    EXPECT_EQ(queue.size(), 0u);
}

TEST(RequestQueueTests, PopBlocksUntilPush) {
    RequestQueue queue;
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        queue.push(EndOfStream{});
    });
    EXPECT_TRUE(std::holds_alternative<EndOfStream>(queue.pop()));
    producer.join();
}

TEST(IntakeReaderTests, ForwardsRequestsThenEndOfStream) {
    auto stream = MockDataStream::forClient("reader");
    auto queue = std::make_shared<RequestQueue>();

    DataRequest r1; r1.reqId = 1; r1.payload = ConnectionInfoRequest{};
    DataRequest r2; r2.reqId = 2; r2.payload = ConnectionCleanupRequest{};
    stream->push(r1);
    stream->push(r2);
    stream->endInbound();

    IntakeReader reader(stream, queue);
    reader.start();
    EXPECT_TRUE(reader.join(std::chrono::seconds(5)));
    EXPECT_TRUE(reader.finished());

    EXPECT_EQ(std::get<DataRequest>(queue.pop()).reqId, 1);
    EXPECT_EQ(std::get<DataRequest>(queue.pop()).reqId, 2);
    EXPECT_TRUE(std::holds_alternative<EndOfStream>(queue.pop()));
}

TEST(IntakeReaderTests, StreamErrorStillPushesEndOfStream) {
    auto stream = MockDataStream::forClient("reader");
    auto queue = std::make_shared<RequestQueue>();
    stream->failInbound("connection reset");

    IntakeReader reader(stream, queue);
    reader.start();
    EXPECT_TRUE(reader.join(std::chrono::seconds(5)));
    EXPECT_TRUE(std::holds_alternative<EndOfStream>(queue.pop()));
}

TEST(IntakeReaderTests, JoinTimesOutOnBlockedStream) {
    auto stream = MockDataStream::forClient("reader");
    auto queue = std::make_shared<RequestQueue>();

    IntakeReader reader(stream, queue);
    reader.start();
    EXPECT_FALSE(reader.join(std::chrono::milliseconds(50)));
    EXPECT_FALSE(reader.finished());

    // Detached reader still finishes once the stream is released
    stream->cancel();
    EXPECT_TRUE(std::holds_alternative<EndOfStream>(queue.pop()));
}
