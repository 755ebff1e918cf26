/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include <gtest/gtest.h>
#include <Concurrency/WorkService.h>
#include <Concurrency/WorkContractGroup.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "../src/Streaming/Service/InMemoryBackend.h"

using namespace Datapath::Streaming;
using EntropyEngine::Core::Concurrency::WorkContractGroup;
using EntropyEngine::Core::Concurrency::WorkService;

namespace {

// Collects async get completions; shared so late completions stay safe
struct Deliveries {
    std::mutex mx;
    std::condition_variable cv;
    std::vector<GetResponse> responses;

    BackendService::GetCompletion sink(const std::shared_ptr<Deliveries>& self) {
        return [self](GetResponse response) {
            std::lock_guard<std::mutex> lk(self->mx);
            self->responses.push_back(std::move(response));
            self->cv.notify_all();
        };
    }

    bool waitFor(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lk(mx);
        return cv.wait_for(lk, timeout, [&] { return responses.size() >= count; });
    }

    size_t count() {
        std::lock_guard<std::mutex> lk(mx);
        return responses.size();
    }
};

GetRequest asyncGet(std::vector<ObjectId> ids, double timeoutSeconds) {
    GetRequest get;
    get.ids = std::move(ids);
    get.timeoutSeconds = timeoutSeconds;
    get.asynchronous = true;
    return get;
}

class InMemoryBackendFixture : public ::testing::Test
{
protected:
    void SetUp() override {
        workService = std::make_unique<WorkService>(WorkService::Config{});
        workService->start();

        asyncGroup = std::make_unique<WorkContractGroup>(256, "AsyncGets");
        workService->addWorkContractGroup(asyncGroup.get());

        backend = std::make_shared<InMemoryBackend>(asyncGroup.get());
    }

    void TearDown() override {
        // Backend first: it waits for its outstanding async gets
        backend.reset();
        if (workService) {
            workService->stop();
        }
        asyncGroup.reset();
        workService.reset();
    }

    ObjectId put(const ClientId& client, std::vector<uint8_t> data, std::vector<uint8_t> ref = {}) {
        PutRequest request;
        request.data = std::move(data);
        request.clientRefId = std::move(ref);
        auto response = backend->putObject(request, client);
        EXPECT_TRUE(response.valid);
        return response.id;
    }

    std::unique_ptr<WorkService> workService;
    std::unique_ptr<WorkContractGroup> asyncGroup;
    std::shared_ptr<InMemoryBackend> backend;
};

} // namespace

TEST_F(InMemoryBackendFixture, PutThenGetReturnsPackedObjects) {
    auto a = put("c1", {1, 2, 3});
    auto b = put("c1", {9});
    EXPECT_EQ(a.size(), 16u);
    EXPECT_NE(a, b);

    GetRequest get;
    get.ids = {a, b};
    get.timeoutSeconds = 1.0;
    auto response = backend->getObject(get, "c1");
    ASSERT_TRUE(response.valid) << response.error;

    auto objects = InMemoryBackend::unpackObjects(response.data);
    ASSERT_TRUE(objects.has_value());
    ASSERT_EQ(objects->size(), 2u);
    EXPECT_EQ((*objects)[0], (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ((*objects)[1], (std::vector<uint8_t>{9}));
}

TEST_F(InMemoryBackendFixture, GetTimesOutOnMissingObject) {
    GetRequest get;
    get.ids = {ObjectId(16, 0xEE)};
    get.timeoutSeconds = 0.05;

    auto response = backend->getObject(get, "c1");
    EXPECT_FALSE(response.valid);
    EXPECT_NE(response.error.find("GetTimeoutError"), std::string::npos);
}

TEST_F(InMemoryBackendFixture, ClientRefIdDeduplicatesPuts) {
    auto first = put("c1", {1}, {0xAB});
    auto again = put("c1", {1}, {0xAB});
    auto other = put("c2", {1}, {0xAB});

    EXPECT_EQ(first, again);
    EXPECT_NE(first, other);
    EXPECT_EQ(backend->objectCount(), 2u);
    EXPECT_EQ(backend->referencesHeldBy("c1"), 1u);
}

TEST_F(InMemoryBackendFixture, ReleaseDropsObjectWhenUnreferenced) {
    auto id = put("c1", {5});
    EXPECT_TRUE(backend->release("c1", id));
    EXPECT_FALSE(backend->release("c1", id));
    EXPECT_EQ(backend->objectCount(), 0u);

    EXPECT_FALSE(backend->release("c1", ObjectId{}));
}

TEST_F(InMemoryBackendFixture, ReleaseAllOnlyAffectsThatClient) {
    put("c1", {1});
    put("c1", {2});
    put("c2", {3});

    backend->releaseAll("c1");
    EXPECT_EQ(backend->referencesHeldBy("c1"), 0u);
    EXPECT_EQ(backend->referencesHeldBy("c2"), 1u);
    EXPECT_EQ(backend->objectCount(), 1u);
}

TEST_F(InMemoryBackendFixture, AsyncGetReadyObjectReturnsImmediately) {
    auto id = put("c1", {7});
    GetRequest get;
    get.ids = {id};
    get.asynchronous = true;

    bool completed = false;
    auto ready = backend->asyncGetObject(get, "c1", 3, [&](GetResponse) { completed = true; });
    ASSERT_TRUE(ready.has_value());
    EXPECT_TRUE(ready->valid);
    EXPECT_FALSE(completed);
}

TEST_F(InMemoryBackendFixture, AsyncGetCompletesWhenObjectArrives) {
    std::mutex mx;
    std::condition_variable cv;
    std::optional<GetResponse> delivered;

    // Ids are salt + counter, so the next id follows from the last one
    auto last = put("producer", {0x10});
    ObjectId next = last;
    next.back() = static_cast<uint8_t>(next.back() + 1);

    GetRequest get;
    get.ids = {next};
    get.timeoutSeconds = 5.0;
    get.asynchronous = true;
    auto ready = backend->asyncGetObject(get, "c1", 4, [&](GetResponse response) {
        std::lock_guard<std::mutex> lk(mx);
        delivered = std::move(response);
        cv.notify_all();
    });
    EXPECT_FALSE(ready.has_value());

    EXPECT_EQ(put("producer", {0x11}), next);

    std::unique_lock<std::mutex> lk(mx);
    ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(10), [&] { return delivered.has_value(); }));
    ASSERT_TRUE(delivered->valid) << delivered->error;
    auto objects = InMemoryBackend::unpackObjects(delivered->data);
    ASSERT_TRUE(objects.has_value());
    EXPECT_EQ(objects->front(), (std::vector<uint8_t>{0x11}));
}

TEST_F(InMemoryBackendFixture, ParkedAsyncGetsDoNotStarveLaterGets) {
    auto deliveries = std::make_shared<Deliveries>();

    // Far more never-satisfied gets than there are worker threads
    for (uint8_t i = 0; i < 64; ++i) {
        auto ready = backend->asyncGetObject(asyncGet({ObjectId{0xEE, i}}, -1.0), "idle", i,
                                             deliveries->sink(deliveries));
        ASSERT_FALSE(ready.has_value());
    }
    EXPECT_EQ(backend->pendingAsyncGets(), 64u);

    auto last = put("producer", {0x20});
    ObjectId next = last;
    next.back() = static_cast<uint8_t>(next.back() + 1);

    auto arrived = std::make_shared<Deliveries>();
    EXPECT_FALSE(backend->asyncGetObject(asyncGet({next}, 5.0), "c1", 100, arrived->sink(arrived)).has_value());
    put("producer", {0x21});

    ASSERT_TRUE(arrived->waitFor(1));
    EXPECT_TRUE(arrived->responses[0].valid);
    EXPECT_EQ(backend->pendingAsyncGets(), 64u);
    EXPECT_EQ(deliveries->count(), 0u);
}

TEST_F(InMemoryBackendFixture, ParkedAsyncGetTimesOut) {
    auto deliveries = std::make_shared<Deliveries>();
    auto ready = backend->asyncGetObject(asyncGet({ObjectId{0xEE}}, 0.05), "c1", 1,
                                         deliveries->sink(deliveries));
    ASSERT_FALSE(ready.has_value());

    ASSERT_TRUE(deliveries->waitFor(1));
    EXPECT_FALSE(deliveries->responses[0].valid);
    EXPECT_NE(deliveries->responses[0].error.find("GetTimeoutError"), std::string::npos);
    EXPECT_EQ(backend->pendingAsyncGets(), 0u);
}

TEST_F(InMemoryBackendFixture, ShutdownFailsParkedAsyncGets) {
    auto deliveries = std::make_shared<Deliveries>();
    backend->asyncGetObject(asyncGet({ObjectId{0xEE}}, -1.0), "c1", 1, deliveries->sink(deliveries));
    backend->asyncGetObject(asyncGet({ObjectId{0xEF}}, 30.0), "c2", 2, deliveries->sink(deliveries));
    ASSERT_EQ(backend->pendingAsyncGets(), 2u);

    backend->shutdown();

    ASSERT_TRUE(deliveries->waitFor(2));
    for (const auto& response : deliveries->responses) {
        EXPECT_FALSE(response.valid);
        EXPECT_NE(response.error.find("shut down"), std::string::npos);
    }
    EXPECT_EQ(backend->pendingAsyncGets(), 0u);
}

TEST_F(InMemoryBackendFixture, DestroyingBackendCompletesParkedGetsOnce) {
    auto deliveries = std::make_shared<Deliveries>();
    backend->asyncGetObject(asyncGet({ObjectId{0xEE}}, -1.0), "c1", 1, deliveries->sink(deliveries));

    backend.reset();

    EXPECT_EQ(deliveries->count(), 1u);
    EXPECT_FALSE(deliveries->responses[0].valid);
}

TEST(InMemoryBackendWithoutGroup, AsyncGetFailsFast) {
    InMemoryBackend backend(nullptr);
    bool called = false;
    auto ready = backend.asyncGetObject(asyncGet({ObjectId{0xEE}}, -1.0), "c1", 1,
                                        [&](GetResponse) { called = true; });
    ASSERT_TRUE(ready.has_value());
    EXPECT_FALSE(ready->valid);
    EXPECT_FALSE(called);
    EXPECT_EQ(backend.pendingAsyncGets(), 0u);
}

TEST_F(InMemoryBackendFixture, ShutdownFailsOutstandingGetsAndClearsStore) {
    put("c1", {1});

    GetRequest get;
    get.ids = {ObjectId(16, 0x01)};
    get.timeoutSeconds = -1.0;

    std::optional<GetResponse> result;
    std::thread waiter([&] { result = backend->getObject(get, "c1"); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    backend->shutdown();
    waiter.join();

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(backend->objectCount(), 0u);
    EXPECT_EQ(backend->shutdownCount(), 1u);
}

TEST_F(InMemoryBackendFixture, PrepRuntimeEnvEchoesJobConfig) {
    PrepRuntimeEnvRequest request;
    request.jobConfig = {4, 5, 6};
    EXPECT_EQ(backend->prepRuntimeEnv(request).jobConfig, request.jobConfig);

    InitRequest init;
    EXPECT_TRUE(backend->init(init).ok);
}

TEST(InMemoryBackendPacking, TruncatedPackIsRejected) {
    auto packed = InMemoryBackend::packObjects({{1, 2}, {}, {3}});
    auto objects = InMemoryBackend::unpackObjects(packed);
    ASSERT_TRUE(objects.has_value());
    EXPECT_EQ(objects->size(), 3u);

    packed.pop_back();
    EXPECT_FALSE(InMemoryBackend::unpackObjects(packed).has_value());
}
