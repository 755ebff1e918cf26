/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file InMemoryBackend.h
 * @brief Reference BackendService keeping objects in process memory
 */

#pragma once

#include <Concurrency/WorkContractGroup.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "BackendService.h"

namespace Datapath::Streaming {

/**
 * @brief In-memory object store with per-client references
 *
 * Every put creates an object referenced once by the putting client. A put
 * that repeats a non-empty clientRefId returns the object of the first put
 * instead of storing a second copy, so a put replayed after a reconnect is
 * harmless. An object is dropped when its last reference is released.
 *
 * Get responses carry the requested objects in id order, each prefixed by its
 * 4-byte big-endian length (see packObjects()/unpackObjects()). A get on ids
 * not stored yet waits for them to be put, up to timeoutSeconds (negative
 * waits until shutdown). Asynchronous gets that cannot be answered at once
 * are parked without holding a thread. The put that satisfies one, its
 * timeout, shutdown() or destruction completes it, and the completion runs on
 * a work contract of the supplied WorkContractGroup (inline when the group
 * cannot take another contract). The group must be attached to a running
 * WorkService.
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * @code
 * WorkService::Config cfg;
 * cfg.threadCount = 4;
 * WorkService workService(cfg);
 * WorkContractGroup asyncGets(1024, "AsyncGets");
 * workService.addWorkContractGroup(&asyncGets);
 * workService.start();
 *
 * auto backend = std::make_shared<InMemoryBackend>(&asyncGets);
 * @endcode
 */
class InMemoryBackend : public BackendService {
public:
    explicit InMemoryBackend(Core::Concurrency::WorkContractGroup* asyncGroup);
    ~InMemoryBackend() override;

    InMemoryBackend(const InMemoryBackend&) = delete;
    InMemoryBackend& operator=(const InMemoryBackend&) = delete;

    // BackendService interface
    InitResponse init(const InitRequest& request) override;
    GetResponse getObject(const GetRequest& request, const ClientId& clientId) override;
    std::optional<GetResponse> asyncGetObject(const GetRequest& request, const ClientId& clientId,
                                              RequestId reqId, GetCompletion completion) override;
    PutResponse putObject(const PutRequest& request, const ClientId& clientId) override;
    bool release(const ClientId& clientId, const ObjectId& id) override;
    void releaseAll(const ClientId& clientId) override;
    PrepRuntimeEnvResponse prepRuntimeEnv(const PrepRuntimeEnvRequest& request) override;
    void shutdown() override;

    size_t objectCount() const;

    /// Asynchronous gets waiting for their objects
    size_t pendingAsyncGets() const;

    /// References the client holds across all objects
    size_t referencesHeldBy(const ClientId& clientId) const;

    uint64_t shutdownCount() const noexcept {
        return _shutdownCount.load(std::memory_order_relaxed);
    }

    static std::vector<uint8_t> packObjects(const std::vector<std::vector<uint8_t>>& objects);
    static std::optional<std::vector<std::vector<uint8_t>>> unpackObjects(const std::vector<uint8_t>& packed);

    // EntropyObject interface
    const char* className() const noexcept override {
        return "InMemoryBackend";
    }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    struct StoredObject {
        std::vector<uint8_t> data;
        std::unordered_map<ClientId, size_t> references;
    };

    struct PendingGet {
        std::vector<ObjectId> ids;
        GetCompletion completion;
        std::optional<std::chrono::steady_clock::time_point> deadline;
    };

    struct CompletedGet {
        GetCompletion completion;
        GetResponse response;
    };

    /// Lookup under the lock; nullopt while some id is missing
    std::optional<GetResponse> tryGetLocked(const std::vector<ObjectId>& ids) const;

    /// Wait for all ids; _mutex must be held through lock
    GetResponse waitForObjects(std::unique_lock<std::mutex>& lock, const GetRequest& request);

    /// Remove parked gets that are now answerable or past their deadline
    std::vector<CompletedGet> takeSettledLocked(std::chrono::steady_clock::time_point now);

    /// Remove every parked get, failing it with error
    std::vector<CompletedGet> takeAllLocked(const char* error);

    /// Run completions outside the lock, on the work group when it has room
    void deliver(std::vector<CompletedGet> completed);

    /// Fires parked-get deadlines
    void expiryLoop();

    ObjectId nextObjectId();
    /// Drop one (or all) of the client's references; erases the object once unreferenced
    void dropReferencesLocked(std::map<ObjectId, StoredObject>::iterator it, const ClientId& clientId, bool all);

    Core::Concurrency::WorkContractGroup* _asyncGroup;

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::map<ObjectId, StoredObject> _objects;
    std::map<std::pair<ClientId, std::vector<uint8_t>>, ObjectId> _clientRefs;
    std::vector<uint8_t> _jobConfig;
    uint64_t _nextObject = 1;
    uint64_t _idSalt = 0;
    uint64_t _generation = 0;       // bumped by shutdown() to fail outstanding waits
    bool _destroying = false;
    std::vector<PendingGet> _pendingGets;
    std::thread _expiryThread;

    std::atomic<uint64_t> _shutdownCount{0};
};

} // namespace Datapath::Streaming
