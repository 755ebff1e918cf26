/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "InMemoryBackend.h"

#include <Logging/Logger.h>

#include <chrono>
#include <format>
#include <random>

namespace Datapath::Streaming {

static constexpr const char* GET_TIMEOUT_ERROR = "GetTimeoutError: Get timed out: some object(s) not ready.";
static constexpr const char* BACKEND_SHUTDOWN_ERROR = "Backend was shut down while waiting for object(s).";

InMemoryBackend::InMemoryBackend(Core::Concurrency::WorkContractGroup* asyncGroup)
    : _asyncGroup(asyncGroup)
{
    std::random_device rd;
    _idSalt = (static_cast<uint64_t>(rd()) << 32) | rd();

    if (_asyncGroup) {
        _expiryThread = std::thread(&InMemoryBackend::expiryLoop, this);
    }
}

InMemoryBackend::~InMemoryBackend() {
    std::vector<CompletedGet> orphaned;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _destroying = true;
        orphaned = takeAllLocked(BACKEND_SHUTDOWN_ERROR);
    }
    _cv.notify_all();

    if (_expiryThread.joinable()) {
        _expiryThread.join();
    }

    // Completed here since the group may already be stopped
    for (auto& done : orphaned) {
        done.completion(std::move(done.response));
    }
}

InitResponse InMemoryBackend::init(const InitRequest& request) {
    std::lock_guard<std::mutex> lock(_mutex);
    _jobConfig = request.jobConfig;

    InitResponse response;
    response.ok = true;
    return response;
}

std::optional<GetResponse> InMemoryBackend::tryGetLocked(const std::vector<ObjectId>& ids) const {
    std::vector<std::vector<uint8_t>> objects;
    objects.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = _objects.find(id);
        if (it == _objects.end()) {
            return std::nullopt;
        }
        objects.push_back(it->second.data);
    }

    GetResponse response;
    response.valid = true;
    response.data = packObjects(objects);
    return response;
}

GetResponse InMemoryBackend::waitForObjects(std::unique_lock<std::mutex>& lock, const GetRequest& request) {
    const uint64_t generation = _generation;
    std::optional<GetResponse> found;

    auto ready = [&]() {
        if (_destroying || _generation != generation) {
            return true;
        }
        found = tryGetLocked(request.ids);
        return found.has_value();
    };

    if (request.timeoutSeconds < 0) {
        _cv.wait(lock, ready);
    } else {
        auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<double>(request.timeoutSeconds));
        _cv.wait_for(lock, timeout, ready);
    }

    if (found) {
        return *found;
    }

    GetResponse response;
    response.valid = false;
    response.error = (_destroying || _generation != generation) ? BACKEND_SHUTDOWN_ERROR : GET_TIMEOUT_ERROR;
    return response;
}

GetResponse InMemoryBackend::getObject(const GetRequest& request, const ClientId& clientId) {
    std::unique_lock<std::mutex> lock(_mutex);
    auto response = waitForObjects(lock, request);
    if (!response.valid) {
        ENTROPY_LOG_DEBUG_CAT("InMemoryBackend",
            std::format("Get of {} object(s) for {} failed: {}", request.ids.size(), clientId, response.error));
    }
    return response;
}

std::optional<GetResponse> InMemoryBackend::asyncGetObject(const GetRequest& request, const ClientId& clientId,
                                                           RequestId reqId, GetCompletion completion) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (auto ready = tryGetLocked(request.ids)) {
            return ready;
        }

        if (!_asyncGroup || _destroying) {
            GetResponse response;
            response.valid = false;
            response.error = "Asynchronous gets are not available on this backend.";
            return response;
        }

        PendingGet pending;
        pending.ids = request.ids;
        pending.completion = std::move(completion);
        if (request.timeoutSeconds >= 0) {
            pending.deadline = std::chrono::steady_clock::now() +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::duration<double>(request.timeoutSeconds));
        }
        _pendingGets.push_back(std::move(pending));
    }
    // Wake the expiry thread so it picks up the new deadline
    _cv.notify_all();

    ENTROPY_LOG_DEBUG_CAT("InMemoryBackend",
        std::format("Parked async get {} of {} for {}", reqId, request.ids.size(), clientId));
    return std::nullopt;
}

std::vector<InMemoryBackend::CompletedGet> InMemoryBackend::takeSettledLocked(
    std::chrono::steady_clock::time_point now) {
    std::vector<CompletedGet> settled;
    for (auto it = _pendingGets.begin(); it != _pendingGets.end();) {
        std::optional<GetResponse> response = tryGetLocked(it->ids);
        if (!response && it->deadline && *it->deadline <= now) {
            response = GetResponse{};
            response->valid = false;
            response->error = GET_TIMEOUT_ERROR;
        }
        if (!response) {
            ++it;
            continue;
        }
        settled.push_back(CompletedGet{std::move(it->completion), std::move(*response)});
        it = _pendingGets.erase(it);
    }
    return settled;
}

std::vector<InMemoryBackend::CompletedGet> InMemoryBackend::takeAllLocked(const char* error) {
    std::vector<CompletedGet> failed;
    failed.reserve(_pendingGets.size());
    for (auto& pending : _pendingGets) {
        GetResponse response;
        response.valid = false;
        response.error = error;
        failed.push_back(CompletedGet{std::move(pending.completion), std::move(response)});
    }
    _pendingGets.clear();
    return failed;
}

void InMemoryBackend::deliver(std::vector<CompletedGet> completed) {
    using Core::Concurrency::ScheduleResult;

    for (auto& done : completed) {
        // The contract owns the completion only; it may run after we are gone
        auto work = _asyncGroup->createContract([done]() mutable {
            done.completion(std::move(done.response));
        });
        if (work.valid() && work.schedule() == ScheduleResult::Scheduled) {
            continue;
        }
        ENTROPY_LOG_WARNING_CAT("InMemoryBackend", "Async get group is full, completing get inline");
        done.completion(std::move(done.response));
    }
}

void InMemoryBackend::expiryLoop() {
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_destroying) {
        std::optional<std::chrono::steady_clock::time_point> earliest;
        for (const auto& pending : _pendingGets) {
            if (pending.deadline && (!earliest || *pending.deadline < *earliest)) {
                earliest = pending.deadline;
            }
        }

        if (earliest) {
            _cv.wait_until(lock, *earliest);
        } else {
            _cv.wait(lock);
        }
        if (_destroying) {
            break;
        }

        auto settled = takeSettledLocked(std::chrono::steady_clock::now());
        if (settled.empty()) {
            continue;
        }
        lock.unlock();
        deliver(std::move(settled));
        lock.lock();
    }
}

ObjectId InMemoryBackend::nextObjectId() {
    uint64_t counter = _nextObject++;
    ObjectId id(16);
    for (int i = 0; i < 8; ++i) {
        id[i] = static_cast<uint8_t>(_idSalt >> (56 - 8 * i));
        id[8 + i] = static_cast<uint8_t>(counter >> (56 - 8 * i));
    }
    return id;
}

PutResponse InMemoryBackend::putObject(const PutRequest& request, const ClientId& clientId) {
    PutResponse response;
    std::vector<CompletedGet> settled;
    {
        std::lock_guard<std::mutex> lock(_mutex);

        if (!request.clientRefId.empty()) {
            auto ref = _clientRefs.find({clientId, request.clientRefId});
            if (ref != _clientRefs.end() && _objects.count(ref->second) != 0) {
                response.id = ref->second;
                response.valid = true;
                return response;
            }
        }

        ObjectId id = nextObjectId();
        StoredObject object;
        object.data = request.data;
        object.references[clientId] = 1;
        _objects.emplace(id, std::move(object));

        if (!request.clientRefId.empty()) {
            _clientRefs[{clientId, request.clientRefId}] = id;
        }

        response.id = std::move(id);
        response.valid = true;
        settled = takeSettledLocked(std::chrono::steady_clock::now());
    }
    _cv.notify_all();
    if (!settled.empty()) {
        deliver(std::move(settled));
    }
    return response;
}

void InMemoryBackend::dropReferencesLocked(std::map<ObjectId, StoredObject>::iterator it,
                                           const ClientId& clientId, bool all) {
    auto& refs = it->second.references;
    auto ref = refs.find(clientId);
    if (ref == refs.end()) {
        return;
    }
    if (all || --ref->second == 0) {
        refs.erase(ref);
        for (auto cr = _clientRefs.begin(); cr != _clientRefs.end();) {
            if (cr->first.first == clientId && cr->second == it->first) {
                cr = _clientRefs.erase(cr);
            } else {
                ++cr;
            }
        }
    }
    if (refs.empty()) {
        _objects.erase(it);
    }
}

bool InMemoryBackend::release(const ClientId& clientId, const ObjectId& id) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _objects.find(id);
    if (it == _objects.end() || it->second.references.count(clientId) == 0) {
        return false;
    }
    dropReferencesLocked(it, clientId, false);
    return true;
}

void InMemoryBackend::releaseAll(const ClientId& clientId) {
    std::lock_guard<std::mutex> lock(_mutex);
    size_t released = 0;
    for (auto it = _objects.begin(); it != _objects.end();) {
        auto next = std::next(it);
        auto ref = it->second.references.find(clientId);
        if (ref != it->second.references.end()) {
            released += ref->second;
            dropReferencesLocked(it, clientId, true);
        }
        it = next;
    }
    ENTROPY_LOG_DEBUG_CAT("InMemoryBackend",
        std::format("Released {} reference(s) held by {}", released, clientId));
}

PrepRuntimeEnvResponse InMemoryBackend::prepRuntimeEnv(const PrepRuntimeEnvRequest& request) {
    PrepRuntimeEnvResponse response;
    response.jobConfig = request.jobConfig;
    return response;
}

void InMemoryBackend::shutdown() {
    std::vector<CompletedGet> failed;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _objects.clear();
        _clientRefs.clear();
        _jobConfig.clear();
        ++_generation;
        failed = takeAllLocked(BACKEND_SHUTDOWN_ERROR);
    }
    _cv.notify_all();
    if (!failed.empty()) {
        deliver(std::move(failed));
    }
    _shutdownCount.fetch_add(1, std::memory_order_relaxed);
    ENTROPY_LOG_INFO_CAT("InMemoryBackend", "Object store shut down");
}

size_t InMemoryBackend::objectCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _objects.size();
}

size_t InMemoryBackend::pendingAsyncGets() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pendingGets.size();
}

size_t InMemoryBackend::referencesHeldBy(const ClientId& clientId) const {
    std::lock_guard<std::mutex> lock(_mutex);
    size_t total = 0;
    for (const auto& [id, object] : _objects) {
        auto ref = object.references.find(clientId);
        if (ref != object.references.end()) {
            total += ref->second;
        }
    }
    return total;
}

std::vector<uint8_t> InMemoryBackend::packObjects(const std::vector<std::vector<uint8_t>>& objects) {
    std::vector<uint8_t> packed;
    for (const auto& object : objects) {
        uint32_t size = static_cast<uint32_t>(object.size());
        packed.push_back(static_cast<uint8_t>(size >> 24));
        packed.push_back(static_cast<uint8_t>(size >> 16));
        packed.push_back(static_cast<uint8_t>(size >> 8));
        packed.push_back(static_cast<uint8_t>(size));
        packed.insert(packed.end(), object.begin(), object.end());
    }
    return packed;
}

std::optional<std::vector<std::vector<uint8_t>>> InMemoryBackend::unpackObjects(const std::vector<uint8_t>& packed) {
    std::vector<std::vector<uint8_t>> objects;
    size_t offset = 0;
    while (offset < packed.size()) {
        if (packed.size() - offset < 4) {
            return std::nullopt;
        }
        uint32_t size = (static_cast<uint32_t>(packed[offset]) << 24) |
                        (static_cast<uint32_t>(packed[offset + 1]) << 16) |
                        (static_cast<uint32_t>(packed[offset + 2]) << 8) |
                        static_cast<uint32_t>(packed[offset + 3]);
        offset += 4;
        if (packed.size() - offset < size) {
            return std::nullopt;
        }
        objects.emplace_back(packed.begin() + static_cast<std::ptrdiff_t>(offset),
                             packed.begin() + static_cast<std::ptrdiff_t>(offset + size));
        offset += size;
    }
    return objects;
}

uint64_t InMemoryBackend::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<InMemoryBackend>().id);
    return hash;
}

std::string InMemoryBackend::toString() const {
    return std::format("{}@{}(objects={}, pendingGets={}, shutdowns={})", className(),
                       static_cast<const void*>(this), objectCount(), pendingAsyncGets(), shutdownCount());
}

} // namespace Datapath::Streaming
