/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "DataServicer.h"
#include "IntakeReader.h"

#include <Logging/Logger.h>
#include <kj/exception.h>

#include <format>
#include <stdexcept>
#include <type_traits>

#ifndef DATAPATH_VERSION
#define DATAPATH_VERSION "0.0.0-dev"
#endif

#ifndef DATAPATH_COMMIT
#define DATAPATH_COMMIT "unknown"
#endif

namespace Datapath::Streaming {

static std::string runtimeVersion() {
#if defined(__VERSION__)
    return std::format("C++ {} ({})", __cplusplus, __VERSION__);
#else
    return std::format("C++ {}", __cplusplus);
#endif
}

static SessionRegistry::ShutdownCallback defaultShutdown(const std::shared_ptr<BackendService>& backend) {
    return [backend]() {
        ENTROPY_LOG_DEBUG_CAT("DataServicer", "Shutting down backend.");
        backend->shutdown();
    };
}

DataServicer::DataServicer(std::shared_ptr<BackendService> backend,
                           ServerConfig config,
                           SessionRegistry::ShutdownCallback onLastClientRemoved)
    : _backend(std::move(backend))
    , _config(std::move(config))
    , _registry(_config.clientThreshold(),
                onLastClientRemoved ? std::move(onLastClientRemoved) : defaultShutdown(_backend))
{
    if (!_backend) {
        throw std::invalid_argument("DataServicer requires a backend");
    }
}

void DataServicer::datapath(std::shared_ptr<DataStream> stream) {
    const auto startTime = SessionClock::now();

    auto clientId = stream->metadata().clientId();
    if (!clientId) {
        ENTROPY_LOG_ERROR_CAT("DataServicer", "Client connecting with no client_id");
        stream->finish(StatusCode::InvalidArgument, "Missing client_id in connection metadata");
        return;
    }
    ENTROPY_LOG_DEBUG_CAT("DataServicer", std::format("New data connection from client {}", *clientId));

    bool reconnecting = stream->metadata().reconnecting();
    auto admitted = _registry.admit(*clientId, reconnecting, startTime);
    if (admitted.failed()) {
        StatusCode code = admitted.error == DatapathError::ResourceExhausted
            ? StatusCode::ResourceExhausted
            : StatusCode::NotFound;
        stream->finish(code, admitted.errorMessage);
        return;
    }

    Connection conn;
    conn.ticket = std::move(admitted.value);
    conn.stream = std::move(stream);
    conn.queue = std::make_shared<RequestQueue>();

    auto grace = _registry.gracePeriod(conn.ticket.clientId);
    conn.reconnectEnabled = !(grace && *grace == 0);

    // Everything past admission must reach teardown, whatever is thrown
    IntakeReader reader(conn.stream, conn.queue);
    try {
        reader.start();
        dispatchLoop(conn);
    } catch (const DatapathFault& fault) {
        handleFault(conn, fault);
    } catch (const std::exception& e) {
        handleFault(conn, DatapathFault(StatusCode::FailedPrecondition, e.what()));
    } catch (const kj::Exception& e) {
        handleFault(conn, DatapathFault(StatusCode::FailedPrecondition, e.getDescription().cStr()));
    } catch (...) {
        handleFault(conn, DatapathFault(StatusCode::FailedPrecondition, "Unknown exception in data channel"));
    }

    conn.stream->finish(conn.status.code, conn.status.details);
    ENTROPY_LOG_DEBUG_CAT("DataServicer", std::format("Lost data connection from client {}", conn.ticket.clientId));

    if (!reader.join(_config.queueJoinTimeout)) {
        ENTROPY_LOG_ERROR_CAT("DataServicer",
            std::format("Queue filler thread failed to join before timeout: {} ms",
                        _config.queueJoinTimeout.count()));
    }

    teardown(conn);
}

void DataServicer::dispatchLoop(Connection& conn) {
    auto& cache = *conn.ticket.cache;

    while (true) {
        QueueItem item = conn.queue->pop();

        if (std::holds_alternative<EndOfStream>(item)) {
            return;
        }

        if (auto* ready = std::get_if<DataResponse>(&item)) {
            // Completed async get
            if (!emit(conn, *ready)) {
                return;
            }
            continue;
        }

        const auto& request = std::get<DataRequest>(item);
        const bool cacheable = shouldCache(request) && conn.reconnectEnabled;

        if (cacheable) {
            auto cached = cache.check(request.reqId);
            if (auto* fault = std::get_if<DatapathFault>(&cached)) {
                throw *fault;
            }
            if (auto* response = std::get_if<DataResponse>(&cached)) {
                ENTROPY_LOG_DEBUG_CAT("DataServicer",
                    std::format("Replaying cached response {} for {}", request.reqId, conn.ticket.clientId));
                if (!emit(conn, *response)) {
                    return;
                }
                continue;
            }
        }

        auto response = handleRequest(request, conn);
        if (!response) {
            continue;
        }

        response->reqId = request.reqId;
        if (cacheable) {
            cache.update(request.reqId, *response);
        }
        if (!emit(conn, *response)) {
            return;
        }
    }
}

std::optional<DataResponse> DataServicer::handleRequest(const DataRequest& request, Connection& conn) {
    const ClientId& clientId = conn.ticket.clientId;

    return std::visit([&](const auto& payload) -> std::optional<DataResponse> {
        using T = std::decay_t<decltype(payload)>;
        DataResponse response;

        if constexpr (std::is_same_v<T, InitRequest>) {
            response.payload = _backend->init(payload);
            _registry.setGracePeriod(clientId, payload.reconnectGracePeriod);
            if (payload.reconnectGracePeriod == 0) {
                conn.reconnectEnabled = false;
            }
        } else if constexpr (std::is_same_v<T, GetRequest>) {
            if (payload.asynchronous) {
                auto queue = conn.queue;
                RequestId reqId = request.reqId;
                auto ready = _backend->asyncGetObject(payload, clientId, reqId,
                    [queue, reqId](GetResponse result) {
                        DataResponse completed;
                        completed.reqId = reqId;
                        completed.payload = std::move(result);
                        queue->push(std::move(completed));
                    });
                if (!ready) {
                    // Delivered through the queue once the objects are ready
                    return std::nullopt;
                }
                response.payload = std::move(*ready);
            } else {
                response.payload = _backend->getObject(payload, clientId);
            }
        } else if constexpr (std::is_same_v<T, PutRequest>) {
            response.payload = _backend->putObject(payload, clientId);
        } else if constexpr (std::is_same_v<T, ReleaseRequest>) {
            ReleaseResponse released;
            released.ok.reserve(payload.ids.size());
            for (const auto& id : payload.ids) {
                released.ok.push_back(_backend->release(clientId, id));
            }
            response.payload = std::move(released);
        } else if constexpr (std::is_same_v<T, ConnectionInfoRequest>) {
            response.payload = connectionInfo();
        } else if constexpr (std::is_same_v<T, PrepRuntimeEnvRequest>) {
            response.payload = _registry.runLocked([&]() { return _backend->prepRuntimeEnv(payload); });
        } else if constexpr (std::is_same_v<T, ConnectionCleanupRequest>) {
            conn.cleanupRequested = true;
            response.payload = ConnectionCleanupResponse{};
        } else if constexpr (std::is_same_v<T, AcknowledgeRequest>) {
            conn.ticket.cache->cleanup(payload.reqId);
            return std::nullopt;
        } else {
            throw std::logic_error(std::format("Unreachable code: Request type {} not handled in Datapath",
                                               requestKindToString(requestKind(request))));
        }
        return response;
    }, request.payload);
}

bool DataServicer::emit(Connection& conn, const DataResponse& response) {
    auto written = conn.stream->write(response);
    if (written.failed()) {
        ENTROPY_LOG_DEBUG_CAT("DataServicer",
            std::format("Write to {} failed, treating as disconnect: {}", conn.ticket.clientId,
                        written.errorMessage.empty() ? errorToString(written.error) : written.errorMessage));
        return false;
    }
    return true;
}

void DataServicer::handleFault(Connection& conn, const DatapathFault& fault) {
    ENTROPY_LOG_ERROR_CAT("DataServicer",
        std::format("Error in data channel of {}: {} ({})", conn.ticket.clientId, fault.details(),
                    statusCodeToString(fault.code())));

    conn.status.code = fault.code();
    conn.status.details = fault.details();

    bool cacheLost = conn.ticket.cache->invalidate(fault);
    if (!fault.recoverable() || cacheLost) {
        // Session cannot be resumed, skip the grace period
        conn.status.code = StatusCode::FailedPrecondition;
        conn.cleanupRequested = true;
    }
}

void DataServicer::teardown(Connection& conn) {
    const ClientId& clientId = conn.ticket.clientId;

    auto delay = _registry.gracePeriod(clientId);
    if (!conn.cleanupRequested && delay) {
        ENTROPY_LOG_DEBUG_CAT("DataServicer",
            std::format("Cleanup wasn't requested, delaying cleanup by {} seconds.", *delay));
        waitForStop(std::chrono::seconds(*delay));
    } else {
        ENTROPY_LOG_DEBUG_CAT("DataServicer", "Cleanup was requested, cleaning up immediately.");
    }

    auto outcome = _registry.finishConnection(conn.ticket, [this](const ClientId& id) {
        _backend->releaseAll(id);
    });
    ENTROPY_LOG_DEBUG_CAT("DataServicer",
        std::format("Teardown of {}: {}", clientId, teardownOutcomeToString(outcome)));
}

bool DataServicer::waitForStop(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(_stopMutex);
    return _stopCv.wait_for(lock, duration, [this]() { return _stopped; });
}

void DataServicer::stop() {
    {
        std::lock_guard<std::mutex> lock(_stopMutex);
        _stopped = true;
    }
    _stopCv.notify_all();
}

bool DataServicer::stopped() const {
    std::lock_guard<std::mutex> lock(_stopMutex);
    return _stopped;
}

ConnectionInfoResponse DataServicer::connectionInfo() const {
    ConnectionInfoResponse info;
    info.numClients = static_cast<int32_t>(_registry.activeCount());
    info.runtimeVersion = runtimeVersion();
    info.serverVersion = DATAPATH_VERSION;
    info.serverCommit = DATAPATH_COMMIT;
    info.protocolVersion = PROTOCOL_VERSION;
    return info;
}

uint64_t DataServicer::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<DataServicer>().id);
    return hash;
}

std::string DataServicer::toString() const {
    return std::format("{}@{}(active={}, stopped={})", className(), static_cast<const void*>(this),
                       _registry.activeCount(), stopped() ? "true" : "false");
}

} // namespace Datapath::Streaming
