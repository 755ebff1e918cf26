/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "DatapathServer.h"
#include "UnixSocketStream.h"

#include <Logging/Logger.h>

#include <format>

namespace Datapath::Streaming {

static UnixSocketServerConfig listenerConfig(const ServerConfig& config) {
    UnixSocketServerConfig listener;
    listener.acceptPollIntervalMs = config.acceptPollIntervalMs;
    listener.maxMessageSize = config.maxMessageSize;
    return listener;
}

DatapathServer::DatapathServer(std::shared_ptr<DataServicer> servicer, ServerConfig config)
    : _servicer(std::move(servicer))
    , _config(std::move(config))
    , _listener(_config.socketPath, listenerConfig(_config))
{
}

DatapathServer::~DatapathServer() {
    stop();
}

Result<void> DatapathServer::start() {
    if (_running.load(std::memory_order_acquire)) {
        return Result<void>::err(DatapathError::InvalidParameter, "Server already running");
    }

    auto listening = _listener.listen();
    if (listening.failed()) {
        return listening;
    }

    _running.store(true, std::memory_order_release);
    _acceptThread = std::thread([this]() { acceptLoop(); });
    ENTROPY_LOG_INFO_CAT("DatapathServer",
        std::format("Serving data streams on {} (client threshold {})", _config.socketPath,
                    _config.clientThreshold()));
    return Result<void>::ok();
}

void DatapathServer::acceptLoop() {
    while (_running.load(std::memory_order_acquire)) {
        auto socket = _listener.accept();
        reapFinishedWorkers();
        if (!socket) {
            continue;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        if (!_running.load(std::memory_order_acquire)) {
            socket->shutdown();
            break;
        }
        uint64_t connectionId = _nextConnectionId++;
        _liveSockets.emplace(connectionId, socket);
        Worker& worker = _workers.emplace_back();
        worker.thread = std::thread([this, connectionId, socket, &worker]() {
            serveConnection(connectionId, socket, &worker);
        });
    }
}

void DatapathServer::serveConnection(uint64_t connectionId, std::shared_ptr<FramedSocket> socket, Worker* worker) {
    CodecOptions options;
    options.maxMessageSize = _config.maxMessageSize;
    options.compressionThreshold = _config.compressionThreshold;

    auto stream = UnixSocketStream::open(socket, options);
    if (stream.success()) {
        _servicer->datapath(stream.value);
    } else {
        ENTROPY_LOG_WARNING_CAT("DatapathServer",
            std::format("Dropping connection {}: {}", connectionId, stream.errorMessage));
    }

    socket->shutdown();
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _liveSockets.erase(connectionId);
    }
    worker->done.store(true, std::memory_order_release);
}

void DatapathServer::reapFinishedWorkers() {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (auto it = _workers.begin(); it != _workers.end();) {
            auto next = std::next(it);
            if (it->done.load(std::memory_order_acquire)) {
                finished.splice(finished.end(), _workers, it);
            }
            it = next;
        }
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void DatapathServer::stop() {
    if (!_running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    ENTROPY_LOG_INFO_CAT("DatapathServer", "Stopping data stream server");

    auto closed = _listener.close();
    if (closed.failed()) {
        ENTROPY_LOG_WARNING_CAT("DatapathServer", closed.errorMessage);
    }
    if (_acceptThread.joinable()) {
        _acceptThread.join();
    }

    // Wake teardowns waiting out grace periods, then unblock live streams
    _servicer->stop();
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (auto& [id, socket] : _liveSockets) {
            socket->shutdown();
        }
        workers.splice(workers.end(), _workers);
    }

    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

size_t DatapathServer::connectionCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    size_t live = 0;
    for (const auto& worker : _workers) {
        if (!worker.done.load(std::memory_order_acquire)) {
            ++live;
        }
    }
    return live;
}

uint64_t DatapathServer::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<DatapathServer>().id);
    return hash;
}

std::string DatapathServer::toString() const {
    return std::format("{}@{}(path={}, running={}, connections={})", className(), static_cast<const void*>(this),
                       _config.socketPath, isRunning() ? "true" : "false", connectionCount());
}

} // namespace Datapath::Streaming
