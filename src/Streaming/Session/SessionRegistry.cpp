/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "SessionRegistry.h"

#include <Logging/Logger.h>

#include <exception>
#include <format>

namespace Datapath::Streaming {

static std::once_flag thresholdHintOnce;

const char* teardownOutcomeToString(TeardownOutcome outcome) noexcept {
    switch (outcome) {
        case TeardownOutcome::AlreadyRemoved: return "AlreadyRemoved";
        case TeardownOutcome::Reconnected: return "Reconnected";
        case TeardownOutcome::Removed: return "Removed";
        case TeardownOutcome::RemovedLastClient: return "RemovedLastClient";
    }
    return "Unknown";
}

SessionRegistry::SessionRegistry(size_t clientThreshold, ShutdownCallback onLastClientRemoved)
    : _clientThreshold(clientThreshold)
    , _onLastClientRemoved(std::move(onLastClientRemoved))
{
}

Result<AdmissionTicket> SessionRegistry::admit(const ClientId& clientId, bool reconnecting,
                                               SessionClock::time_point startTime) {
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _sessions.find(clientId);
    bool resumed = it != _sessions.end();

    if (!resumed) {
        if (reconnecting) {
            return Result<AdmissionTicket>::err(DatapathError::SessionNotFound,
                "Attempted to reconnect to a session that has already been cleaned up.");
        }

        if (_activeCount >= _clientThreshold) {
            ENTROPY_LOG_WARNING_CAT("SessionRegistry",
                std::format("Num clients {} has reached the threshold {}. Rejecting client: {}.",
                            _activeCount, _clientThreshold, clientId));
            std::call_once(thresholdHintOnce, [this]() {
                ENTROPY_LOG_WARNING_CAT("SessionRegistry",
                    std::format("You can configure the client connection threshold by setting the "
                                "DATAPATH_MAX_THREADS env var (threshold is half of it, currently {}).",
                                _clientThreshold));
            });
            return Result<AdmissionTicket>::err(DatapathError::ResourceExhausted,
                std::format("Client threshold {} reached", _clientThreshold));
        }

        Session session;
        session.cache = std::make_shared<ResponseCache>();
        it = _sessions.emplace(clientId, std::move(session)).first;
        ++_activeCount;
        ENTROPY_LOG_DEBUG_CAT("SessionRegistry",
            std::format("Accepted data connection from {}. Total clients: {}", clientId, _activeCount));
    } else {
        ENTROPY_LOG_DEBUG_CAT("SessionRegistry", std::format("Client {} has reconnected.", clientId));
    }

    it->second.lastSeen = startTime;
    it->second.epoch = _nextEpoch++;

    AdmissionTicket ticket;
    ticket.clientId = clientId;
    ticket.epoch = it->second.epoch;
    ticket.startTime = startTime;
    ticket.resumed = resumed;
    ticket.cache = it->second.cache;
    return Result<AdmissionTicket>::ok(std::move(ticket));
}

bool SessionRegistry::setGracePeriod(const ClientId& clientId, int32_t seconds) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _sessions.find(clientId);
    if (it == _sessions.end()) {
        return false;
    }
    it->second.gracePeriodSeconds = seconds;
    return true;
}

std::optional<int32_t> SessionRegistry::gracePeriod(const ClientId& clientId) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _sessions.find(clientId);
    if (it == _sessions.end()) {
        return std::nullopt;
    }
    return it->second.gracePeriodSeconds;
}

TeardownOutcome SessionRegistry::finishConnection(const AdmissionTicket& ticket,
                                                  const ReleaseAllCallback& releaseAll) {
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _sessions.find(ticket.clientId);
    if (it == _sessions.end()) {
        ENTROPY_LOG_DEBUG_CAT("SessionRegistry",
            std::format("Connection for {} already cleaned up.", ticket.clientId));
        return TeardownOutcome::AlreadyRemoved;
    }

    if (it->second.lastSeen > ticket.startTime || it->second.epoch != ticket.epoch) {
        ENTROPY_LOG_DEBUG_CAT("SessionRegistry",
            std::format("Client {} reconnected, skipping cleanup", ticket.clientId));
        return TeardownOutcome::Reconnected;
    }

    if (releaseAll) {
        try {
            releaseAll(ticket.clientId);
        } catch (const std::exception& e) {
            ENTROPY_LOG_ERROR_CAT("SessionRegistry",
                std::format("Releasing resources of {} failed: {}", ticket.clientId, e.what()));
        } catch (...) {
            ENTROPY_LOG_ERROR_CAT("SessionRegistry",
                std::format("Releasing resources of {} failed with an unknown exception", ticket.clientId));
        }
    }

    _sessions.erase(it);
    --_activeCount;
    ENTROPY_LOG_DEBUG_CAT("SessionRegistry", std::format("Removed clients. {}", _activeCount));

    if (_activeCount != 0) {
        return TeardownOutcome::Removed;
    }

    if (_onLastClientRemoved) {
        ENTROPY_LOG_DEBUG_CAT("SessionRegistry", "Last client removed, shutting down backend.");
        try {
            _onLastClientRemoved();
        } catch (const std::exception& e) {
            ENTROPY_LOG_ERROR_CAT("SessionRegistry", std::format("Backend shutdown failed: {}", e.what()));
        } catch (...) {
            ENTROPY_LOG_ERROR_CAT("SessionRegistry", "Backend shutdown failed with an unknown exception");
        }
    }
    return TeardownOutcome::RemovedLastClient;
}

size_t SessionRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _activeCount;
}

bool SessionRegistry::contains(const ClientId& clientId) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _sessions.find(clientId) != _sessions.end();
}

std::vector<SessionInfo> SessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<SessionInfo> sessions;
    sessions.reserve(_sessions.size());
    for (const auto& [clientId, session] : _sessions) {
        SessionInfo info;
        info.clientId = clientId;
        info.epoch = session.epoch;
        info.lastSeen = session.lastSeen;
        info.gracePeriodSeconds = session.gracePeriodSeconds;
        info.cachedResponses = session.cache->size();
        sessions.push_back(std::move(info));
    }
    return sessions;
}

uint64_t SessionRegistry::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(Core::TypeSystem::createTypeId<SessionRegistry>().id);
    return hash;
}

std::string SessionRegistry::toString() const {
    return std::format("{}@{}(threshold={}, active={})", className(), static_cast<const void*>(this),
                       _clientThreshold, activeCount());
}

} // namespace Datapath::Streaming
