/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "Messages.h"

#include <type_traits>

namespace Datapath::Streaming {

RequestKind requestKind(const DataRequest& request) noexcept {
    return std::visit([](const auto& payload) -> RequestKind {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, InitRequest>) return RequestKind::Init;
        else if constexpr (std::is_same_v<T, GetRequest>) return RequestKind::Get;
        else if constexpr (std::is_same_v<T, PutRequest>) return RequestKind::Put;
        else if constexpr (std::is_same_v<T, ReleaseRequest>) return RequestKind::Release;
        else if constexpr (std::is_same_v<T, ConnectionInfoRequest>) return RequestKind::ConnectionInfo;
        else if constexpr (std::is_same_v<T, PrepRuntimeEnvRequest>) return RequestKind::PrepRuntimeEnv;
        else if constexpr (std::is_same_v<T, ConnectionCleanupRequest>) return RequestKind::ConnectionCleanup;
        else if constexpr (std::is_same_v<T, AcknowledgeRequest>) return RequestKind::Acknowledge;
        else return RequestKind::Unknown;
    }, request.payload);
}

const char* requestKindToString(RequestKind kind) noexcept {
    switch (kind) {
        case RequestKind::Init: return "init";
        case RequestKind::Get: return "get";
        case RequestKind::Put: return "put";
        case RequestKind::Release: return "release";
        case RequestKind::ConnectionInfo: return "connection_info";
        case RequestKind::PrepRuntimeEnv: return "prep_runtime_env";
        case RequestKind::ConnectionCleanup: return "connection_cleanup";
        case RequestKind::Acknowledge: return "acknowledge";
        case RequestKind::Unknown:
        default: return "unknown";
    }
}

bool shouldCache(const DataRequest& request) noexcept {
    switch (requestKind(request)) {
        case RequestKind::Get:
        case RequestKind::Acknowledge:
        case RequestKind::ConnectionCleanup:
            return false;
        default:
            return true;
    }
}

} // namespace Datapath::Streaming
