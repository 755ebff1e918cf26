/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "ServerConfig.h"

#include <cstdlib>
#include <format>
#include <optional>

namespace Datapath::Streaming {

static std::optional<std::string> getEnv(const char* name) {
    if (const char* v = std::getenv(name)) return std::string(v);
    return std::nullopt;
}

static std::optional<size_t> parsePositive(const std::string& s) {
    if (s.empty()) return std::nullopt;
    size_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<size_t>(c - '0');
        if (value > 1'000'000) return std::nullopt;
    }
    if (value == 0) return std::nullopt;
    return value;
}

Result<ServerConfig> ServerConfig::fromEnvironment() {
    ServerConfig config;

    if (auto threads = getEnv("DATAPATH_MAX_THREADS")) {
        auto parsed = parsePositive(*threads);
        if (!parsed) {
            return Result<ServerConfig>::err(DatapathError::InvalidParameter,
                std::format("DATAPATH_MAX_THREADS must be a positive integer, got '{}'", *threads));
        }
        config.maxThreads = *parsed;
    }

    if (auto path = getEnv("DATAPATH_SOCKET_PATH")) {
        if (path->empty()) {
            return Result<ServerConfig>::err(DatapathError::InvalidParameter,
                "DATAPATH_SOCKET_PATH must not be empty");
        }
        config.socketPath = *path;
    }

    return Result<ServerConfig>::ok(std::move(config));
}

} // namespace Datapath::Streaming
