/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file ServerConfig.h
 * @brief Servicer and transport configuration
 */

#pragma once

#include <chrono>
#include <string>

#include "DatapathTypes.h"
#include "ErrorCodes.h"

namespace Datapath::Streaming {

/**
 * @brief Configuration for the data servicer and its socket transport
 *
 * Defaults match a stand-alone server. fromEnvironment() overlays the
 * DATAPATH_* environment variables:
 * - DATAPATH_MAX_THREADS: worker-thread budget (client threshold is half of it)
 * - DATAPATH_SOCKET_PATH: Unix socket path the server listens on
 */
struct ServerConfig {
    size_t maxThreads = DEFAULT_MAX_THREADS;                        ///< Worker-thread budget
    std::chrono::milliseconds queueJoinTimeout = QUEUE_JOIN_TIMEOUT; ///< Max wait for the intake reader
    std::string socketPath = "/tmp/datapath.sock";                  ///< Listening socket path
    size_t maxMessageSize = DEFAULT_MAX_MESSAGE_SIZE;               ///< Largest accepted frame
    size_t compressionThreshold = DEFAULT_COMPRESSION_THRESHOLD;    ///< Object payloads above this are compressed
    int acceptPollIntervalMs = 500;                                 ///< Accept loop wake-up interval

    /**
     * @brief Number of concurrently active clients admitted
     * @return Half of the worker-thread budget
     */
    size_t clientThreshold() const noexcept {
        return maxThreads / 2;
    }

    /**
     * @brief Build a config from defaults plus DATAPATH_* environment overrides
     * @return Result with the config, or InvalidParameter on a malformed value
     */
    static Result<ServerConfig> fromEnvironment();
};

} // namespace Datapath::Streaming
