/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file DatapathTypes.h
 * @brief Shared identifiers, protocol constants and connection statistics
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <EntropyCore.h>

namespace Datapath::Streaming {

/// EntropyCore object model, logging and concurrency
namespace Core = EntropyEngine::Core;

using ClientId = std::string;
using RequestId = int32_t;
using ObjectId = std::vector<uint8_t>;

/// Version of the request/response protocol; clients compare it on connect
static constexpr int32_t PROTOCOL_VERSION = 3;

/// Upper bound on how long teardown waits for the intake reader to exit
static constexpr std::chrono::seconds QUEUE_JOIN_TIMEOUT{10};

static constexpr size_t DEFAULT_MAX_THREADS = 100;
static constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 16ull * 1024ull * 1024ull;   // 16 MiB
static constexpr size_t DEFAULT_COMPRESSION_THRESHOLD = 64ull * 1024ull;        // 64 KiB

// Connection metadata keys
static constexpr const char* METADATA_CLIENT_ID = "client_id";
static constexpr const char* METADATA_RECONNECTING = "reconnecting";

} // namespace Datapath::Streaming
