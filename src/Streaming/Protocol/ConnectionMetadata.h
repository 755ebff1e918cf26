/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file ConnectionMetadata.h
 * @brief Per-connection key/value metadata sent ahead of the first request
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace Datapath::Streaming {

/**
 * @brief Invocation metadata of one stream connection
 *
 * Carries the client id and the stringified "reconnecting" flag. Values are
 * kept as the client sent them; the typed accessors interpret them.
 */
class ConnectionMetadata {
public:
    ConnectionMetadata() = default;
    explicit ConnectionMetadata(std::map<std::string, std::string> entries)
        : _entries(std::move(entries))
    {
    }

    void set(const std::string& key, const std::string& value) {
        _entries[key] = value;
    }

    std::optional<std::string> get(const std::string& key) const;

    /**
     * @brief Client id of the connection, if one was sent
     */
    std::optional<std::string> clientId() const;

    /**
     * @brief Interpret the "reconnecting" flag
     *
     * Only the exact strings "True" and "False" are accepted. A missing or
     * malformed value logs a warning (usually a client/server version
     * mismatch) and is treated as false.
     */
    bool reconnecting() const;

    const std::map<std::string, std::string>& entries() const noexcept {
        return _entries;
    }

    bool operator==(const ConnectionMetadata&) const = default;

    /**
     * @brief Metadata for a client connection
     */
    static ConnectionMetadata forClient(const std::string& clientId, bool reconnecting);

private:
    std::map<std::string, std::string> _entries;
};

} // namespace Datapath::Streaming
