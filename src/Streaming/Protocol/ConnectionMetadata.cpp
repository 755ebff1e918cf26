/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "ConnectionMetadata.h"
#include "../Core/DatapathTypes.h"

#include <Logging/Logger.h>

#include <format>

namespace Datapath::Streaming {

std::optional<std::string> ConnectionMetadata::get(const std::string& key) const {
    auto it = _entries.find(key);
    if (it == _entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> ConnectionMetadata::clientId() const {
    return get(METADATA_CLIENT_ID);
}

bool ConnectionMetadata::reconnecting() const {
    auto value = get(METADATA_RECONNECTING);
    if (!value || (*value != "True" && *value != "False")) {
        ENTROPY_LOG_WARNING_CAT("ConnectionMetadata",
            std::format("Client connecting with invalid value for \"reconnecting\": {}. "
                        "This may be because you have a mismatched client and server version.",
                        value ? *value : std::string("<missing>")));
        return false;
    }
    return *value == "True";
}

ConnectionMetadata ConnectionMetadata::forClient(const std::string& clientId, bool reconnecting) {
    ConnectionMetadata metadata;
    metadata.set(METADATA_CLIENT_ID, clientId);
    metadata.set(METADATA_RECONNECTING, reconnecting ? "True" : "False");
    return metadata;
}

} // namespace Datapath::Streaming
