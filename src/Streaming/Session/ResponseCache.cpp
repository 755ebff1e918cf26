/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "ResponseCache.h"

namespace Datapath::Streaming {

CacheLookup ResponseCache::check(RequestId reqId) {
    std::unique_lock<std::mutex> lock(_mutex);

    auto it = _entries.find(reqId);
    if (!_invalidation && it != _entries.end() && std::holds_alternative<std::monostate>(it->second)) {
        // Another stream is still producing this response
        _cv.wait(lock, [&]() {
            if (_invalidation) {
                return true;
            }
            auto pending = _entries.find(reqId);
            return pending == _entries.end() || !std::holds_alternative<std::monostate>(pending->second);
        });
        it = _entries.find(reqId);
    }

    if (_invalidation) {
        return *_invalidation;
    }

    if (it == _entries.end()) {
        _entries.emplace(reqId, std::monostate{});
        return std::monostate{};
    }

    return it->second;
}

void ResponseCache::update(RequestId reqId, const DataResponse& response) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto [it, inserted] = _entries.try_emplace(reqId, response);
        if (!inserted && std::holds_alternative<std::monostate>(it->second)) {
            it->second = response;
        }
    }
    _cv.notify_all();
}

void ResponseCache::cleanup(RequestId reqId) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.erase(reqId);
    }
    _cv.notify_all();
}

bool ResponseCache::invalidate(const DatapathFault& fault) {
    bool lost = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_invalidation) {
            lost = true;
        } else {
            _invalidation = fault;
        }

        for (auto& [reqId, entry] : _entries) {
            if (std::holds_alternative<std::monostate>(entry)) {
                entry = fault;
                lost = true;
            } else if (std::holds_alternative<DatapathFault>(entry)) {
                lost = true;
            }
        }
    }
    _cv.notify_all();
    return lost;
}

bool ResponseCache::invalidated() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _invalidation.has_value();
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries.size();
}

} // namespace Datapath::Streaming
