/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "RequestQueue.h"

namespace Datapath::Streaming {

void RequestQueue::push(QueueItem item) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _items.push_back(std::move(item));
    }
    _cv.notify_one();
}

QueueItem RequestQueue::pop() {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv.wait(lock, [this]() { return !_items.empty(); });
    QueueItem item = std::move(_items.front());
    _items.pop_front();
    return item;
}

size_t RequestQueue::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _items.size();
}

} // namespace Datapath::Streaming
