/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file RequestQueue.h
 * @brief Queue shared by the intake reader, async completions and the dispatch loop
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <variant>

#include "../Protocol/Messages.h"

namespace Datapath::Streaming {

/// Pushed exactly once by the intake reader when the inbound stream is done
struct EndOfStream {};

/**
 * @brief One item of the dispatch queue
 *
 * - DataRequest: raw inbound request from the client
 * - DataResponse: finished response injected by an asynchronous get
 * - EndOfStream: the intake reader has exited
 */
using QueueItem = std::variant<DataRequest, DataResponse, EndOfStream>;

/**
 * @brief Unbounded multi-producer, single-consumer queue
 *
 * Thread Safety: All public methods are thread-safe.
 */
class RequestQueue {
public:
    RequestQueue() = default;

    RequestQueue(const RequestQueue&) = delete;
    RequestQueue& operator=(const RequestQueue&) = delete;

    void push(QueueItem item);

    /**
     * @brief Block until an item is available and remove it
     */
    QueueItem pop();

    size_t size() const;

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<QueueItem> _items;
};

} // namespace Datapath::Streaming
