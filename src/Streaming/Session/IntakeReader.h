/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file IntakeReader.h
 * @brief Background thread draining a DataStream into a RequestQueue
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "../Transport/DataStream.h"
#include "RequestQueue.h"

namespace Datapath::Streaming {

/**
 * @brief Reader thread of one connection
 *
 * Pulls requests off the stream and pushes them onto the queue until the
 * stream ends or fails, then pushes EndOfStream. The thread shares ownership
 * of the stream and the queue, so join() may give up and detach it without
 * leaving it with dangling references.
 */
class IntakeReader {
public:
    IntakeReader(std::shared_ptr<DataStream> stream, std::shared_ptr<RequestQueue> queue);
    ~IntakeReader();

    IntakeReader(const IntakeReader&) = delete;
    IntakeReader& operator=(const IntakeReader&) = delete;

    void start();

    /**
     * @brief Wait for the reader to exit
     *
     * If it has not exited within the timeout the thread is detached.
     *
     * @param timeout Longest time to wait
     * @return true if the reader exited and was joined
     */
    bool join(std::chrono::milliseconds timeout);

    bool finished() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
    };

    static void run(std::shared_ptr<DataStream> stream,
                    std::shared_ptr<RequestQueue> queue,
                    std::shared_ptr<State> state);

    std::shared_ptr<DataStream> _stream;
    std::shared_ptr<RequestQueue> _queue;
    std::shared_ptr<State> _state;
    std::thread _thread;
};

} // namespace Datapath::Streaming
