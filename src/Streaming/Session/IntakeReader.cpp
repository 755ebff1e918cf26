/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "IntakeReader.h"

#include <Logging/Logger.h>

#include <format>

namespace Datapath::Streaming {

IntakeReader::IntakeReader(std::shared_ptr<DataStream> stream, std::shared_ptr<RequestQueue> queue)
    : _stream(std::move(stream))
    , _queue(std::move(queue))
    , _state(std::make_shared<State>())
{
}

IntakeReader::~IntakeReader() {
    if (_thread.joinable()) {
        // join() was never called
        _stream->cancel();
        _thread.join();
    }
}

void IntakeReader::start() {
    _thread = std::thread(&IntakeReader::run, _stream, _queue, _state);
}

void IntakeReader::run(std::shared_ptr<DataStream> stream,
                       std::shared_ptr<RequestQueue> queue,
                       std::shared_ptr<State> state) {
    while (true) {
        auto next = stream->read();
        if (next.failed()) {
            ENTROPY_LOG_DEBUG_CAT("IntakeReader",
                std::format("Closing reader thread, stream error reading request: {}",
                            next.errorMessage.empty() ? errorToString(next.error) : next.errorMessage));
            break;
        }
        if (!next.value) {
            break;
        }
        queue->push(std::move(*next.value));
    }

    queue->push(EndOfStream{});

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->done = true;
    }
    state->cv.notify_all();
}

bool IntakeReader::join(std::chrono::milliseconds timeout) {
    if (!_thread.joinable()) {
        return true;
    }

    bool exited;
    {
        std::unique_lock<std::mutex> lock(_state->mutex);
        exited = _state->cv.wait_for(lock, timeout, [this]() { return _state->done; });
    }

    if (exited) {
        _thread.join();
        return true;
    }

    _thread.detach();
    return false;
}

bool IntakeReader::finished() const {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->done;
}

} // namespace Datapath::Streaming
