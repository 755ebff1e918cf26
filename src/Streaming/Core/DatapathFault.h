/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

/**
 * @file DatapathFault.h
 * @brief Status-carrying exception raised inside the dispatch loop
 */

#pragma once

#include <stdexcept>
#include <string>

#include "ErrorCodes.h"

namespace Datapath::Streaming {

/**
 * @brief Fault that escapes a request and ends the dispatch loop
 *
 * Carries the status code to report on the stream. Whether the session may be
 * resumed afterwards is derived from the code (see isUnrecoverableStatus()).
 * Faults without a status (plain std::exception) are always unrecoverable.
 */
class DatapathFault : public std::runtime_error {
public:
    DatapathFault(StatusCode code, const std::string& details)
        : std::runtime_error(details)
        , _code(code)
    {
    }

    StatusCode code() const noexcept { return _code; }
    std::string details() const { return what(); }

    bool recoverable() const noexcept {
        return !isUnrecoverableStatus(_code);
    }

private:
    StatusCode _code;
};

} // namespace Datapath::Streaming
