/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#pragma once

#include <chrono>

namespace Datapath {
namespace Streaming {

/// Clock used for session last-seen and connection start times
using SessionClock = std::chrono::steady_clock;

} // namespace Streaming
} // namespace Datapath
