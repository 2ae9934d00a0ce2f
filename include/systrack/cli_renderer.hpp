/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string_view>

#include "systrack/dispatcher.hpp"
#include "systrack/results.hpp"
#include "systrack/speed_test.hpp"

namespace systrack::CliRenderer {
void print_error(std::string_view message);

void render_throughput(const ThroughputResult& result);

// Prints a dispatch result; CLEAR_SCREEN becomes an ANSI clear.
void render_dispatch(const DispatchResult& result);

// Animated spinner on a TTY, a plain "label..." line otherwise.
SpinnerCallback make_spinner_callback();
}  // namespace systrack::CliRenderer
