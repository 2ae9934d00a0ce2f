/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <stop_token>
#include <string>
#include <vector>

namespace systrack {

struct CommandOutput {
    std::string output;
    int exit_code = -1;
};

// Seam between the probes and process execution.
//
// Implementations throw CommandTimeout when `timeout` expires and
// std::system_error when the program cannot be started.
class CommandRunner {
   public:
    virtual ~CommandRunner() = default;

    virtual CommandOutput run(const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout,
                              std::stop_token stop = {}) = 0;
};

class ShellCommandRunner final : public CommandRunner {
   public:
    CommandOutput run(const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout,
                      std::stop_token stop = {}) override;
};

}  // namespace systrack
