/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/command_runner.hpp"
#include "systrack/shell_pipe.hpp"

namespace systrack {

CommandOutput ShellCommandRunner::run(const std::vector<std::string>& args,
                                      std::chrono::milliseconds timeout,
                                      std::stop_token stop) {
    ShellPipe pipe(args);

    CommandOutput result;
    result.output = pipe.read_all(timeout, stop);
    result.exit_code = pipe.wait();
    return result;
}

}  // namespace systrack
