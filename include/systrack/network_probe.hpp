/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "systrack/command_runner.hpp"
#include "systrack/results.hpp"

namespace systrack {

class ReachabilityProbe {
   public:
    virtual ~ReachabilityProbe() = default;

    // Unreachable hosts, timeouts and execution errors come back as
    // online=false results. Throws ProbeUnavailable when ping is missing.
    virtual NetworkResult check_reachability(const std::string& host,
                                             std::chrono::seconds timeout) = 0;
};

class NetworkProbe final : public ReachabilityProbe {
    CommandRunner& runner_;
    std::string ping_program_;

   public:
    explicit NetworkProbe(CommandRunner& runner, std::string ping_program = "ping");

    NetworkResult check_reachability(const std::string& host,
                                     std::chrono::seconds timeout) override;
};

std::vector<std::string> ping_command(std::string_view program,
                                      const std::string& host,
                                      std::chrono::seconds timeout);

// First "time=<N>" or "time<<N>" token, case-insensitive. Never throws.
std::optional<double> parse_latency_ms(std::string_view ping_output);

}  // namespace systrack
