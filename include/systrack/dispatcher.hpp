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

#include <nlohmann/json.hpp>

#include "systrack/config.hpp"
#include "systrack/metrics_collector.hpp"
#include "systrack/network_probe.hpp"
#include "systrack/report_store.hpp"
#include "systrack/results.hpp"
#include "systrack/speed_test.hpp"

namespace systrack {

inline constexpr std::string_view CLEAR_SCREEN = "CLEAR_SCREEN";

struct DispatchResult {
    std::string output;
    // Set when a core failure replaced the output.
    std::optional<std::string> error;
    bool clear_screen = false;
};

struct DispatcherOptions {
    std::string ping_host{Config::DEFAULT_PING_HOST};
    std::chrono::seconds ping_timeout{Config::PING_TIMEOUT_SEC};
};

class Dispatcher {
    HostCollector& collector_;
    ReachabilityProbe& probe_;
    ThroughputMeter& meter_;
    const ReportStore& store_;
    DispatcherOptions options_;

    DispatchResult run_report(ReportMode mode);
    DispatchResult run_ping(const std::vector<std::string>& args);
    DispatchResult run_speedtest();

   public:
    Dispatcher(HostCollector& collector, ReachabilityProbe& probe, ThroughputMeter& meter,
               const ReportStore& store, DispatcherOptions options = {});

    // Verbs are case-insensitive. Interrupted and unanticipated exceptions
    // propagate; the documented core errors come back in `error`.
    DispatchResult dispatch(std::string_view command_line);
};

std::string help_text();

struct CommandResponse {
    int status = 200;
    nlohmann::json body;
};

// JSON boundary for a web transport: {"command": "..."} in,
// {"output": ..., "error": ...} plus an HTTP-style status out.
CommandResponse handle_command_request(Dispatcher& dispatcher, const nlohmann::json& request);

}  // namespace systrack
