/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "systrack/results.hpp"

// Pure rendering. Nothing here touches the host, the clock or the disk.
namespace systrack::ReportFormatter {

// "High" at or above the threshold, "Normal" below it.
std::string usage_level(double usage_percent);

std::string summary_line(const SystemSnapshot& snapshot, const NetworkResult& network);

std::string format_system_summary(const SystemSnapshot& snapshot);
std::string format_system_detailed(const SystemSnapshot& snapshot);
std::string format_network_summary(const NetworkResult& network);
std::string format_network_detailed(const NetworkResult& network);

std::string format_summary(const SystemSnapshot& snapshot, const NetworkResult& network);
std::string format_detailed(const SystemSnapshot& snapshot, const NetworkResult& network);

std::string format_throughput(const ThroughputResult& result);

// One line per outcome, as the interactive ping verb prints it.
std::string format_ping(const NetworkResult& network);

Report make_report(const SystemSnapshot& snapshot, const NetworkResult& network, ReportMode mode,
                   std::string_view date);

// Full text artifact: header, status line, then the mode body.
std::string assemble_report(const SystemSnapshot& snapshot, const NetworkResult& network,
                            ReportMode mode, std::string_view date);
std::string render(const Report& report);

ReportMode parse_report_mode(std::string_view text);

nlohmann::json report_to_json(const SystemSnapshot& snapshot, const NetworkResult& network,
                              std::string_view date);

}  // namespace systrack::ReportFormatter
