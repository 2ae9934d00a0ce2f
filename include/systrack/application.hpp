/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "systrack/config.hpp"
#include "systrack/dispatcher.hpp"
#include "systrack/metrics_collector.hpp"
#include "systrack/network_probe.hpp"
#include "systrack/report_store.hpp"
#include "systrack/results.hpp"
#include "systrack/speed_test.hpp"

namespace systrack {

struct RunOptions {
    std::optional<ReportMode> mode;
    bool json = false;
    std::filesystem::path output_dir{Config::DEFAULT_REPORTS_DIR};
    std::string host{Config::DEFAULT_PING_HOST};
    bool speedtest = false;
    bool save = true;
    bool interactive = false;
    bool show_help = false;
    bool show_version = false;
};

// Usage errors come back as the message to print before the help text.
std::expected<RunOptions, std::string> parse_arguments(const std::vector<std::string>& args);

class Application {
   public:
    int run(int argc, char* argv[]);

   private:
    void show_help(const std::string& app_name) const;
    void show_version() const;

    void run_report(const RunOptions& options, HostCollector& collector, ReachabilityProbe& probe,
                    ThroughputMeter& meter, const ReportStore& store) const;
    void run_interactive(Dispatcher& dispatcher) const;
};

}  // namespace systrack
