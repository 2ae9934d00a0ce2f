/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/dispatcher.hpp"
#include "systrack/errors.hpp"
#include "systrack/report_formatter.hpp"
#include "systrack/utils.hpp"

#include <format>

using json = nlohmann::json;

namespace systrack {

namespace {

DispatchResult failed(std::string message) {
    DispatchResult result;
    result.error = std::move(message);
    return result;
}

}  // namespace

std::string help_text() {
    return "SysTrack Terminal Commands\n"
           "========================\n"
           "help, ?               - Show this help message\n"
           "summary               - Generate summary system report\n"
           "detailed              - Generate detailed system report\n"
           "ping [host] [--speed] - Test network connectivity (default: google.com)\n"
           "speedtest             - Measure throughput against the nearest Ookla server\n"
           "clear, cls            - Clear the terminal screen\n"
           "\n"
           "Examples:\n"
           "  summary\n"
           "  detailed\n"
           "  ping 8.8.8.8\n"
           "  ping --speed\n"
           "  clear\n";
}

Dispatcher::Dispatcher(HostCollector& collector, ReachabilityProbe& probe, ThroughputMeter& meter,
                       const ReportStore& store, DispatcherOptions options)
    : collector_(collector), probe_(probe), meter_(meter), store_(store), options_(std::move(options)) {}

DispatchResult Dispatcher::dispatch(std::string_view command_line) {
    auto parts = split_whitespace(command_line);
    if (parts.empty()) {
        return failed("No command provided");
    }

    std::string verb = to_lower(parts.front());
    std::vector<std::string> args(parts.begin() + 1, parts.end());

    if (verb == "help" || verb == "?") {
        return {help_text(), std::nullopt, false};
    }
    if (verb == "summary") {
        return run_report(ReportMode::Summary);
    }
    if (verb == "detailed") {
        return run_report(ReportMode::Detailed);
    }
    if (verb == "ping") {
        return run_ping(args);
    }
    if (verb == "speedtest") {
        return run_speedtest();
    }
    if (verb == "clear" || verb == "cls") {
        return {std::string(CLEAR_SCREEN), std::nullopt, true};
    }

    return {std::format("Unknown command: {}\nType 'help' for available commands.", verb),
            std::nullopt, false};
}

DispatchResult Dispatcher::run_report(ReportMode mode) {
    std::string report;
    try {
        auto snapshot = collector_.collect();
        auto network = probe_.check_reachability(options_.ping_host, options_.ping_timeout);
        report = ReportFormatter::assemble_report(snapshot, network, mode, store_.date_header());
    } catch (const CollectionError& e) {
        return failed(std::format("Error generating report: {}", e.what()));
    } catch (const ProbeUnavailable& e) {
        return failed(std::format("Error generating report: {}", e.what()));
    }

    try {
        auto path = store_.save_text(report);
        return {std::format("{}\n\nReport saved: {}", report, path.string()), std::nullopt, false};
    } catch (const PersistenceError& e) {
        return {std::format("{}\n\nWarning: {}", report, e.what()), std::nullopt, false};
    }
}

DispatchResult Dispatcher::run_ping(const std::vector<std::string>& args) {
    std::string host = options_.ping_host;
    bool with_speed = false;
    bool host_set = false;
    for (const auto& arg : args) {
        if (to_lower(arg) == "--speed") {
            with_speed = true;
        } else if (!host_set) {
            host = arg;
            host_set = true;
        }
    }

    std::string output;
    try {
        output = ReportFormatter::format_ping(probe_.check_reachability(host, options_.ping_timeout));
    } catch (const ProbeUnavailable& e) {
        return failed(std::format("Error pinging {}: {}", host, e.what()));
    }

    if (with_speed) {
        output += '\n';
        output += ReportFormatter::format_throughput(meter_.measure_throughput({}));
    }
    return {std::move(output), std::nullopt, false};
}

DispatchResult Dispatcher::run_speedtest() {
    return {ReportFormatter::format_throughput(meter_.measure_throughput({})), std::nullopt, false};
}

CommandResponse handle_command_request(Dispatcher& dispatcher, const json& request) {
    std::string command;
    if (request.is_object() && request.contains("command") && request["command"].is_string()) {
        command = trim(request["command"].get<std::string>());
    }

    if (command.empty()) {
        return {400, json{{"output", ""}, {"error", "No command provided"}}};
    }

    try {
        auto result = dispatcher.dispatch(command);
        if (result.error) {
            return {200, json{{"output", ""}, {"error", *result.error}}};
        }
        return {200, json{{"output", result.output}, {"error", nullptr}}};
    } catch (const std::exception& e) {
        return {500, json{{"output", ""}, {"error", e.what()}}};
    }
}

}  // namespace systrack
