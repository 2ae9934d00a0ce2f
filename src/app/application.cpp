/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/application.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <future>
#include <iostream>
#include <print>
#include <stop_token>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "systrack/cli_renderer.hpp"
#include "systrack/color.hpp"
#include "systrack/command_runner.hpp"
#include "systrack/errors.hpp"
#include "systrack/http_client.hpp"
#include "systrack/interrupts.hpp"
#include "systrack/report_formatter.hpp"
#include "systrack/utils.hpp"

namespace fs = std::filesystem;

namespace systrack {

std::expected<RunOptions, std::string> parse_arguments(const std::vector<std::string>& args) {
    RunOptions options;

    auto take_value = [&](std::size_t& i, const std::string& flag) -> std::expected<std::string, std::string> {
        if (i + 1 >= args.size() || args[i + 1].starts_with("--")) {
            return std::unexpected(std::format("Option '{}' requires a value", flag));
        }
        return args[++i];
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
            return options;
        } else if (arg == "-v" || arg == "--version") {
            options.show_version = true;
            return options;
        } else if (arg == "--summary" || arg == "--detailed") {
            auto mode = arg == "--detailed" ? ReportMode::Detailed : ReportMode::Summary;
            if (options.mode && *options.mode != mode) {
                return std::unexpected(std::string("Options '--summary' and '--detailed' are mutually exclusive"));
            }
            options.mode = mode;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--output") {
            auto value = take_value(i, arg);
            if (!value) return std::unexpected(value.error());
            options.output_dir = *value;
        } else if (arg == "--host") {
            auto value = take_value(i, arg);
            if (!value) return std::unexpected(value.error());
            options.host = *value;
        } else if (arg == "--speedtest") {
            options.speedtest = true;
        } else if (arg == "--no-save") {
            options.save = false;
        } else if (arg == "--interactive") {
            options.interactive = true;
        } else {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
    }

    if (options.interactive && options.mode) {
        return std::unexpected(std::string("'--interactive' cannot be combined with a report mode"));
    }
    if (!options.interactive && !options.mode) {
        return std::unexpected(std::string("One of '--summary' or '--detailed' is required"));
    }
    return options;
}

void Application::show_help(const std::string& app_name) const {
    constexpr int w = Config::CLI_OPTION_LABEL_WIDTH;
    std::println("{} - System Diagnostic and Reporting Tool", Config::APP_TITLE);
    std::println("");
    std::println("Usage: {} (--summary | --detailed) [options]", app_name);
    std::println("       {} --interactive", app_name);
    std::println("");
    std::println("Options:");
    std::println("  {:<{}}Generate a summary report", "--summary", w);
    std::println("  {:<{}}Generate a detailed report", "--detailed", w);
    std::println("  {:<{}}Export report as JSON instead of text", "--json", w);
    std::println("  {:<{}}Output directory for reports (default: {})", "--output DIR", w, Config::DEFAULT_REPORTS_DIR);
    std::println("  {:<{}}Host to ping (default: {})", "--host HOST", w, Config::DEFAULT_PING_HOST);
    std::println("  {:<{}}Also measure throughput with Ookla speedtest", "--speedtest", w);
    std::println("  {:<{}}Print the report without writing it", "--no-save", w);
    std::println("  {:<{}}Read commands from stdin (type 'help')", "--interactive", w);
    std::println("  {:<{}}Show this help message", "-h, --help", w);
    std::println("  {:<{}}Show version information", "-v, --version", w);
    std::println("");
    std::println("Examples:");
    std::println("  {} --summary", app_name);
    std::println("  {} --detailed", app_name);
    std::println("  {} --summary --json", app_name);
    std::println("  {} --detailed --output reports/", app_name);
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Licensed under the Mozilla Public License 2.0");
}

void Application::run_report(const RunOptions& options, HostCollector& collector,
                             ReachabilityProbe& probe, ThroughputMeter& meter,
                             const ReportStore& store) const {
    std::println("Collecting system information...");
    auto snapshot = collector.collect();
    check_interrupted();

    std::println("Checking network connectivity...");
    auto network = probe.check_reachability(options.host, std::chrono::seconds(Config::PING_TIMEOUT_SEC));
    check_interrupted();

    std::string date = store.date_header();
    auto mode = options.mode.value_or(ReportMode::Summary);

    if (options.json) {
        auto data = ReportFormatter::report_to_json(snapshot, network, date);
        if (options.save) {
            auto path = store.save_json(std::move(data));
            std::println("\nReport saved: {}", path.string());
        } else {
            std::println("\n{}", data.dump(2));
        }
    } else {
        std::string report = ReportFormatter::assemble_report(snapshot, network, mode, date);
        std::println("\n{}", report);
        if (options.save) {
            auto path = store.save_text(report);
            std::println("\nReport saved: {}", Color::colorize(path.string(), Color::GREEN));
        }
    }

    if (options.speedtest) {
        std::stop_source stop;
        auto pending = meter.measure_throughput_async(stop.get_token());
        while (pending.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (g_interrupted) {
                stop.request_stop();
            }
        }
        auto result = pending.get();
        check_interrupted();
        if (options.json) {
            std::println("\n{}", nlohmann::json(result).dump(2));
        } else {
            CliRenderer::render_throughput(result);
        }
    }
}

void Application::run_interactive(Dispatcher& dispatcher) const {
    std::println("{} interactive session (v{})", Config::APP_TITLE, Config::APP_VERSION);
    std::println("Type 'help' for available commands, 'exit' to quit.");

    std::string line;
    while (true) {
        std::print("{}> ", Config::APP_NAME);
        std::cout.flush();

        if (!std::getline(std::cin, line)) {
            check_interrupted();
            std::println("");
            break;
        }

        std::string command = to_lower(trim(line));
        if (command.empty()) continue;
        if (command == "exit" || command == "quit") break;

        try {
            CliRenderer::render_dispatch(dispatcher.dispatch(line));
        } catch (const Interrupted&) {
            throw;
        } catch (const std::exception& e) {
            CliRenderer::print_error(e.what());
        }
    }
}

int Application::run(int argc, char* argv[]) {
    try {
        SignalGuard signal_guard;

        std::string app_name{Config::APP_NAME};
        if (argc > 0) {
            app_name = fs::path(argv[0]).filename().string();
            if (app_name.empty())
                app_name = Config::APP_NAME;
        }

        std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
        auto parsed = parse_arguments(args);
        if (!parsed) {
            CliRenderer::print_error(parsed.error());
            show_help(app_name);
            return 1;
        }
        const RunOptions& options = *parsed;

        if (options.show_help) {
            show_help(app_name);
            return 0;
        }
        if (options.show_version) {
            show_version();
            return 0;
        }

        ShellCommandRunner runner;
        MetricsCollector collector;
        NetworkProbe probe(runner);
        HttpClient http;
        SpeedTest speed_test(http, runner);
        speed_test.set_spinner(CliRenderer::make_spinner_callback());
        ReportStore store(options.output_dir);

        if (options.interactive) {
            DispatcherOptions dispatch_options;
            dispatch_options.ping_host = options.host;
            Dispatcher dispatcher(collector, probe, speed_test, store, dispatch_options);
            run_interactive(dispatcher);
        } else {
            run_report(options, collector, probe, speed_test, store);
        }

    } catch (const Interrupted& e) {
        std::println("\n\n{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        CliRenderer::print_error(e.what());
        return 1;
    }

    return 0;
}

}  // namespace systrack
