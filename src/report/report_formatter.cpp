/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/report_formatter.hpp"
#include "systrack/config.hpp"
#include "systrack/utils.hpp"

#include <format>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace systrack::ReportFormatter {

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string network_level(const NetworkResult& network) {
    if (!network.online) {
        return "Offline";
    }
    if (network.latency_ms) {
        return std::format("Online ({:.0f}ms)", *network.latency_ms);
    }
    return "Online";
}

}  // namespace

std::string usage_level(double usage_percent) {
    return usage_percent >= Config::HIGH_USAGE_PERCENT ? "High" : "Normal";
}

std::string summary_line(const SystemSnapshot& snapshot, const NetworkResult& network) {
    return std::format("{} | {} | {} | {}",
                       usage_level(snapshot.cpu.usage_percent),
                       usage_level(snapshot.memory.usage_percent),
                       usage_level(snapshot.disk.usage_percent),
                       network_level(network));
}

std::string format_system_summary(const SystemSnapshot& snapshot) {
    return join_lines({
        std::format("OS: {} {}", snapshot.os.name, snapshot.os.release),
        std::format("CPU Usage: {:.1f}%", snapshot.cpu.usage_percent),
        std::format("Memory Usage: {:.1f}%", snapshot.memory.usage_percent),
        std::format("Disk Usage: {:.1f}%", snapshot.disk.usage_percent),
    });
}

std::string format_system_detailed(const SystemSnapshot& snapshot) {
    const auto& os = snapshot.os;
    const auto& mem = snapshot.memory;
    const auto& disk = snapshot.disk;

    return join_lines({
        "=== System Information ===",
        std::format("Operating System: {} {}", os.name, os.release),
        std::format("OS Version: {}", os.version),
        std::format("Platform: {}", os.platform),
        "",
        "=== CPU Information ===",
        std::format("CPU Usage: {:.1f}%", snapshot.cpu.usage_percent),
        std::format("CPU Cores: {}", snapshot.cpu.core_count),
        "",
        "=== Memory Information ===",
        std::format("Memory Usage: {:.1f}%", mem.usage_percent),
        std::format("Total Memory: {:.2f} GB", mem.total_gb),
        std::format("Used Memory: {:.2f} GB", mem.used_gb),
        std::format("Free Memory: {:.2f} GB", mem.free_gb),
        std::format("Available Memory: {:.2f} GB (includes {:.2f} GB cache)", mem.available_gb,
                    mem.cached_gb),
        "",
        "=== Disk Information ===",
        std::format("Disk Usage: {:.1f}%", disk.usage_percent),
        std::format("Total Disk Space: {:.2f} GB", disk.total_gb),
        std::format("Used Disk Space: {:.2f} GB", disk.used_gb),
        std::format("Free Disk Space: {:.2f} GB", disk.free_gb),
        "Note: Some disk space may be reserved by the system and not shown as free.",
    });
}

std::string format_network_summary(const NetworkResult& network) {
    if (network.online && network.latency_ms) {
        return std::format("Network: {}\nPing Time: {:.0f} ms", network.message, *network.latency_ms);
    }
    return std::format("Network: {}", network.message);
}

std::string format_network_detailed(const NetworkResult& network) {
    std::vector<std::string> lines = {
        "=== Network Diagnostics ===",
        std::format("Host Tested: {}", network.host),
        std::format("Status: {}", network.online ? "Online" : "Offline"),
    };
    if (network.latency_ms) {
        lines.push_back(std::format("Ping Time: {:.2f} ms", *network.latency_ms));
    }
    lines.push_back(std::format("Message: {}", network.message));
    lines.emplace_back();
    return join_lines(lines);
}

std::string format_summary(const SystemSnapshot& snapshot, const NetworkResult& network) {
    return std::format("{}\n\n{}", format_system_summary(snapshot), format_network_summary(network));
}

std::string format_detailed(const SystemSnapshot& snapshot, const NetworkResult& network) {
    return std::format("{}\n\n{}", format_system_detailed(snapshot), format_network_detailed(network));
}

std::string format_throughput(const ThroughputResult& result) {
    if (!result.success) {
        return std::format("Speedtest Error: {}",
                           result.error.message.empty() ? "Unknown error" : result.error.message);
    }

    const auto& server = result.server;
    const std::string& city = server.city.empty() ? server.name : server.city;

    return join_lines({
        "",
        "=== Ookla Speedtest Results ===",
        "",
        "[!] DISCLAIMER: Results are estimates based on the test server selected.",
        "    Server location/provider may not reflect your actual location/ISP.",
        "",
        std::format("Test Server: {}", server.name),
        std::format("Server Provider: {}", server.sponsor),
        std::format("Server Location: {}, {}", city, server.country),
        std::format("Distance to Server: {:.2f} km", server.distance_km),
        "",
        "Network Performance:",
        std::format("  Ping: {:.2f} ms", result.ping_ms),
        std::format("  Download Speed: {:.2f} Mbps", result.download_mbps),
        std::format("  Upload Speed: {:.2f} Mbps", result.upload_mbps),
    });
}

std::string format_ping(const NetworkResult& network) {
    if (!network.online) {
        return std::format("Ping {}: {}", network.host, network.message);
    }
    if (network.latency_ms && *network.latency_ms != 0.0) {
        return std::format("Ping {}: {:.2f}ms - Online", network.host, *network.latency_ms);
    }
    return std::format("Ping {}: Success - Online", network.host);
}

Report make_report(const SystemSnapshot& snapshot, const NetworkResult& network, ReportMode mode,
                   std::string_view date) {
    Report report;
    report.mode = mode;
    report.date_header = std::string(date);
    report.status_line = summary_line(snapshot, network);
    report.body = mode == ReportMode::Detailed ? format_detailed(snapshot, network)
                                               : format_summary(snapshot, network);
    return report;
}

std::string render(const Report& report) {
    std::string header = std::format("{} Diagnostic Report - {}", Config::APP_TITLE, report.date_header);
    std::string separator(header.size(), '-');

    return join_lines({
        header,
        separator,
        "",
        std::format("System Status: {}", report.status_line),
        "",
        separator,
        "",
        report.body,
    });
}

std::string assemble_report(const SystemSnapshot& snapshot, const NetworkResult& network,
                            ReportMode mode, std::string_view date) {
    return render(make_report(snapshot, network, mode, date));
}

ReportMode parse_report_mode(std::string_view text) {
    return to_lower(trim_sv(text)) == "detailed" ? ReportMode::Detailed : ReportMode::Summary;
}

nlohmann::json report_to_json(const SystemSnapshot& snapshot, const NetworkResult& network,
                              std::string_view date) {
    return nlohmann::json{
        {"date", std::string(date)},
        {"system", snapshot},
        {"network", network},
    };
}

}  // namespace systrack::ReportFormatter
