// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json_fwd.hpp>

namespace systrack {

struct CpuStats {
    double usage_percent = 0.0;
    int core_count = 1;

    bool operator==(const CpuStats&) const = default;
};

// GiB values are rounded to 2 decimals. cached_gb is available_gb - free_gb
// and is left negative when the kernel reports available < free.
struct MemoryStats {
    double usage_percent = 0.0;
    double total_gb = 0.0;
    double used_gb = 0.0;
    double free_gb = 0.0;
    double available_gb = 0.0;
    double cached_gb = 0.0;

    bool operator==(const MemoryStats&) const = default;
};

struct DiskStats {
    double usage_percent = 0.0;
    double total_gb = 0.0;
    double used_gb = 0.0;
    double free_gb = 0.0;

    bool operator==(const DiskStats&) const = default;
};

struct OsInfo {
    std::string name;
    std::string version;
    std::string release;
    std::string platform;

    bool operator==(const OsInfo&) const = default;
};

struct SystemSnapshot {
    CpuStats cpu;
    MemoryStats memory;
    DiskStats disk;
    OsInfo os;

    bool operator==(const SystemSnapshot&) const = default;
};

struct NetworkResult {
    bool online = false;
    std::string host;
    std::optional<double> latency_ms;
    std::string message;

    bool operator==(const NetworkResult&) const = default;
};

enum class ThroughputErrorKind { DependencyMissing, Forbidden, ConnectionError, Other };

struct ThroughputError {
    ThroughputErrorKind kind = ThroughputErrorKind::Other;
    std::string message;
};

struct ThroughputServer {
    std::string name;
    std::string city;
    std::string sponsor;
    std::string country;
    double distance_km = 0.0;
    std::string id;
};

struct ThroughputResult {
    bool success = false;
    double download_mbps = 0.0;
    double upload_mbps = 0.0;
    double ping_ms = 0.0;
    ThroughputServer server;
    ThroughputError error;

    static ThroughputResult failure(ThroughputErrorKind kind, std::string message) {
        ThroughputResult result;
        result.error = {kind, std::move(message)};
        return result;
    }
};

enum class ReportMode { Summary, Detailed };

struct Report {
    ReportMode mode = ReportMode::Summary;
    std::string date_header;
    std::string status_line;
    std::string body;
};

std::string_view to_string(ThroughputErrorKind kind);

void to_json(nlohmann::json& j, const SystemSnapshot& s);
void from_json(const nlohmann::json& j, SystemSnapshot& s);
void to_json(nlohmann::json& j, const NetworkResult& r);
void from_json(const nlohmann::json& j, NetworkResult& r);
void to_json(nlohmann::json& j, const ThroughputResult& r);

}  // namespace systrack
