// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "systrack/config.hpp"
#include "systrack/results.hpp"

namespace systrack {

// Aggregate jiffies from the first "cpu" line of /proc/stat.
struct CpuTimes {
    std::uint64_t busy = 0;
    std::uint64_t total = 0;
};

// Bytes, as read from /proc/meminfo.
struct MemInfo {
    std::uint64_t total = 0;
    std::uint64_t free = 0;
    std::uint64_t available = 0;
};

struct DiskInfo {
    std::uint64_t total = 0;
    std::uint64_t used = 0;
    std::uint64_t free = 0;
};

class HostCollector {
   public:
    virtual ~HostCollector() = default;

    // Throws CollectionError; never returns a partial snapshot.
    virtual SystemSnapshot collect() = 0;
};

struct CollectorOptions {
    std::filesystem::path proc_root{Config::PROC_ROOT};
    std::filesystem::path os_release{Config::OS_RELEASE_PATH};
    std::filesystem::path disk_path{Config::ROOT_VOLUME};
    std::chrono::milliseconds sample_interval{Config::CPU_SAMPLE_INTERVAL_MS};
};

class MetricsCollector final : public HostCollector {
    CollectorOptions options_;

   public:
    explicit MetricsCollector(CollectorOptions options = {});

    SystemSnapshot collect() override;

    // Blocks for the sampling window.
    CpuStats collect_cpu() const;
    MemoryStats collect_memory() const;
    DiskStats collect_disk() const;
    OsInfo collect_os() const;
};

CpuTimes parse_cpu_times(std::string_view proc_stat);
double cpu_usage_between(const CpuTimes& before, const CpuTimes& after);

MemInfo parse_meminfo(std::string_view proc_meminfo);
MemoryStats make_memory_stats(const MemInfo& info);
DiskStats make_disk_stats(const DiskInfo& info);

std::string parse_pretty_name(std::string_view os_release);

// Bytes to GiB, rounded to 2 decimals.
double to_gib(std::uint64_t bytes);

}  // namespace systrack
