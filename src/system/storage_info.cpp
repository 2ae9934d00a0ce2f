/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/metrics_collector.hpp"
#include "systrack/errors.hpp"
#include "systrack/utils.hpp"

#include <cerrno>
#include <format>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

#include <sys/statvfs.h>

namespace systrack {

namespace {

double percent_of(std::uint64_t part, std::uint64_t whole) {
    if (whole == 0)
        return 0.0;
    return round_to(static_cast<double>(part) / static_cast<double>(whole) * 100.0, 1);
}

}  // namespace

MemInfo parse_meminfo(std::string_view proc_meminfo) {
    std::optional<std::uint64_t> total, free, available, buffers, cached;

    std::istringstream stream{std::string(proc_meminfo)};
    std::string line;
    while (std::getline(stream, line)) {
        std::string_view sv = line;
        auto colon = sv.find(':');
        if (colon == std::string_view::npos)
            continue;

        std::string_view key = sv.substr(0, colon);
        // "MemAvailable:    8056220 kB"
        auto tokens = split_whitespace(sv.substr(colon + 1));
        if (tokens.empty())
            continue;

        auto value = parse_number<std::uint64_t>(tokens[0]);
        if (!value)
            continue;
        std::uint64_t bytes = *value * 1024;

        if (key == "MemTotal")
            total = bytes;
        else if (key == "MemFree")
            free = bytes;
        else if (key == "MemAvailable")
            available = bytes;
        else if (key == "Buffers")
            buffers = bytes;
        else if (key == "Cached")
            cached = bytes;
    }

    if (!total || !free) {
        throw CollectionError("Unexpected /proc/meminfo format: MemTotal or MemFree missing");
    }

    MemInfo info;
    info.total = *total;
    info.free = *free;
    // Kernels before 3.14 have no MemAvailable.
    info.available = available ? *available : *free + buffers.value_or(0) + cached.value_or(0);
    return info;
}

MemoryStats make_memory_stats(const MemInfo& info) {
    MemoryStats stats;
    const std::uint64_t used = info.total > info.available ? info.total - info.available : 0;

    stats.usage_percent = percent_of(used, info.total);
    stats.total_gb = to_gib(info.total);
    stats.used_gb = to_gib(used);
    stats.free_gb = to_gib(info.free);
    stats.available_gb = to_gib(info.available);
    stats.cached_gb = round_to(stats.available_gb - stats.free_gb, 2);
    return stats;
}

DiskStats make_disk_stats(const DiskInfo& info) {
    DiskStats stats;
    stats.usage_percent = percent_of(info.used, info.used + info.free);
    stats.total_gb = to_gib(info.total);
    stats.used_gb = to_gib(info.used);
    stats.free_gb = to_gib(info.free);
    return stats;
}

MemoryStats MetricsCollector::collect_memory() const {
    auto content = read_text_file(options_.proc_root / "meminfo");
    if (!content) {
        throw CollectionError(content.error());
    }
    return make_memory_stats(parse_meminfo(*content));
}

DiskStats MetricsCollector::collect_disk() const {
    struct statvfs disk;

    if (::statvfs(options_.disk_path.c_str(), &disk) != 0) {
        throw CollectionError(std::format("statvfs('{}') failed: {}",
                                          options_.disk_path.string(),
                                          std::system_category().message(errno)));
    }

    DiskInfo info;
    info.total = static_cast<std::uint64_t>(disk.f_blocks) * disk.f_frsize;
    info.free = static_cast<std::uint64_t>(disk.f_bavail) * disk.f_frsize;

    auto used_blocks = (disk.f_blocks > disk.f_bfree ? disk.f_blocks - disk.f_bfree : 0);
    info.used = static_cast<std::uint64_t>(used_blocks) * disk.f_frsize;

    return make_disk_stats(info);
}

}  // namespace systrack
