/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/metrics_collector.hpp"
#include "systrack/errors.hpp"
#include "systrack/interrupts.hpp"
#include "systrack/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <thread>

#include <unistd.h>

namespace systrack {

namespace {

CpuTimes read_cpu_times(const std::filesystem::path& proc_root) {
    auto content = read_text_file(proc_root / "stat");
    if (!content) {
        throw CollectionError(content.error());
    }
    return parse_cpu_times(*content);
}

}  // namespace

CpuTimes parse_cpu_times(std::string_view proc_stat) {
    auto line_end = proc_stat.find('\n');
    std::string_view line = proc_stat.substr(0, line_end);

    auto fields = split_whitespace(line);
    // cpu user nice system idle iowait irq softirq steal [guest guest_nice]
    if (fields.size() < 5 || fields[0] != "cpu") {
        throw CollectionError("Unexpected /proc/stat format: missing aggregate cpu line");
    }

    std::array<std::uint64_t, 8> values{};
    std::size_t count = std::min<std::size_t>(fields.size() - 1, values.size());
    for (std::size_t i = 0; i < count; ++i) {
        auto value = parse_number<std::uint64_t>(fields[i + 1]);
        if (!value) {
            throw CollectionError(
                std::format("Unexpected /proc/stat format: bad counter '{}'", fields[i + 1]));
        }
        values[i] = *value;
    }

    // guest and guest_nice are already folded into user and nice.
    std::uint64_t total = 0;
    for (auto v : values)
        total += v;
    const std::uint64_t idle = values[3] + values[4];

    return CpuTimes{total - idle, total};
}

double cpu_usage_between(const CpuTimes& before, const CpuTimes& after) {
    if (after.total <= before.total || after.busy < before.busy) {
        return 0.0;
    }

    const auto total_delta = static_cast<double>(after.total - before.total);
    const auto busy_delta = static_cast<double>(after.busy - before.busy);
    return round_to(std::clamp(busy_delta / total_delta * 100.0, 0.0, 100.0), 1);
}

CpuStats MetricsCollector::collect_cpu() const {
    CpuStats stats;

    auto before = read_cpu_times(options_.proc_root);
    std::this_thread::sleep_for(options_.sample_interval);
    check_interrupted();
    auto after = read_cpu_times(options_.proc_root);

    stats.usage_percent = cpu_usage_between(before, after);
    stats.core_count = static_cast<int>(std::max(1L, ::sysconf(_SC_NPROCESSORS_ONLN)));
    return stats;
}

}  // namespace systrack
