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

#include <format>
#include <utility>

namespace systrack {

MetricsCollector::MetricsCollector(CollectorOptions options) : options_(std::move(options)) {}

SystemSnapshot MetricsCollector::collect() {
    try {
        SystemSnapshot snapshot;
        snapshot.cpu = collect_cpu();
        snapshot.memory = collect_memory();
        snapshot.disk = collect_disk();
        snapshot.os = collect_os();
        return snapshot;
    } catch (const Interrupted&) {
        throw;
    } catch (const std::exception& e) {
        throw CollectionError(std::format("Failed to collect system information: {}", e.what()));
    }
}

double to_gib(std::uint64_t bytes) {
    return round_to(static_cast<double>(bytes) / Config::BYTES_PER_GIB, 2);
}

}  // namespace systrack
