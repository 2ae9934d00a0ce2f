// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "systrack/results.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace systrack {

std::string_view to_string(ThroughputErrorKind kind) {
    switch (kind) {
        case ThroughputErrorKind::DependencyMissing:
            return "dependency-missing";
        case ThroughputErrorKind::Forbidden:
            return "forbidden";
        case ThroughputErrorKind::ConnectionError:
            return "connection-error";
        case ThroughputErrorKind::Other:
            break;
    }
    return "other";
}

void to_json(json& j, const SystemSnapshot& s) {
    j = json{
        {"cpu", {{"usage_percent", s.cpu.usage_percent}, {"core_count", s.cpu.core_count}}},
        {"memory",
         {{"usage_percent", s.memory.usage_percent},
          {"total_gb", s.memory.total_gb},
          {"used_gb", s.memory.used_gb},
          {"free_gb", s.memory.free_gb},
          {"available_gb", s.memory.available_gb},
          {"cached_gb", s.memory.cached_gb}}},
        {"disk",
         {{"usage_percent", s.disk.usage_percent},
          {"total_gb", s.disk.total_gb},
          {"used_gb", s.disk.used_gb},
          {"free_gb", s.disk.free_gb}}},
        {"os",
         {{"name", s.os.name},
          {"version", s.os.version},
          {"release", s.os.release},
          {"platform", s.os.platform}}},
    };
}

void from_json(const json& j, SystemSnapshot& s) {
    const auto& cpu = j.at("cpu");
    cpu.at("usage_percent").get_to(s.cpu.usage_percent);
    cpu.at("core_count").get_to(s.cpu.core_count);

    const auto& mem = j.at("memory");
    mem.at("usage_percent").get_to(s.memory.usage_percent);
    mem.at("total_gb").get_to(s.memory.total_gb);
    mem.at("used_gb").get_to(s.memory.used_gb);
    mem.at("free_gb").get_to(s.memory.free_gb);
    mem.at("available_gb").get_to(s.memory.available_gb);
    mem.at("cached_gb").get_to(s.memory.cached_gb);

    const auto& disk = j.at("disk");
    disk.at("usage_percent").get_to(s.disk.usage_percent);
    disk.at("total_gb").get_to(s.disk.total_gb);
    disk.at("used_gb").get_to(s.disk.used_gb);
    disk.at("free_gb").get_to(s.disk.free_gb);

    const auto& os = j.at("os");
    os.at("name").get_to(s.os.name);
    os.at("version").get_to(s.os.version);
    os.at("release").get_to(s.os.release);
    os.at("platform").get_to(s.os.platform);
}

void to_json(json& j, const NetworkResult& r) {
    j = json{
        {"online", r.online},
        {"host", r.host},
        {"latency_ms", r.latency_ms ? json(*r.latency_ms) : json(nullptr)},
        {"message", r.message},
    };
}

void from_json(const json& j, NetworkResult& r) {
    j.at("online").get_to(r.online);
    j.at("host").get_to(r.host);
    const auto& latency = j.at("latency_ms");
    if (latency.is_null()) {
        r.latency_ms.reset();
    } else {
        r.latency_ms = latency.get<double>();
    }
    j.at("message").get_to(r.message);
}

void to_json(json& j, const ThroughputResult& r) {
    if (!r.success) {
        j = json{
            {"success", false},
            {"error", r.error.message},
            {"error_kind", std::string(to_string(r.error.kind))},
        };
        return;
    }

    j = json{
        {"success", true},
        {"download_mbps", r.download_mbps},
        {"upload_mbps", r.upload_mbps},
        {"ping_ms", r.ping_ms},
        {"server",
         {{"name", r.server.name},
          {"city", r.server.city},
          {"sponsor", r.server.sponsor},
          {"country", r.server.country},
          {"distance", r.server.distance_km},
          {"id", r.server.id}}},
    };
}

}  // namespace systrack
