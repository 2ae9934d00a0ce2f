/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cerrno>
#include <chrono>
#include <expected>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>

#include "systrack/command_runner.hpp"
#include "systrack/http_client.hpp"
#include "systrack/metrics_collector.hpp"
#include "systrack/network_probe.hpp"
#include "systrack/speed_test.hpp"

namespace systrack::testing {

/// Command runner that replays a canned result or runs a custom action.
class FakeRunner : public CommandRunner {
  public:
    CommandOutput next;
    std::function<CommandOutput()> action;
    std::vector<std::vector<std::string>> calls;
    std::chrono::milliseconds last_timeout{0};

    CommandOutput run(const std::vector<std::string>& args, std::chrono::milliseconds timeout,
                      std::stop_token) override {
        calls.push_back(args);
        last_timeout = timeout;
        if (action) {
            return action();
        }
        return next;
    }
};

/// HTTP fetcher that answers every GET with the same body or error.
class FakeHttp : public HttpFetcher {
  public:
    std::expected<std::string, HttpError> response;
    std::vector<std::string> urls;

    std::expected<std::string, HttpError> get(const std::string& url) override {
        urls.push_back(url);
        return response;
    }

    std::expected<void, HttpError> download(const std::string& url, const std::string&) override {
        urls.push_back(url);
        return std::unexpected(HttpError{HttpError::Kind::Connection, 0, "download disabled"});
    }
};

class FakeCollector : public HostCollector {
  public:
    SystemSnapshot snapshot;
    std::function<void()> fail;
    int calls = 0;

    SystemSnapshot collect() override {
        ++calls;
        if (fail) fail();
        return snapshot;
    }
};

class FakeProbe : public ReachabilityProbe {
  public:
    NetworkResult result;
    std::function<void()> fail;
    std::vector<std::string> hosts;

    NetworkResult check_reachability(const std::string& host, std::chrono::seconds) override {
        hosts.push_back(host);
        if (fail) fail();
        NetworkResult r = result;
        r.host = host;
        return r;
    }
};

class FakeMeter : public ThroughputMeter {
  public:
    ThroughputResult result;
    int calls = 0;

    ThroughputResult measure_throughput(std::stop_token) override {
        ++calls;
        return result;
    }
};

inline SystemSnapshot make_snapshot(double cpu, double mem, double disk) {
    SystemSnapshot s;
    s.cpu = {cpu, 8};
    s.memory = {mem, 16.0, 8.0, 4.0, 8.0, 4.0};
    s.disk = {disk, 100.0, 60.0, 40.0};
    s.os = {"Linux", "#1 SMP PREEMPT_DYNAMIC", "6.1.0-18-amd64",
            "Linux-6.1.0-18-amd64-x86_64 (Debian GNU/Linux 12 (bookworm))"};
    return s;
}

inline NetworkResult make_online(const std::string& host, double latency) {
    NetworkResult r;
    r.online = true;
    r.host = host;
    r.latency_ms = latency;
    r.message = "Online (Ping " + host + ": " + std::to_string(static_cast<int>(latency + 0.5)) + "ms)";
    return r;
}

/// Private directory under the system temp dir, removed on destruction.
class TempDir {
    std::filesystem::path path_;

  public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "systrack_test_XXXXXX").string();
        if (::mkdtemp(tmpl.data()) == nullptr) {
            throw std::system_error(errno, std::generic_category(), "mkdtemp");
        }
        path_ = tmpl;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
};

}  // namespace systrack::testing
