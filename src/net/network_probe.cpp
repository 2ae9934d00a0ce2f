/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/network_probe.hpp"
#include "systrack/config.hpp"
#include "systrack/errors.hpp"
#include "systrack/shell_pipe.hpp"
#include "systrack/utils.hpp"

#include <format>
#include <regex>
#include <system_error>
#include <utility>

namespace systrack {

namespace {

NetworkResult offline(const std::string& host, std::string message) {
    NetworkResult result;
    result.online = false;
    result.host = host;
    result.message = std::move(message);
    return result;
}

}  // namespace

std::vector<std::string> ping_command(std::string_view program,
                                      const std::string& host,
                                      std::chrono::seconds timeout) {
    return {std::string(program), "-c", "1", "-W", std::to_string(timeout.count()), host};
}

std::optional<double> parse_latency_ms(std::string_view ping_output) {
    try {
        static const std::regex pattern(R"(time[<=]\s*(\d+\.?\d*))", std::regex::icase);

        std::string text(ping_output);
        std::smatch match;
        if (!std::regex_search(text, match, pattern)) {
            return std::nullopt;
        }

        auto value = parse_number<double>(match.str(1));
        if (!value) {
            return std::nullopt;
        }
        return *value;
    } catch (const std::regex_error&) {
        return std::nullopt;
    }
}

NetworkProbe::NetworkProbe(CommandRunner& runner, std::string ping_program)
    : runner_(runner), ping_program_(std::move(ping_program)) {}

NetworkResult NetworkProbe::check_reachability(const std::string& host,
                                               std::chrono::seconds timeout) {
    const auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(timeout) +
                        std::chrono::milliseconds(Config::PING_GRACE_MS);

    CommandOutput out;
    try {
        out = runner_.run(ping_command(ping_program_, host, timeout), budget);
    } catch (const CommandTimeout&) {
        return offline(host, std::format("Offline (Timeout connecting to {})", host));
    } catch (const std::system_error& e) {
        if (e.code() == std::errc::no_such_file_or_directory) {
            throw ProbeUnavailable("ping command not found. Network diagnostics unavailable.");
        }
        return offline(host, std::format("Offline (Error: {})", e.what()));
    } catch (const std::exception& e) {
        return offline(host, std::format("Offline (Error: {})", e.what()));
    }

    if (out.exit_code != 0) {
        return offline(host, std::format("Offline (Unable to reach {})", host));
    }

    NetworkResult result;
    result.online = true;
    result.host = host;
    result.latency_ms = parse_latency_ms(out.output);
    if (result.latency_ms) {
        result.message = std::format("Online (Ping {}: {:.0f}ms)", host, *result.latency_ms);
    } else {
        result.message = std::format("Online (Ping {}: Success)", host);
    }
    return result;
}

}  // namespace systrack
