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
#include <sstream>
#include <string>
#include <system_error>

#include <sys/utsname.h>

namespace systrack {

std::string parse_pretty_name(std::string_view os_release) {
    std::istringstream stream{std::string(os_release)};
    std::string line;
    while (std::getline(stream, line)) {
        if (line.starts_with("PRETTY_NAME=")) {
            auto pretty_name = trim(std::string_view(line).substr(12));

            if (!pretty_name.empty() &&
                (pretty_name.front() == '"' || pretty_name.front() == '\'')) {
                pretty_name = pretty_name.substr(1);
            }

            if (!pretty_name.empty() &&
                (pretty_name.back() == '"' || pretty_name.back() == '\'')) {
                pretty_name.pop_back();
            }

            return pretty_name;
        }
    }
    return {};
}

OsInfo MetricsCollector::collect_os() const {
    struct utsname buffer;
    if (::uname(&buffer) != 0) {
        throw CollectionError(
            std::format("uname failed: {}", std::system_category().message(errno)));
    }

    OsInfo info;
    info.name = buffer.sysname;
    info.release = buffer.release;
    info.version = buffer.version;
    info.platform = std::format("{}-{}-{}", buffer.sysname, buffer.release, buffer.machine);

    // Missing os-release is common in minimal containers and is not an error.
    if (auto content = read_text_file(options_.os_release)) {
        auto pretty_name = parse_pretty_name(*content);
        if (!pretty_name.empty()) {
            info.platform += std::format(" ({})", pretty_name);
        }
    }

    return info;
}

}  // namespace systrack
