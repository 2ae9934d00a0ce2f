/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace systrack {

namespace {

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec)
        return false;
    return ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

std::optional<fs::path> find_executable(std::string_view name) {
    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string_view::npos) {
        fs::path candidate(name);
        if (is_executable_file(candidate))
            return candidate;
        return std::nullopt;
    }

    const char* env_path = std::getenv("PATH");
    std::string_view search = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";

    while (!search.empty()) {
        auto sep = search.find(':');
        std::string_view dir = search.substr(0, sep);
        search = (sep == std::string_view::npos) ? std::string_view{} : search.substr(sep + 1);

        fs::path candidate = dir.empty() ? fs::path(".") : fs::path(dir);
        candidate /= name;
        if (is_executable_file(candidate))
            return candidate;
    }
    return std::nullopt;
}

std::expected<std::string, std::string> read_text_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(std::format(
            "Cannot read '{}': {}", path.string(), std::system_category().message(errno)));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(std::format("Read error on '{}'", path.string()));
    }
    return buffer.str();
}

}  // namespace systrack
