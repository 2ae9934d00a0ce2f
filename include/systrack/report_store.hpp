/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "systrack/config.hpp"

namespace systrack {

using Clock = std::function<std::chrono::system_clock::time_point()>;

// Writes report artifacts as <prefix>_<YYYY-MM-DD_HH-MM>.<ext> under one
// directory. Two saves within the same minute target the same file and the
// later one replaces the earlier.
class ReportStore {
    std::filesystem::path directory_;
    Clock clock_;

    void write_atomic(const std::filesystem::path& path, std::string_view content) const;

   public:
    explicit ReportStore(std::filesystem::path directory = std::filesystem::path(Config::DEFAULT_REPORTS_DIR),
                         Clock clock = std::chrono::system_clock::now);

    const std::filesystem::path& directory() const { return directory_; }

    // Both throw PersistenceError.
    std::filesystem::path save_text(std::string_view content,
                                    std::string_view prefix = Config::DEFAULT_REPORT_PREFIX) const;
    std::filesystem::path save_json(nlohmann::json data,
                                    std::string_view prefix = Config::DEFAULT_REPORT_PREFIX) const;

    // Local time, YYYY-MM-DD.
    std::string date_header() const;

    static nlohmann::json load_json(const std::filesystem::path& path);
};

// Local-time renderings of `tp`.
std::string file_timestamp(std::chrono::system_clock::time_point tp);
std::string date_stamp(std::chrono::system_clock::time_point tp);
std::string iso_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace systrack
