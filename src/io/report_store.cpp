/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/report_store.hpp"
#include "systrack/errors.hpp"
#include "systrack/file_descriptor.hpp"
#include "systrack/utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <format>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace systrack {

namespace {

std::tm local_tm(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (::localtime_r(&t, &tm) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "localtime_r failed");
    }
    return tm;
}

std::string strftime_str(const std::tm& tm, const char* fmt) {
    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

[[noreturn]] void discard_temp(const std::string& tmp, int err, std::string_view what) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw std::system_error(err, std::generic_category(), std::format("{} '{}'", what, tmp));
}

}  // namespace

std::string file_timestamp(std::chrono::system_clock::time_point tp) {
    return strftime_str(local_tm(tp), "%Y-%m-%d_%H-%M");
}

std::string date_stamp(std::chrono::system_clock::time_point tp) {
    return strftime_str(local_tm(tp), "%Y-%m-%d");
}

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    auto since_epoch = tp.time_since_epoch();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                      since_epoch - std::chrono::duration_cast<std::chrono::seconds>(since_epoch))
                      .count();
    if (micros < 0) micros += 1000000;
    return std::format("{}.{:06}", strftime_str(local_tm(tp), "%Y-%m-%dT%H:%M:%S"), micros);
}

ReportStore::ReportStore(fs::path directory, Clock clock)
    : directory_(std::move(directory)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = std::chrono::system_clock::now;
    }
}

std::string ReportStore::date_header() const {
    return date_stamp(clock_());
}

void ReportStore::write_atomic(const fs::path& path, std::string_view content) const {
    fs::create_directories(directory_);

    // Each writer gets its own temp file in the target directory so that
    // concurrent saves of the same artifact only race on the final rename.
    std::string tmp = path.string() + ".XXXXXX";
    FileDescriptor fd(::mkstemp(tmp.data()));
    if (!fd) {
        throw std::system_error(errno, std::generic_category(),
                                std::format("Cannot create temp file for '{}'", path.string()));
    }

    if (::fchmod(fd.get(), 0644) == -1) {
        discard_temp(tmp, errno, "Cannot set permissions on");
    }

    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd.get(), data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            discard_temp(tmp, errno, "Write failed on");
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }

    if (::close(fd.release()) == -1) {
        discard_temp(tmp, errno, "Close failed on");
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw fs::filesystem_error("Cannot replace report", tmp, path, ec);
    }
}

fs::path ReportStore::save_text(std::string_view content, std::string_view prefix) const {
    try {
        fs::path path = directory_ / std::format("{}_{}.txt", prefix, file_timestamp(clock_()));
        write_atomic(path, content);
        return path;
    } catch (const std::exception& e) {
        throw PersistenceError(std::format("Failed to save text report: {}", e.what()));
    }
}

fs::path ReportStore::save_json(json data, std::string_view prefix) const {
    try {
        auto now = clock_();
        fs::path path = directory_ / std::format("{}_{}.json", prefix, file_timestamp(now));
        data["timestamp"] = iso_timestamp(now);
        write_atomic(path, data.dump(2));
        return path;
    } catch (const std::exception& e) {
        throw PersistenceError(std::format("Failed to save JSON report: {}", e.what()));
    }
}

json ReportStore::load_json(const fs::path& path) {
    auto text = read_text_file(path);
    if (!text) {
        throw PersistenceError(std::format("Failed to load JSON report: {}", text.error()));
    }
    try {
        return json::parse(*text);
    } catch (const json::parse_error& e) {
        throw PersistenceError(std::format("Failed to load JSON report: {}", e.what()));
    }
}

}  // namespace systrack
