/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <string_view>

namespace systrack::Config {
constexpr std::string_view APP_NAME = "systrack";
constexpr std::string_view APP_TITLE = "SysTrack";
constexpr std::string_view APP_VERSION = "1.0.0";

constexpr std::string_view DEFAULT_REPORTS_DIR = "reports";
constexpr std::string_view DEFAULT_REPORT_PREFIX = "sysreport";
constexpr std::string_view DEFAULT_PING_HOST = "google.com";

constexpr long PING_TIMEOUT_SEC = 3;
constexpr long PING_GRACE_MS = 1000;
constexpr long CPU_SAMPLE_INTERVAL_MS = 1000;
constexpr double HIGH_USAGE_PERCENT = 80.0;
constexpr double BYTES_PER_GIB = 1024.0 * 1024.0 * 1024.0;

constexpr std::string_view PROC_ROOT = "/proc";
constexpr std::string_view OS_RELEASE_PATH = "/etc/os-release";
constexpr std::string_view ROOT_VOLUME = "/";

constexpr long HTTP_TIMEOUT_SEC = 10;
constexpr long HTTP_CONNECT_TIMEOUT_SEC = 10;
constexpr long SPEEDTEST_DL_TIMEOUT_SEC = 60;
constexpr long SPEEDTEST_RUN_TIMEOUT_SEC = 120;
constexpr std::string_view SPEEDTEST_BINARY = "speedtest";
constexpr std::string_view SPEEDTEST_CLI_PATH = "speedtest-cli/speedtest";
constexpr std::string_view SPEEDTEST_TGZ = "speedtest.tgz";
constexpr std::string_view SPEEDTEST_SERVERS_URL =
    "https://www.speedtest.net/api/js/servers?engine=js&https_functional=true&limit=10";
constexpr std::string_view SPEEDTEST_DOWNLOAD_URL =
    "https://install.speedtest.net/app/cli/ookla-speedtest-1.2.0-linux-{}.tgz";

constexpr std::size_t MAX_PIPE_OUTPUT = 10 * 1024 * 1024;
constexpr int UI_SPINNER_DELAY_MS = 150;
constexpr int CLI_OPTION_LABEL_WIDTH = 22;
}  // namespace systrack::Config
