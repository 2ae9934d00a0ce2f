/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <gtest/gtest.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "fakes.hpp"
#include "systrack/errors.hpp"
#include "systrack/report_formatter.hpp"
#include "systrack/report_store.hpp"

using namespace systrack;
using systrack::testing::TempDir;
namespace fs = std::filesystem;

namespace {

// 2024-03-05 14:07:00 local time.
std::chrono::system_clock::time_point fixed_time(int second = 0) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 5;
    tm.tm_hour = 14;
    tm.tm_min = 7;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST(ReportStore, TextFileNameFollowsClock) {
    TempDir dir;
    ReportStore store(dir.path() / "reports", [] { return fixed_time(); });

    auto path = store.save_text("hello\nworld\n");
    EXPECT_EQ(path, dir.path() / "reports" / "sysreport_2024-03-05_14-07.txt");
    EXPECT_EQ(slurp(path), "hello\nworld\n");
    EXPECT_EQ(std::distance(fs::directory_iterator(path.parent_path()), fs::directory_iterator{}), 1);
}

TEST(ReportStore, CreatesNestedDirectory) {
    TempDir dir;
    ReportStore store(dir.path() / "a" / "b" / "c", [] { return fixed_time(); });
    auto path = store.save_text("x", "custom");
    EXPECT_TRUE(fs::is_regular_file(path));
    EXPECT_EQ(path.filename(), "custom_2024-03-05_14-07.txt");
}

TEST(ReportStore, SameMinuteLastWriteWins) {
    TempDir dir;
    int second = 0;
    ReportStore store(dir.path(), [&second] { return fixed_time(second); });

    auto first = store.save_text("first");
    second = 42;
    auto again = store.save_text("second");

    EXPECT_EQ(first, again);
    EXPECT_EQ(slurp(again), "second");
}

TEST(ReportStore, ConcurrentSavesOfSameArtifactDoNotCollide) {
    TempDir dir;
    ReportStore store(dir.path(), [] { return fixed_time(); });

    const std::string a(256 * 1024, 'a');
    const std::string b(256 * 1024, 'b');
    std::string errors_a;
    std::string errors_b;

    auto writer = [&store](const std::string& payload, std::string& errors) {
        for (int i = 0; i < 50; ++i) {
            try {
                store.save_text(payload);
            } catch (const PersistenceError& e) {
                errors += e.what();
                errors += '\n';
            }
        }
    };

    std::thread first(writer, std::cref(a), std::ref(errors_a));
    std::thread second(writer, std::cref(b), std::ref(errors_b));
    first.join();
    second.join();

    EXPECT_EQ(errors_a, "");
    EXPECT_EQ(errors_b, "");

    auto path = dir.path() / "sysreport_2024-03-05_14-07.txt";
    auto text = slurp(path);
    EXPECT_TRUE(text == a || text == b);

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir.path())) {
        names.push_back(entry.path().filename().string());
    }
    EXPECT_EQ(names, std::vector<std::string>{"sysreport_2024-03-05_14-07.txt"});
}

TEST(ReportStore, DateHeaderUsesClock) {
    ReportStore store("unused", [] { return fixed_time(); });
    EXPECT_EQ(store.date_header(), "2024-03-05");
}

TEST(ReportStore, JsonGetsIsoTimestampAndRoundTrips) {
    TempDir dir;
    ReportStore store(dir.path(), [] { return fixed_time() + std::chrono::microseconds(1500); });

    auto snapshot = systrack::testing::make_snapshot(10.0, 20.0, 30.0);
    auto network = systrack::testing::make_online("google.com", 43.2);
    auto data = ReportFormatter::report_to_json(snapshot, network, store.date_header());
    data["note"] = "café";

    auto path = store.save_json(data);
    EXPECT_EQ(path.filename(), "sysreport_2024-03-05_14-07.json");

    auto text = slurp(path);
    EXPECT_NE(text.find("\n  \"date\": \"2024-03-05\""), std::string::npos);
    EXPECT_NE(text.find("café"), std::string::npos);

    auto loaded = ReportStore::load_json(path);
    EXPECT_EQ(loaded["timestamp"], "2024-03-05T14:07:00.001500");
    EXPECT_EQ(loaded["system"].get<SystemSnapshot>(), snapshot);
    EXPECT_EQ(loaded["network"].get<NetworkResult>(), network);
}

TEST(ReportStore, UnwritableDirectoryIsPersistenceError) {
    TempDir dir;
    auto blocker = dir.path() / "not-a-dir";
    std::ofstream(blocker) << "file";

    ReportStore store(blocker / "reports", [] { return fixed_time(); });
    try {
        store.save_text("x");
        FAIL() << "expected PersistenceError";
    } catch (const PersistenceError& e) {
        EXPECT_TRUE(std::string(e.what()).starts_with("Failed to save text report: "));
    }

    try {
        store.save_json(nlohmann::json::object());
        FAIL() << "expected PersistenceError";
    } catch (const PersistenceError& e) {
        EXPECT_TRUE(std::string(e.what()).starts_with("Failed to save JSON report: "));
    }
}

TEST(ReportStore, LoadingMissingFileIsPersistenceError) {
    EXPECT_THROW(ReportStore::load_json("/nonexistent/systrack.json"), PersistenceError);
}
