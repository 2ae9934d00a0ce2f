/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "fakes.hpp"
#include "systrack/dispatcher.hpp"
#include "systrack/errors.hpp"

using namespace systrack;
using namespace systrack::testing;
using json = nlohmann::json;

class DispatcherTest : public ::testing::Test {
  protected:
    TempDir dir;
    FakeCollector collector;
    FakeProbe probe;
    FakeMeter meter;
    ReportStore store{dir.path() / "reports"};
    Dispatcher dispatcher{collector, probe, meter, store};

    void SetUp() override {
        collector.snapshot = make_snapshot(10.0, 20.0, 30.0);
        probe.result = make_online("google.com", 43.2);
        meter.result = ThroughputResult::failure(ThroughputErrorKind::DependencyMissing, "no cli");
    }
};

TEST_F(DispatcherTest, UnknownVerbTouchesNothing) {
    auto result = dispatcher.dispatch("frobnicate");
    EXPECT_EQ(result.output, "Unknown command: frobnicate\nType 'help' for available commands.");
    EXPECT_FALSE(result.error);
    EXPECT_EQ(collector.calls, 0);
    EXPECT_TRUE(probe.hosts.empty());
    EXPECT_EQ(meter.calls, 0);
    EXPECT_FALSE(std::filesystem::exists(store.directory()));
}

TEST_F(DispatcherTest, HelpAndAlias) {
    auto help = dispatcher.dispatch("help");
    EXPECT_NE(help.output.find("summary"), std::string::npos);
    EXPECT_NE(help.output.find("ping [host]"), std::string::npos);
    EXPECT_EQ(dispatcher.dispatch("?").output, help.output);
}

TEST_F(DispatcherTest, ClearIsSentinelAndCaseInsensitive) {
    auto result = dispatcher.dispatch("  CLS ");
    EXPECT_EQ(result.output, CLEAR_SCREEN);
    EXPECT_TRUE(result.clear_screen);
    EXPECT_TRUE(dispatcher.dispatch("clear").clear_screen);
}

TEST_F(DispatcherTest, SummaryRendersAndSaves) {
    auto result = dispatcher.dispatch("Summary");
    ASSERT_FALSE(result.error);
    EXPECT_TRUE(result.output.starts_with("SysTrack Diagnostic Report - "));
    EXPECT_NE(result.output.find("System Status: Normal | Normal | Normal | Online (43ms)"), std::string::npos);
    EXPECT_NE(result.output.find("\n\nReport saved: "), std::string::npos);
    EXPECT_EQ(collector.calls, 1);
    ASSERT_EQ(probe.hosts.size(), 1u);
    EXPECT_EQ(probe.hosts[0], "google.com");
    EXPECT_EQ(std::distance(std::filesystem::directory_iterator(store.directory()),
                            std::filesystem::directory_iterator{}),
              1);
}

TEST_F(DispatcherTest, DetailedUsesDetailedBody) {
    auto result = dispatcher.dispatch("detailed");
    EXPECT_NE(result.output.find("=== Disk Information ==="), std::string::npos);
}

TEST_F(DispatcherTest, CollectionErrorBecomesSingleMessage) {
    collector.fail = [] { throw CollectionError("Failed to collect system information: boom"); };
    auto result = dispatcher.dispatch("summary");
    ASSERT_TRUE(result.error);
    EXPECT_EQ(*result.error, "Error generating report: Failed to collect system information: boom");
    EXPECT_TRUE(result.output.empty());
}

TEST_F(DispatcherTest, PersistenceErrorKeepsReport) {
    std::filesystem::path blocker = dir.path() / "blocker";
    std::ofstream(blocker) << "file";
    ReportStore broken(blocker / "reports");
    Dispatcher d(collector, probe, meter, broken);

    auto result = d.dispatch("summary");
    EXPECT_FALSE(result.error);
    EXPECT_TRUE(result.output.starts_with("SysTrack Diagnostic Report - "));
    EXPECT_NE(result.output.find("\n\nWarning: Failed to save text report: "), std::string::npos);
    EXPECT_EQ(result.output.find("Report saved:"), std::string::npos);
}

TEST_F(DispatcherTest, PingDefaultsAndFormats) {
    EXPECT_EQ(dispatcher.dispatch("ping").output, "Ping google.com: 43.20ms - Online");
    EXPECT_EQ(dispatcher.dispatch("ping 8.8.8.8").output, "Ping 8.8.8.8: 43.20ms - Online");
    EXPECT_EQ(meter.calls, 0);
}

TEST_F(DispatcherTest, PingOffline) {
    probe.result.online = false;
    probe.result.latency_ms.reset();
    probe.result.message = "Offline (Timeout connecting to host.example)";
    EXPECT_EQ(dispatcher.dispatch("ping host.example").output,
              "Ping host.example: Offline (Timeout connecting to host.example)");
}

TEST_F(DispatcherTest, PingWithSpeedAppendsThroughput) {
    auto result = dispatcher.dispatch("ping --speed 1.1.1.1");
    EXPECT_EQ(result.output, "Ping 1.1.1.1: 43.20ms - Online\nSpeedtest Error: no cli");
    EXPECT_EQ(meter.calls, 1);
}

TEST_F(DispatcherTest, MissingPingToolIsReported) {
    probe.fail = [] { throw ProbeUnavailable("ping command not found. Network diagnostics unavailable."); };
    auto result = dispatcher.dispatch("ping example.org");
    ASSERT_TRUE(result.error);
    EXPECT_EQ(*result.error,
              "Error pinging example.org: ping command not found. Network diagnostics unavailable.");
}

TEST_F(DispatcherTest, SpeedtestVerb) {
    EXPECT_EQ(dispatcher.dispatch("speedtest").output, "Speedtest Error: no cli");
    EXPECT_EQ(meter.calls, 1);
}

TEST_F(DispatcherTest, RequestWithoutCommandIs400) {
    for (const auto& request : {json::object(), json{{"command", "   "}}, json{{"command", 5}}}) {
        auto response = handle_command_request(dispatcher, request);
        EXPECT_EQ(response.status, 400);
        EXPECT_EQ(response.body["output"], "");
        EXPECT_EQ(response.body["error"], "No command provided");
    }
}

TEST_F(DispatcherTest, RequestSuccessHasNullError) {
    auto response = handle_command_request(dispatcher, json{{"command", "help"}});
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(response.body["error"].is_null());
    EXPECT_EQ(response.body["output"], help_text());
}

TEST_F(DispatcherTest, RequestCoreErrorIs200WithError) {
    collector.fail = [] { throw CollectionError("disk gone"); };
    auto response = handle_command_request(dispatcher, json{{"command", "summary"}});
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["output"], "");
    EXPECT_EQ(response.body["error"], "Error generating report: disk gone");
}

TEST_F(DispatcherTest, RequestUnexpectedErrorIs500) {
    collector.fail = [] { throw std::logic_error("unexpected"); };
    auto response = handle_command_request(dispatcher, json{{"command", "detailed"}});
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.body["error"], "unexpected");
}
