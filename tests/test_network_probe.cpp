/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <gtest/gtest.h>

#include <system_error>

#include "fakes.hpp"
#include "systrack/errors.hpp"
#include "systrack/network_probe.hpp"
#include "systrack/shell_pipe.hpp"

using namespace systrack;
using systrack::testing::FakeRunner;
using namespace std::chrono_literals;

TEST(LatencyParse, AcceptsEqualsAndLessThan) {
    EXPECT_EQ(parse_latency_ms("64 bytes from 1.1.1.1: icmp_seq=1 ttl=57 time=43.2 ms"), 43.2);
    EXPECT_EQ(parse_latency_ms("Reply from 10.0.0.1: bytes=32 time<1ms TTL=64"), 1.0);
    EXPECT_EQ(parse_latency_ms("TIME=7 ms"), 7.0);
}

TEST(LatencyParse, FirstMatchWins) {
    EXPECT_EQ(parse_latency_ms("time=5.5 ms\ntime=9.9 ms"), 5.5);
}

TEST(LatencyParse, AbsentLatencyIsNullopt) {
    EXPECT_FALSE(parse_latency_ms("1 packets transmitted, 1 received"));
    EXPECT_FALSE(parse_latency_ms(""));
}

TEST(PingCommand, SingleEchoWithTimeout) {
    auto args = ping_command("ping", "example.org", 3s);
    std::vector<std::string> expected{"ping", "-c", "1", "-W", "3", "example.org"};
    EXPECT_EQ(args, expected);
}

TEST(NetworkProbe, OnlineWithLatency) {
    FakeRunner runner;
    runner.next = {"64 bytes from 142.250.0.1: icmp_seq=1 ttl=117 time=43.2 ms\n", 0};
    NetworkProbe probe(runner);

    auto result = probe.check_reachability("google.com", 3s);
    EXPECT_TRUE(result.online);
    EXPECT_EQ(result.host, "google.com");
    ASSERT_TRUE(result.latency_ms);
    EXPECT_DOUBLE_EQ(*result.latency_ms, 43.2);
    EXPECT_EQ(result.message, "Online (Ping google.com: 43ms)");
    EXPECT_EQ(runner.last_timeout, 4000ms);
}

TEST(NetworkProbe, OnlineWithoutLatency) {
    FakeRunner runner;
    runner.next = {"1 packets transmitted, 1 received\n", 0};
    NetworkProbe probe(runner);

    auto result = probe.check_reachability("10.0.0.1", 3s);
    EXPECT_TRUE(result.online);
    EXPECT_FALSE(result.latency_ms);
    EXPECT_EQ(result.message, "Online (Ping 10.0.0.1: Success)");
}

TEST(NetworkProbe, NonzeroExitIsUnreachable) {
    FakeRunner runner;
    runner.next = {"1 packets transmitted, 0 received, 100% packet loss\n", 1};
    NetworkProbe probe(runner);

    auto result = probe.check_reachability("unreachable.invalid", 3s);
    EXPECT_FALSE(result.online);
    EXPECT_FALSE(result.latency_ms);
    EXPECT_EQ(result.message, "Offline (Unable to reach unreachable.invalid)");
}

TEST(NetworkProbe, TimeoutIsOffline) {
    FakeRunner runner;
    runner.action = []() -> CommandOutput { throw CommandTimeout("Command timed out after 4000 ms"); };
    NetworkProbe probe(runner);

    auto result = probe.check_reachability("slow.example", 3s);
    EXPECT_FALSE(result.online);
    EXPECT_EQ(result.message, "Offline (Timeout connecting to slow.example)");
}

TEST(NetworkProbe, MissingPingThrowsProbeUnavailable) {
    FakeRunner runner;
    runner.action = []() -> CommandOutput {
        throw std::system_error(ENOENT, std::generic_category(), "Failed to execute 'ping'");
    };
    NetworkProbe probe(runner);

    EXPECT_THROW(probe.check_reachability("google.com", 3s), ProbeUnavailable);
}

TEST(NetworkProbe, OtherExecutionErrorIsOffline) {
    FakeRunner runner;
    runner.action = []() -> CommandOutput {
        throw std::system_error(EACCES, std::generic_category(), "Failed to execute 'ping'");
    };
    NetworkProbe probe(runner);

    auto result = probe.check_reachability("google.com", 3s);
    EXPECT_FALSE(result.online);
    EXPECT_TRUE(result.message.starts_with("Offline (Error: "));
}

TEST(NetworkProbe, CallsAreIndependent) {
    FakeRunner runner;
    NetworkProbe probe(runner);

    runner.next = {"time=10 ms", 0};
    auto first = probe.check_reachability("a.example", 3s);
    runner.next = {"", 2};
    auto second = probe.check_reachability("b.example", 3s);

    EXPECT_TRUE(first.online);
    EXPECT_FALSE(second.online);
    EXPECT_EQ(runner.calls.size(), 2u);
    EXPECT_EQ(runner.calls[1].back(), "b.example");
}

TEST(NetworkProbe, RealMissingBinaryThroughShellRunner) {
    ShellCommandRunner runner;
    NetworkProbe probe(runner, "/nonexistent/systrack-ping");
    EXPECT_THROW(probe.check_reachability("localhost", 1s), ProbeUnavailable);
}
