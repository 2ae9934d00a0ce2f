/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/cli_renderer.hpp"

#include <chrono>
#include <cstdio>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <thread>

#include "systrack/color.hpp"
#include "systrack/config.hpp"
#include "systrack/report_formatter.hpp"

namespace systrack::CliRenderer {

namespace {

class UiSpinner {
    std::string text_;
    std::jthread worker_;

public:
    void start(std::string_view text) {
        stop();
        text_ = text;

        worker_ = std::jthread([this](std::stop_token st) {
            static constexpr std::string_view frames = "|/-\\";
            std::size_t idx = 0;

            while (!st.stop_requested()) {
                std::print("\r {} {}", text_, frames[idx++ % frames.size()]);
                std::cout.flush();

                std::this_thread::sleep_for(std::chrono::milliseconds(Config::UI_SPINNER_DELAY_MS));
            }

            std::print("\r{}\r", std::string(text_.size() + 3, ' '));
            std::cout.flush();
        });
    }

    void stop() {
        worker_ = std::jthread();
    }
};

}  // namespace

void print_error(std::string_view message) {
    std::println(stderr, "{}", Color::colorize(std::format("Error: {}", message), Color::RED, STDERR_FILENO));
}

void render_throughput(const ThroughputResult& result) {
    std::string block = ReportFormatter::format_throughput(result);
    if (!result.success) {
        std::println("{}", Color::colorize(block, Color::RED));
        return;
    }
    std::println("{}", block);
}

void render_dispatch(const DispatchResult& result) {
    if (result.clear_screen) {
        std::print("\033[2J\033[H");
        std::cout << std::flush;
        return;
    }
    if (result.error) {
        std::println("{}", Color::colorize(*result.error, Color::RED));
        return;
    }
    std::println("{}", result.output);
}

SpinnerCallback make_spinner_callback() {
    if (!Color::enabled()) {
        return [](SpinnerEvent ev, std::string_view label) {
            if (ev == SpinnerEvent::Start) {
                std::println("{}...", label);
            }
        };
    }

    auto spinner = std::make_shared<UiSpinner>();
    return [spinner](SpinnerEvent ev, std::string_view label) {
        switch (ev) {
            case SpinnerEvent::Start:
                spinner->start(label);
                break;
            case SpinnerEvent::Stop:
                spinner->stop();
                break;
        }
    };
}

}  // namespace systrack::CliRenderer
