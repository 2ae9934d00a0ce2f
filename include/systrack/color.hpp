/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <format>
#include <string>
#include <string_view>

#include <unistd.h>

namespace systrack::Color {
constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view RED = "\033[31m";
constexpr std::string_view GREEN = "\033[32m";

inline bool enabled(int fd = STDOUT_FILENO) {
    return ::isatty(fd) == 1;
}

inline std::string colorize(std::string_view text, std::string_view color, int fd = STDOUT_FILENO) {
    if (!enabled(fd)) {
        return std::string(text);
    }
    return std::format("{}{}{}", color, text, RESET);
}
}  // namespace systrack::Color
