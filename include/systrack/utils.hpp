/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cctype>
#include <charconv>
#include <cmath>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace systrack {

[[nodiscard]] constexpr std::string_view trim_sv(std::string_view str) noexcept {
    auto first = str.find_first_not_of(" \t\n\r\v\f");
    if (first == std::string_view::npos)
        return {};
    auto last = str.find_last_not_of(" \t\n\r\v\f");
    return str.substr(first, last - first + 1);
}

[[nodiscard]] inline std::string trim(std::string_view str) {
    return std::string(trim_sv(str));
}

[[nodiscard]] inline std::string to_lower(std::string_view text) {
    std::string ret(text);
    for (auto& c : ret) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ret;
}

[[nodiscard]] inline std::vector<std::string> split_whitespace(std::string_view text) {
    std::vector<std::string> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
            ++pos;
        std::size_t start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos])))
            ++pos;
        if (pos > start)
            tokens.emplace_back(text.substr(start, pos - start));
    }
    return tokens;
}

// Half away from zero, matching what a reader expects from "rounded to N decimals".
[[nodiscard]] inline double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

template <typename T>
std::expected<T, std::errc> parse_number(std::string_view sv) {
    T value;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec == std::errc()) {
        if (ptr == sv.data() + sv.size()) {
            return value;
        }
        return std::unexpected(std::errc::invalid_argument);
    }
    return std::unexpected(ec);
}

// Resolves a program name the way execvp would. Names containing a slash are
// checked as paths.
std::optional<std::filesystem::path> find_executable(std::string_view name);

// Whole-file read; the error names the path and the OS reason.
std::expected<std::string, std::string> read_text_file(const std::filesystem::path& path);

}  // namespace systrack
