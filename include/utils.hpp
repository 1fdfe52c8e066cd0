/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include "config.hpp"

std::size_t get_term_width();
void print_line();
void print_centered_header(std::string_view text);

[[nodiscard]] constexpr std::string_view trim_sv(std::string_view str) noexcept {
    auto first = str.find_first_not_of(" \t\n\r\v\f");
    if (first == std::string_view::npos)
        return {};
    auto last = str.find_last_not_of(" \t\n\r\v\f");
    return str.substr(first, last - first + 1);
}

[[nodiscard]] inline std::string trim(const std::string& str) {
    return std::string(trim_sv(str));
}

// First whitespace-delimited token, empty when the input is blank.
[[nodiscard]] constexpr std::string_view first_token(std::string_view str) noexcept {
    str = trim_sv(str);
    auto end = str.find_first_of(" \t\n\r\v\f");
    return end == std::string_view::npos ? str : str.substr(0, end);
}

std::string to_lower(std::string_view text);
bool is_hex_string(std::string_view text) noexcept;

// Wraps text in single quotes for a POSIX shell.
std::string shell_quote(std::string_view text);

// Like shell_quote, but leaves a leading "~/" outside the quotes so the shell expands it.
std::string shell_quote_path(std::string_view path);

std::string format_bytes(std::uint64_t bytes);
std::string format_timestamp(std::chrono::system_clock::time_point tp);

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
