// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "section.h"
#include "constants.h"
#include <fmt/core.h>

namespace jjstack::text {

static const constexpr std::string_view whitespace = " \t\r\n";
static const constexpr std::string_view blank_line = "\n\n";

namespace {

struct bounds_t {
    std::size_t begin;
    std::size_t end;
};

std::optional<bounds_t> locate(std::string_view body, std::string_view marker_key) noexcept {
    auto start = start_marker(marker_key);
    auto finish = end_marker(marker_key);
    auto begin = body.find(start);
    if (begin == body.npos) {
        return {};
    }
    auto end = body.find(finish, begin + start.size());
    if (end == body.npos) {
        return {};
    }
    return bounds_t{begin, end + finish.size()};
}

std::string_view trim_left(std::string_view in) noexcept {
    auto p = in.find_first_not_of(whitespace);
    return p == in.npos ? std::string_view{} : in.substr(p);
}

std::string_view trim_right(std::string_view in) noexcept {
    auto p = in.find_last_not_of(whitespace);
    return p == in.npos ? std::string_view{} : in.substr(0, p + 1);
}

} // namespace

std::string start_marker(std::string_view marker_key) noexcept { return fmt::format("<!--{}:start-->", marker_key); }

std::string end_marker(std::string_view marker_key) noexcept { return fmt::format("<!--{}:end-->", marker_key); }

std::string render(std::string_view marker_key, const model::request_numbers_t &numbers,
                   std::size_t current_index) noexcept {
    auto r = start_marker(marker_key);
    r += '\n';
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        auto glyph = (i == current_index) ? constants::pointer_glyph : "";
        r += fmt::format("- {}#{}\n", glyph, numbers[i]);
    }
    r += end_marker(marker_key);
    return r;
}

std::string upsert(std::string_view body, std::string_view marker_key, std::string_view new_section) noexcept {
    std::string r;
    auto bounds = locate(body, marker_key);
    if (bounds) {
        auto before = trim_right(body.substr(0, bounds->begin));
        auto after = trim_left(body.substr(bounds->end));
        r.reserve(before.size() + new_section.size() + after.size() + blank_line.size() * 2);
        if (!before.empty()) {
            r += before;
            r += blank_line;
        }
        r += new_section;
        if (!after.empty()) {
            r += blank_line;
            r += after;
        }
    } else {
        auto existing = trim_left(body);
        r = new_section;
        if (!existing.empty()) {
            r += blank_line;
            r += existing;
        }
    }
    return r;
}

std::optional<std::string_view> extract(std::string_view body, std::string_view marker_key) noexcept {
    auto bounds = locate(body, marker_key);
    if (!bounds) {
        return {};
    }
    return body.substr(bounds->begin, bounds->end - bounds->begin);
}

} // namespace jjstack::text
