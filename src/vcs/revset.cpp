// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "revset.h"
#include <fmt/core.h>

namespace jjstack::vcs::revset {

std::string quote(std::string_view value) noexcept {
    std::string r;
    r.reserve(value.size() + 2);
    r += '"';
    for (auto c : value) {
        if (c == '\\' || c == '"') {
            r += '\\';
        }
        r += c;
    }
    r += '"';
    return r;
}

std::string range(std::string_view from, std::string_view to) noexcept { return fmt::format("{}..{}", from, to); }

std::string any_of(const model::names_t &names) noexcept {
    std::string r;
    for (auto &name : names) {
        if (!r.empty()) {
            r += " | ";
        }
        r += fmt::format("present({})", quote(name));
    }
    return r.empty() ? std::string("none()") : r;
}

std::string stack_of(std::string_view trunk, const model::names_t &names) noexcept {
    auto heads = any_of(names);
    return fmt::format("({}..({})) | ({})", trunk, heads, heads);
}

} // namespace jjstack::vcs::revset
