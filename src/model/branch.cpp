// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "branch.h"
#include <unordered_set>

namespace jjstack::model {

branches_t unique(branches_t branches) noexcept {
    std::unordered_set<std::string> seen;
    branches_t r;
    r.reserve(branches.size());
    for (auto &b : branches) {
        if (seen.emplace(b.name).second) {
            r.emplace_back(std::move(b));
        }
    }
    return r;
}

names_t unique(names_t names) noexcept {
    std::unordered_set<std::string> seen;
    names_t r;
    r.reserve(names.size());
    for (auto &name : names) {
        if (seen.emplace(name).second) {
            r.emplace_back(std::move(name));
        }
    }
    return r;
}

names_t get_names(const branches_t &branches) noexcept {
    names_t r;
    r.reserve(branches.size());
    for (auto &b : branches) {
        r.emplace_back(b.name);
    }
    return r;
}

} // namespace jjstack::model
