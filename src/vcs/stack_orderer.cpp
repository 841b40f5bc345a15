// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "stack_orderer.h"
#include "revset.h"
#include <unordered_set>

namespace jjstack::vcs {

static const constexpr std::string_view name_separators = " \t\r";

stack_orderer_t::stack_orderer_t(vcs_t &vcs_, std::string trunk_revset_) noexcept
    : vcs{vcs_}, trunk_revset{std::move(trunk_revset_)}, log{utils::get_logger("jjstack.vcs.orderer")} {}

model::stack_order_t stack_orderer_t::order(const model::branches_t &branches) noexcept {
    return order(model::get_names(branches));
}

model::stack_order_t stack_orderer_t::order(const model::names_t &input) noexcept {
    auto names = model::unique(input);
    if (names.empty()) {
        return {};
    }

    auto query = revset::stack_of(trunk_revset, names);
    auto out = vcs.log_topology(query);
    if (!out) {
        LOG_WARN(log, "cannot get topology ({}), using the listing order", out.assume_error().message());
        return names;
    }
    auto topology = parse_topology(out.assume_value());
    LOG_TRACE(log, "topology of {} branch(es) has {} commit(s)", names.size(), topology.size());
    return linearize(names, topology);
}

model::topology_t stack_orderer_t::parse_topology(std::string_view output) noexcept {
    model::topology_t r;
    while (!output.empty()) {
        auto eol = output.find('\n');
        auto line = output.substr(0, eol);
        output = eol == output.npos ? std::string_view{} : output.substr(eol + 1);

        auto tab = line.find('\t');
        if (tab == line.npos || tab == 0) {
            continue;
        }
        auto commit = model::commit_t{std::string(line.substr(0, tab)), {}};
        auto names = line.substr(tab + 1);
        while (!names.empty()) {
            auto b = names.find_first_not_of(name_separators);
            if (b == names.npos) {
                break;
            }
            names = names.substr(b);
            auto e = names.find_first_of(name_separators);
            commit.names.emplace_back(names.substr(0, e));
            names = e == names.npos ? std::string_view{} : names.substr(e);
        }
        r.emplace_back(std::move(commit));
    }
    return r;
}

model::stack_order_t stack_orderer_t::linearize(const model::names_t &input, const model::topology_t &topology) noexcept {
    auto names = model::unique(input);
    auto wanted = std::unordered_set<std::string_view>(names.begin(), names.end());
    auto emitted = std::unordered_set<std::string_view>();
    model::stack_order_t r;
    r.reserve(names.size());

    for (auto &commit : topology) {
        for (auto &name : commit.names) {
            if (wanted.count(name) && emitted.emplace(name).second) {
                r.emplace_back(name);
            }
        }
    }
    for (auto &name : names) {
        if (emitted.emplace(name).second) {
            r.emplace_back(name);
        }
    }
    return r;
}

} // namespace jjstack::vcs
