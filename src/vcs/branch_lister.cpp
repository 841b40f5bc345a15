// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "branch_lister.h"
#include "utils/error_code.h"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace jjstack::vcs {

using json = nlohmann::json;
using namespace utils;

static const constexpr char remote_marker = '@';
static const constexpr char separator = ':';
static const constexpr std::string_view decorations = "*?";
static const constexpr std::string_view whitespace = " \t\r";

template <typename F> static void for_each_line(std::string_view text, F &&fn) {
    while (!text.empty()) {
        auto p = text.find('\n');
        auto line = text.substr(0, p);
        fn(line);
        if (p == text.npos) {
            break;
        }
        text = text.substr(p + 1);
    }
}

static std::string_view trim(std::string_view in) noexcept {
    auto b = in.find_first_not_of(whitespace);
    if (b == in.npos) {
        return {};
    }
    auto e = in.find_last_not_of(whitespace);
    return in.substr(b, e - b + 1);
}

static std::string read_target(const json &target) noexcept {
    if (target.is_string()) {
        return target.get<std::string>();
    }
    if (target.is_array()) {
        for (auto &it : target) {
            if (it.is_string()) {
                return it.get<std::string>();
            }
        }
    }
    return {};
}

std::string_view structured_listing_t::get_name() const noexcept { return "structured"; }

outcome::result<model::branches_t> structured_listing_t::list(vcs_t &vcs, std::string_view revset) noexcept {
    auto out = vcs.list_bookmarks(revset);
    if (!out) {
        return out.assume_error();
    }
    return parse(out.assume_value());
}

outcome::result<model::branches_t> structured_listing_t::parse(std::string_view output) noexcept {
    model::branches_t branches;
    auto ec = boost::system::error_code{};
    for_each_line(output, [&](std::string_view raw) {
        auto line = trim(raw);
        if (line.empty() || ec) {
            return;
        }
        auto data = json::parse(line.begin(), line.end(), nullptr, false);
        if (data.is_discarded()) {
            ec = make_error_code(protocol_error_code_t::malformed_json);
            return;
        }
        if (!data.is_object()) {
            ec = make_error_code(protocol_error_code_t::incorrect_json);
            return;
        }
        auto name = data.find("name");
        if (name == data.end() || !name->is_string()) {
            ec = make_error_code(protocol_error_code_t::incorrect_json);
            return;
        }
        auto remote = data.find("remote");
        if (remote != data.end() && remote->is_string() && !remote->get<std::string>().empty()) {
            return;
        }
        auto branch_name = name->get<std::string>();
        if (branch_name.empty()) {
            return;
        }
        auto target = data.find("target");
        auto commit = target != data.end() ? read_target(*target) : std::string();
        branches.emplace_back(model::branch_t{std::move(branch_name), std::move(commit)});
    });
    if (ec) {
        return ec;
    }
    return model::unique(std::move(branches));
}

std::string_view text_listing_t::get_name() const noexcept { return "text"; }

outcome::result<model::branches_t> text_listing_t::list(vcs_t &vcs, std::string_view revset) noexcept {
    auto out = vcs.log_bookmarks(revset);
    if (!out) {
        return out.assume_error();
    }
    return parse(out.assume_value());
}

model::branches_t text_listing_t::parse(std::string_view output) noexcept {
    model::branches_t branches;
    for_each_line(output, [&](std::string_view line) {
        auto name = sanitize(line);
        if (name) {
            branches.emplace_back(model::branch_t{std::move(*name), {}});
        }
    });
    std::reverse(branches.begin(), branches.end());
    return model::unique(std::move(branches));
}

std::optional<std::string> text_listing_t::sanitize(std::string_view line) noexcept {
    auto name = trim(line);
    if (name.empty() || name.front() == remote_marker) {
        return {};
    }
    // several bookmarks on one commit, the first one is taken
    auto space = name.find_first_of(whitespace);
    if (space != name.npos) {
        name = name.substr(0, space);
    }
    if (name.back() == separator) {
        name.remove_suffix(1);
    }
    while (!name.empty() && decorations.find(name.back()) != decorations.npos) {
        name.remove_suffix(1);
    }
    if (name.empty()) {
        return {};
    }
    return std::string(name);
}

branch_lister_t::branch_lister_t(vcs_t &vcs_, std::string revset_) noexcept
    : vcs{vcs_}, revset{std::move(revset_)}, log{get_logger("jjstack.vcs.lister")} {
    strategies.emplace_back(new structured_listing_t());
    strategies.emplace_back(new text_listing_t());
}

branch_lister_t::branch_lister_t(vcs_t &vcs_, std::string revset_, listing_strategies_t strategies_) noexcept
    : vcs{vcs_}, revset{std::move(revset_)}, strategies{std::move(strategies_)},
      log{get_logger("jjstack.vcs.lister")} {}

outcome::result<model::branches_t> branch_lister_t::list_branches() noexcept {
    auto ec = make_error_code(error_code_t::no_listing_strategy);
    for (auto &strategy : strategies) {
        auto r = strategy->list(vcs, revset);
        if (r) {
            LOG_DEBUG(log, "{} listing of '{}' yields {} branch(es)", strategy->get_name(), revset,
                      r.assume_value().size());
            return r;
        }
        ec = r.assume_error();
        LOG_DEBUG(log, "{} listing of '{}' has failed: {}", strategy->get_name(), revset, ec.message());
    }
    LOG_ERROR(log, "cannot list branches of '{}': {}", revset, ec.message());
    return ec;
}

} // namespace jjstack::vcs
