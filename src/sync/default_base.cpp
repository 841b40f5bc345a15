// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "default_base.h"
#include "host/review_directory.h"
#include "utils/error_code.h"
#include "vcs/vcs.h"
#include <fmt/core.h>

namespace jjstack::sync {

default_base_resolver_t::default_base_resolver_t(std::string fallback_) noexcept
    : fallback{std::move(fallback_)}, log{utils::get_logger("jjstack.sync.base")} {}

auto default_base_resolver_t::add(std::string_view name, resolver_fn_t fn) noexcept -> default_base_resolver_t & {
    strategies.emplace_back(strategy_t{std::string(name), std::move(fn)});
    return *this;
}

std::string default_base_resolver_t::resolve() const noexcept {
    for (auto &strategy : strategies) {
        auto r = strategy.fn();
        if (!r) {
            LOG_DEBUG(log, "{} cannot resolve default base: {}", strategy.name, r.assume_error().message());
            continue;
        }
        if (r.assume_value().empty()) {
            LOG_DEBUG(log, "{} has no default base", strategy.name);
            continue;
        }
        LOG_DEBUG(log, "default base '{}' is resolved by {}", r.assume_value(), strategy.name);
        return std::move(r.assume_value());
    }
    LOG_DEBUG(log, "using fallback default base '{}'", fallback);
    return fallback;
}

default_base_resolver_t make_default_resolver(std::string_view override_base, std::string fallback,
                                              host::review_directory_t &directory, vcs::vcs_t &vcs,
                                              std::string_view remote) noexcept {
    auto resolver = default_base_resolver_t(std::move(fallback));
    if (!override_base.empty()) {
        resolver.add("override", [value = std::string(override_base)]() -> outcome::result<std::string> {
            return value;
        });
    }
    resolver.add("code-host", [&directory]() { return directory.default_branch(); });
    resolver.add("vcs-upstream", [&vcs, remote = std::string(remote)]() -> outcome::result<std::string> {
        auto r = vcs.upstream_default_branch(remote);
        if (!r) {
            return r.assume_error();
        }
        return parse_symbolic_ref(r.assume_value(), remote);
    });
    return resolver;
}

outcome::result<std::string> parse_symbolic_ref(std::string_view ref, std::string_view remote) noexcept {
    static const constexpr std::string_view whitespace = " \t\r\n";
    auto b = ref.find_first_not_of(whitespace);
    if (b == ref.npos) {
        return utils::make_error_code(utils::protocol_error_code_t::malformed_output);
    }
    ref = ref.substr(b, ref.find_last_not_of(whitespace) - b + 1);
    auto prefix = fmt::format("refs/remotes/{}/", remote);
    if (ref.size() <= prefix.size() || ref.substr(0, prefix.size()) != prefix) {
        return utils::make_error_code(utils::protocol_error_code_t::malformed_output);
    }
    return std::string(ref.substr(prefix.size()));
}

} // namespace jjstack::sync
