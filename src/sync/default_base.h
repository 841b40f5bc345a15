// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/outcome.hpp>
#include "utils/log.h"
#include "jjstack-export.h"

namespace jjstack::vcs {
struct vcs_t;
}

namespace jjstack::host {
struct review_directory_t;
}

namespace jjstack::sync {

namespace outcome = boost::outcome_v2;

/* Resolves the base of the bottom-most stack entry: the strategies are tried
 * in order, the first non-empty success wins, otherwise the fallback is used.
 * Failures are not errors here, they are just logged. */
struct JJSTACK_API default_base_resolver_t {
    using resolver_fn_t = std::function<outcome::result<std::string>()>;

    struct strategy_t {
        std::string name;
        resolver_fn_t fn;
    };
    using strategies_t = std::vector<strategy_t>;

    explicit default_base_resolver_t(std::string fallback) noexcept;

    default_base_resolver_t &add(std::string_view name, resolver_fn_t fn) noexcept;
    std::string resolve() const noexcept;

    const strategies_t &get_strategies() const noexcept { return strategies; }

  private:
    std::string fallback;
    strategies_t strategies;
    utils::logger_t log;
};

/* the explicit override (if non-empty), the code host default branch, the
 * remote HEAD reported by the vcs */
JJSTACK_API default_base_resolver_t make_default_resolver(std::string_view override_base, std::string fallback,
                                                          host::review_directory_t &directory, vcs::vcs_t &vcs,
                                                          std::string_view remote) noexcept;

/* "refs/remotes/origin/main" -> "main" */
JJSTACK_API outcome::result<std::string> parse_symbolic_ref(std::string_view ref, std::string_view remote) noexcept;

} // namespace jjstack::sync
