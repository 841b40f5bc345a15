// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/outcome.hpp>
#include "vcs.h"
#include "model/branch.h"
#include "utils/log.h"
#include "jjstack-export.h"

namespace jjstack::vcs {

namespace outcome = boost::outcome_v2;

struct JJSTACK_API listing_strategy_t {
    virtual ~listing_strategy_t() = default;
    virtual std::string_view get_name() const noexcept = 0;
    virtual outcome::result<model::branches_t> list(vcs_t &vcs, std::string_view revset) noexcept = 0;
};

using listing_strategy_ptr_t = std::unique_ptr<listing_strategy_t>;
using listing_strategies_t = std::vector<listing_strategy_ptr_t>;

/* machine-readable bookmark listing, one json object per line */
struct JJSTACK_API structured_listing_t final : listing_strategy_t {
    std::string_view get_name() const noexcept override;
    outcome::result<model::branches_t> list(vcs_t &vcs, std::string_view revset) noexcept override;

    static outcome::result<model::branches_t> parse(std::string_view output) noexcept;
};

/* loose per-commit bookmark names, no targets */
struct JJSTACK_API text_listing_t final : listing_strategy_t {
    std::string_view get_name() const noexcept override;
    outcome::result<model::branches_t> list(vcs_t &vcs, std::string_view revset) noexcept override;

    /* the output is newest commit first, the result is oldest first */
    static model::branches_t parse(std::string_view output) noexcept;
    static std::optional<std::string> sanitize(std::string_view line) noexcept;
};

struct JJSTACK_API branch_lister_t {
    /* structured listing first, then the text one */
    branch_lister_t(vcs_t &vcs, std::string revset) noexcept;
    branch_lister_t(vcs_t &vcs, std::string revset, listing_strategies_t strategies) noexcept;

    outcome::result<model::branches_t> list_branches() noexcept;

  private:
    vcs_t &vcs;
    std::string revset;
    listing_strategies_t strategies;
    utils::logger_t log;
};

} // namespace jjstack::vcs
