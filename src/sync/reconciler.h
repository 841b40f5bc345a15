// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/outcome.hpp>
#include "default_base.h"
#include "config/main.h"
#include "host/code_host.h"
#include "host/review_directory.h"
#include "model/branch.h"
#include "model/review_request.h"
#include "utils/log.h"
#include "vcs/vcs.h"
#include "jjstack-export.h"

namespace jjstack::sync {

namespace outcome = boost::outcome_v2;

struct sync_options_t {
    std::string remote;
    std::string marker;
    std::string default_base;
    std::string fallback_base;
    std::string trunk_revset;
    std::string head_revset;
    std::uint32_t list_limit;
    bool dry_run;
    bool push_in_dry_run;

    JJSTACK_API static sync_options_t make(const config::main_t &config, bool dry_run) noexcept;
};

enum class action_t { created, placeholder, rebased, unchanged };

JJSTACK_API std::string_view get_action_string(action_t action) noexcept;

struct entry_t {
    std::string branch;
    std::string base;
    model::request_number_t number;
    action_t action;
    /* the merged body, empty for placeholders */
    std::string body;
    bool body_written;
};

struct plan_t {
    using entries_t = std::vector<entry_t>;

    bool pushed = false;
    std::string default_base;
    model::stack_order_t order;
    entries_t entries;
};

/* Keeps the chain of review requests in line with the stack of branches.
 *
 * Single pass: publish (push), discover (list + order), resolve the default
 * base, reconcile every position oldest first (create or rebase), then
 * rewrite the stack section of every real review request. Any collaborator
 * failure aborts the pass; nothing is kept between passes.
 *
 * In dry-run mode no mutating call is issued, neither to the code host nor
 * (unless push_in_dry_run) to the vcs.
 */
struct JJSTACK_API reconciler_t {
    reconciler_t(vcs::vcs_t &vcs, host::code_host_t &host, sync_options_t options) noexcept;

    /* replaces the default base resolution chain */
    reconciler_t &base_resolver(default_base_resolver_t resolver) noexcept;

    outcome::result<plan_t> sync() noexcept;

  private:
    outcome::result<void> publish(plan_t &plan) noexcept;
    outcome::result<void> reconcile_chain(plan_t &plan, model::review_request_index_t &index) noexcept;
    outcome::result<void> rewrite_bodies(plan_t &plan, const model::review_request_index_t &index) noexcept;

    vcs::vcs_t &vcs;
    sync_options_t options;
    host::review_directory_t directory;
    std::optional<default_base_resolver_t> resolver;
    utils::logger_t log;
};

} // namespace jjstack::sync
