// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "reconciler.h"
#include "text/section.h"
#include "vcs/branch_lister.h"
#include "vcs/revset.h"
#include "vcs/stack_orderer.h"
#include <fmt/ranges.h>

namespace jjstack::sync {

sync_options_t sync_options_t::make(const config::main_t &config, bool dry_run) noexcept {
    return sync_options_t{
        config.remote,
        config.marker,
        config.default_base,
        config.fallback_base,
        config.vcs_config.trunk_revset,
        config.vcs_config.head_revset,
        config.code_host_config.list_limit,
        dry_run,
        config.push_in_dry_run,
    };
}

std::string_view get_action_string(action_t action) noexcept {
    switch (action) {
    case action_t::created:
        return "created";
    case action_t::placeholder:
        return "to be created";
    case action_t::rebased:
        return "rebased";
    case action_t::unchanged:
        return "unchanged";
    }
    return "unknown";
}

reconciler_t::reconciler_t(vcs::vcs_t &vcs_, host::code_host_t &host_, sync_options_t options_) noexcept
    : vcs{vcs_}, options{std::move(options_)}, directory{host_, options.list_limit},
      log{utils::get_logger("jjstack.sync")} {}

reconciler_t &reconciler_t::base_resolver(default_base_resolver_t value) noexcept {
    resolver = std::move(value);
    return *this;
}

outcome::result<plan_t> reconciler_t::sync() noexcept {
    plan_t plan;

    auto published = publish(plan);
    if (!published) {
        return published.assume_error();
    }

    auto stack_revset = vcs::revset::range(options.trunk_revset, options.head_revset);
    auto lister = vcs::branch_lister_t(vcs, stack_revset);
    auto branches = lister.list_branches();
    if (!branches) {
        return branches.assume_error();
    }
    auto orderer = vcs::stack_orderer_t(vcs, options.trunk_revset);
    plan.order = orderer.order(branches.assume_value());
    if (plan.order.empty()) {
        LOG_INFO(log, "no branches in '{}', nothing to do", stack_revset);
        return plan;
    }
    LOG_DEBUG(log, "stack: {}", fmt::join(plan.order, " <- "));

    if (!resolver) {
        resolver = make_default_resolver(options.default_base, options.fallback_base, directory, vcs, options.remote);
    }
    plan.default_base = resolver->resolve();
    LOG_DEBUG(log, "default base: {}", plan.default_base);

    auto index = directory.list_open_by_head();
    if (!index) {
        return index.assume_error();
    }

    auto reconciled = reconcile_chain(plan, index.assume_value());
    if (!reconciled) {
        return reconciled.assume_error();
    }

    auto rewritten = rewrite_bodies(plan, index.assume_value());
    if (!rewritten) {
        return rewritten.assume_error();
    }
    return plan;
}

outcome::result<void> reconciler_t::publish(plan_t &plan) noexcept {
    auto revset = vcs::revset::range(options.trunk_revset, options.head_revset);
    if (options.dry_run && !options.push_in_dry_run) {
        LOG_INFO(log, "dry-run: pushing '{}' to {} is skipped", revset, options.remote);
        return outcome::success();
    }
    LOG_DEBUG(log, "pushing '{}' to {}", revset, options.remote);
    auto r = vcs.push(options.remote, revset);
    if (!r) {
        LOG_ERROR(log, "push to {} has failed, review requests are left intact: {}", options.remote,
                  r.assume_error().message());
        return r;
    }
    plan.pushed = true;
    return outcome::success();
}

outcome::result<void> reconciler_t::reconcile_chain(plan_t &plan, model::review_request_index_t &index) noexcept {
    auto &names = plan.order;
    for (std::size_t i = 0; i < names.size(); ++i) {
        auto &name = names[i];
        auto &base = (i == 0) ? plan.default_base : names[i - 1];
        auto entry = entry_t{name, base, model::placeholder_number, action_t::unchanged, {}, false};

        auto it = index.find(name);
        if (it == index.end()) {
            if (options.dry_run) {
                LOG_INFO(log, "dry-run: review request for {} onto {} would be created", name, base);
                entry.action = action_t::placeholder;
            } else {
                auto number = directory.create(name, base, name, "");
                if (!number) {
                    LOG_ERROR(log, "cannot create review request for {}: {}", name, number.assume_error().message());
                    return number.assume_error();
                }
                entry.number = number.assume_value();
                entry.action = action_t::created;
                index.emplace(name, model::review_request_t{entry.number, name, base, ""});
            }
        } else {
            auto &request = it->second;
            entry.number = request.number;
            if (request.base != base) {
                entry.action = action_t::rebased;
                if (options.dry_run) {
                    LOG_INFO(log, "dry-run: review request #{} ({}) would be rebased {} -> {}", request.number, name,
                             request.base, base);
                } else {
                    auto r = directory.update(request.number, base, {});
                    if (!r) {
                        LOG_ERROR(log, "cannot rebase review request #{}: {}", request.number,
                                  r.assume_error().message());
                        return r;
                    }
                    request.base = base;
                }
            }
        }
        plan.entries.emplace_back(std::move(entry));
    }
    return outcome::success();
}

outcome::result<void> reconciler_t::rewrite_bodies(plan_t &plan, const model::review_request_index_t &index) noexcept {
    auto numbers = model::request_numbers_t();
    numbers.reserve(plan.entries.size());
    for (auto &entry : plan.entries) {
        numbers.push_back(entry.number);
    }

    for (std::size_t i = 0; i < plan.entries.size(); ++i) {
        auto &entry = plan.entries[i];
        auto it = index.find(entry.branch);
        if (entry.number == model::placeholder_number || it == index.end()) {
            continue;
        }
        auto section = text::render(options.marker, numbers, i);
        entry.body = text::upsert(it->second.body, options.marker, section);
        if (options.dry_run) {
            LOG_DEBUG(log, "dry-run: body of review request #{} would be:\n{}", entry.number, entry.body);
            continue;
        }
        auto r = directory.update(entry.number, {}, entry.body);
        if (!r) {
            LOG_ERROR(log, "cannot update body of review request #{}: {}", entry.number, r.assume_error().message());
            return r;
        }
        entry.body_written = true;
    }
    return outcome::success();
}

} // namespace jjstack::sync
