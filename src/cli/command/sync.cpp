// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "sync.h"
#include "../error_code.h"
#include "host/gh_cli.h"
#include "utils/error_code.h"
#include "vcs/jj_cli.h"
#include <boost/program_options.hpp>
#include <fmt/ranges.h>

namespace jjstack::cli::command {

po::options_description sync_t::get_options() {
    // clang-format off
    po::options_description descr("sync options");
    descr.add_options()
        ("remote", po::value<std::string>(), "remote to push the stack to")
        ("default-base", po::value<std::string>(), "base branch of the oldest review request")
        ("marker", po::value<std::string>(), "key of the stack section in review request bodies")
        ("dry-run", po::bool_switch(), "show what would be done, without doing it");
    // clang-format on
    return descr;
}

outcome::result<command_ptr_t> sync_t::construct(const args_t &args) noexcept {
    auto cmd = std::make_unique<sync_t>();
    cmd->log = utils::get_logger("jjstack.cli.sync");
    try {
        po::variables_map vm;
        po::store(po::command_line_parser(args).options(get_options()).run(), vm);
        po::notify(vm);

        auto assign = [&](const char *name, std::optional<std::string> &value) {
            if (vm.count(name)) {
                value = vm[name].as<std::string>();
            }
        };
        assign("remote", cmd->remote);
        assign("default-base", cmd->default_base);
        assign("marker", cmd->marker);
        cmd->dry_run = vm["dry-run"].as<bool>();
    } catch (const po::error &ex) {
        LOG_ERROR(cmd->log, "sync: {}", ex.what());
        return make_error_code(error_code_t::unexpected_argument);
    }
    if (cmd->marker && cmd->marker->empty()) {
        LOG_ERROR(cmd->log, "sync: marker should not be empty");
        return make_error_code(error_code_t::unexpected_argument);
    }
    return command_ptr_t(std::move(cmd));
}

void sync_t::apply(config::main_t &config) const noexcept {
    if (remote) {
        config.remote = *remote;
    }
    if (default_base) {
        config.default_base = *default_base;
    }
    if (marker) {
        config.marker = *marker;
    }
}

outcome::result<void> sync_t::execute(app_context_t &ctx) noexcept {
    auto config = ctx.config;
    apply(config);

    auto jj = vcs::jj_cli_t(config.vcs_config, ctx.repo);
    auto gh = host::gh_cli_t(config.code_host_config, ctx.repo);
    auto reconciler = sync::reconciler_t(jj, gh, sync::sync_options_t::make(config, dry_run));

    auto plan = reconciler.sync();
    if (!plan) {
        auto &ec = plan.assume_error();
        if (utils::is_protocol_error(ec)) {
            LOG_ERROR(log, "sync has failed, unexpected output of jj or gh: {}", ec.message());
        } else {
            LOG_ERROR(log, "sync has failed: {}", ec.message());
        }
        return ec;
    }
    report(plan.assume_value());
    return outcome::success();
}

void sync_t::report(const sync::plan_t &plan) const noexcept {
    if (plan.order.empty()) {
        LOG_INFO(log, "no bookmarks in the stack, nothing to sync");
        return;
    }
    LOG_INFO(log, "stack ({} bookmarks) onto {}: {}", plan.order.size(), plan.default_base,
             fmt::join(plan.order, " <- "));
    for (auto &entry : plan.entries) {
        LOG_INFO(log, "  #{} {} -> {} ({})", entry.number, entry.branch, entry.base,
                 sync::get_action_string(entry.action));
    }
    if (dry_run) {
        LOG_INFO(log, "dry-run: nothing has been changed on the code host");
    }
}

} // namespace jjstack::cli::command
