// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include "../command.h"
#include "sync/reconciler.h"
#include <optional>
#include <boost/program_options/options_description.hpp>

namespace jjstack::cli::command {

namespace po = boost::program_options;

struct JJSTACK_API sync_t final : command_t {
    static outcome::result<command_ptr_t> construct(const args_t &args) noexcept;
    static po::options_description get_options();

    outcome::result<void> execute(app_context_t &) noexcept override;

    /* command line values take precedence over the configuration */
    void apply(config::main_t &config) const noexcept;
    void report(const sync::plan_t &plan) const noexcept;

    std::optional<std::string> remote;
    std::optional<std::string> default_base;
    std::optional<std::string> marker;
    bool dry_run = false;
};

} // namespace jjstack::cli::command
