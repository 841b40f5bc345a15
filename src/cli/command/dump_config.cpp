// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "dump_config.h"
#include "../error_code.h"
#include "config/utils.h"
#include <iostream>

namespace jjstack::cli::command {

outcome::result<command_ptr_t> dump_config_t::construct(const args_t &args) noexcept {
    if (!args.empty()) {
        spdlog::error("dump-config: unexpected argument '{}'", args.front());
        return make_error_code(error_code_t::unexpected_argument);
    }
    return std::make_unique<dump_config_t>(std::cout);
}

outcome::result<void> dump_config_t::execute(app_context_t &ctx) noexcept {
    auto r = config::serialize(ctx.config, out);
    if (r) {
        out << "\n";
        out.flush();
    }
    return r;
}

} // namespace jjstack::cli::command
