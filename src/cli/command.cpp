// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "command.h"
#include "error_code.h"
#include "command/dump_config.h"
#include "command/sync.h"

namespace jjstack::cli {

outcome::result<command_ptr_t> command_t::parse(const args_t &args) noexcept {
    if (args.empty()) {
        return make_error_code(error_code_t::command_is_missing);
    }
    auto it = args.begin();
    auto cmd = std::string_view(*it++);
    if (cmd == "stack") {
        if (it == args.end()) {
            return make_error_code(error_code_t::command_is_missing);
        }
        cmd = *it++;
        if (cmd != "sync") {
            return make_error_code(error_code_t::unknown_command);
        }
    }
    auto rest = args_t(it, args.end());
    if (cmd == "sync") {
        return command::sync_t::construct(rest);
    } else if (cmd == "dump-config") {
        return command::dump_config_t::construct(rest);
    }
    return make_error_code(error_code_t::unknown_command);
}

} // namespace jjstack::cli
