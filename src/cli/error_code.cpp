// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "error_code.h"

namespace jjstack::cli::detail {

const char *error_code_category::name() const noexcept { return "jjstack_cli_error"; }

std::string error_code_category::message(int c) const {
    std::string r;
    switch (static_cast<error_code_t>(c)) {
    case error_code_t::success:
        r = "success";
        break;
    case error_code_t::command_is_missing:
        r = "command is missing";
        break;
    case error_code_t::unknown_command:
        r = "unknown command";
        break;
    case error_code_t::unexpected_argument:
        r = "unexpected command argument";
        break;
    default:
        r = "unknown";
    }
    r += " (";
    r += std::to_string(c) + ")";
    return r;
};

} // namespace jjstack::cli::detail

namespace jjstack::cli {

const static detail::error_code_category category;

const detail::error_code_category &error_code_category() { return category; }

} // namespace jjstack::cli
