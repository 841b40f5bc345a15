// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include "../command.h"
#include <ostream>

namespace jjstack::cli::command {

struct JJSTACK_API dump_config_t final : command_t {
    static outcome::result<command_ptr_t> construct(const args_t &args) noexcept;

    inline dump_config_t(std::ostream &out_) noexcept : out{out_} {}

    outcome::result<void> execute(app_context_t &) noexcept override;

  private:
    std::ostream &out;
};

} // namespace jjstack::cli::command
