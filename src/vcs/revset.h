// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <string>
#include <string_view>
#include "model/branch.h"
#include "jjstack-export.h"

namespace jjstack::vcs::revset {

/* revset string literal, backslashes and quotes escaped */
JJSTACK_API std::string quote(std::string_view value) noexcept;

/* "from..to" */
JJSTACK_API std::string range(std::string_view from, std::string_view to) noexcept;

/* present("a") | present("b") | ... , never fails on unknown names */
JJSTACK_API std::string any_of(const model::names_t &names) noexcept;

/* commits between trunk and the named branches, plus the branch commits themselves */
JJSTACK_API std::string stack_of(std::string_view trunk, const model::names_t &names) noexcept;

} // namespace jjstack::vcs::revset
