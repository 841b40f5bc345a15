// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <cstdint>
#include "jjstack-export.h"

namespace jjstack::constants {
static const constexpr std::uint32_t list_limit = 200;
JJSTACK_API extern const char *client_name;
JJSTACK_API extern const char *client_version;
JJSTACK_API extern const char *config_file_name;
JJSTACK_API extern const char *default_marker;
JJSTACK_API extern const char *default_remote;
JJSTACK_API extern const char *fallback_base;
JJSTACK_API extern const char *pointer_glyph;

} // namespace jjstack::constants
