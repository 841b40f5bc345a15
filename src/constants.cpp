// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "constants.h"
#include "jjstack-config.h"

namespace jjstack::constants {

const char *client_name = "jjstack";
const char *client_version = JJSTACK_VERSION;
const char *config_file_name = "jjstack.toml";
const char *default_marker = "jj-stack-sync";
const char *default_remote = "origin";
const char *fallback_base = "main";
const char *pointer_glyph = "\xF0\x9F\x91\x89 ";

} // namespace jjstack::constants
