// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once
#include "code_host.h"
#include "log.h"
#include "vcs.h"
#include <filesystem>
#include <string>

namespace jjstack::config {

namespace bfs = std::filesystem;

struct main_t {
    bfs::path config_path;

    log_configs_t log_configs;
    vcs_config_t vcs_config;
    code_host_config_t code_host_config;

    std::string remote;
    std::string marker;
    /* empty means: ask the code host, then the vcs, then use fallback_base */
    std::string default_base;
    std::string fallback_base;
    bool push_in_dry_run;
};

} // namespace jjstack::config
