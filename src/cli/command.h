// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <boost/outcome.hpp>
#include "config/main.h"
#include "utils/log.h"
#include "jjstack-export.h"

namespace jjstack::cli {

namespace outcome = boost::outcome_v2;
namespace bfs = std::filesystem;

using args_t = std::vector<std::string>;

struct app_context_t {
    config::main_t config;
    /* working directory of every vcs and code host invocation */
    bfs::path repo;
};

struct command_t;
using command_ptr_t = std::unique_ptr<command_t>;

struct JJSTACK_API command_t {
    virtual ~command_t() = default;
    virtual outcome::result<void> execute(app_context_t &) noexcept = 0;

    /* args start with the command name, i.e. "sync", "stack sync" or "dump-config" */
    static outcome::result<command_ptr_t> parse(const args_t &args) noexcept;
    utils::logger_t log;
};

} // namespace jjstack::cli
