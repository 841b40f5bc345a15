// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <boost/outcome.hpp>
#include "main.h"
#include "jjstack-export.h"

namespace jjstack::config {

namespace outcome = boost::outcome_v2;

using config_result_t = outcome::outcome<main_t, std::string>;

JJSTACK_API config_result_t get_config(std::istream &config, const bfs::path &config_path);

JJSTACK_API main_t make_default_config(const bfs::path &config_path) noexcept;

JJSTACK_API outcome::result<bfs::path> get_default_config_path() noexcept;

JJSTACK_API outcome::result<void> serialize(const main_t &cfg, std::ostream &out) noexcept;

} // namespace jjstack::config
