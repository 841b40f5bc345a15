// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include "log.h"
#include "config/log.h"
#include <boost/outcome.hpp>
#include <spdlog/sinks/dist_sink.h>
#include "jjstack-export.h"

namespace jjstack::utils {

namespace outcome = boost::outcome_v2;

using dist_sink_t = std::shared_ptr<spdlog::sinks::dist_sink_mt>;

/* level_override, when set, replaces the level of the "default" logger */
JJSTACK_API outcome::result<void> init_loggers(const config::log_configs_t &configs,
                                               level_opt_t level_override = {}) noexcept;

JJSTACK_API dist_sink_t create_root_logger() noexcept;

} // namespace jjstack::utils
