// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "log.h"

namespace jjstack::utils {

namespace {

using L = spdlog::level::level_enum;

struct level_name_t {
    std::string_view name;
    L level;
};

/* canonical names go first, aliases are only accepted on input */
// clang-format off
const constexpr level_name_t level_names[] = {
    {"trace", L::trace},
    {"debug", L::debug},
    {"info", L::info},
    {"warn", L::warn},
    {"error", L::err},
    {"critical", L::critical},
    {"off", L::off},
    {"crit", L::critical},
    {"warning", L::warn},
    {"err", L::err},
};
// clang-format on

const constexpr std::size_t canonical_levels = 7;

} // namespace

level_opt_t get_log_level(std::string_view log_level) noexcept {
    for (auto &it : level_names) {
        if (it.name == log_level) {
            return it.level;
        }
    }
    return {};
}

std::string_view get_level_string(spdlog::level::level_enum level) noexcept {
    for (std::size_t i = 0; i < canonical_levels; ++i) {
        if (level_names[i].level == level) {
            return level_names[i].name;
        }
    }
    return "off";
}

std::string get_level_names() noexcept {
    std::string r;
    for (std::size_t i = 0; i < canonical_levels; ++i) {
        if (i) {
            r += ", ";
        }
        r += level_names[i].name;
    }
    return r;
}

logger_t get_logger(std::string_view initial_name) noexcept {
    std::string name(initial_name);
    logger_t result = spdlog::get(name);
    if (result) {
        return result;
    }

    logger_t parent;
    while (!parent) {
        auto p = name.find_last_of(".");
        if (p != name.npos) {
            name = name.substr(0, p);
            parent = spdlog::get(name);
        } else {
            parent = spdlog::default_logger();
        }
    }

    auto &sinks = parent->sinks();
    auto log_name = std::string(initial_name);
    result = std::make_shared<spdlog::logger>(log_name, sinks.begin(), sinks.end());
    result->set_level(parent->level());
    spdlog::register_logger(result);
    return result;
}

} // namespace jjstack::utils
