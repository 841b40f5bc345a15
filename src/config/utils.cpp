// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "utils.h"

#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include "constants.h"
#include "utils/log.h"
#include "utils/location.h"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.h>

#define SAFE_GET_VALUE(property, type, table_name)                                                                     \
    {                                                                                                                  \
        auto option = t[#property].value<type>();                                                                      \
        if (!option) {                                                                                                 \
            spdlog::warn("using default value for {}/{}", table_name, #property);                                      \
            c.property = c_default.property;                                                                           \
        } else {                                                                                                       \
            c.property = option.value();                                                                               \
        }                                                                                                              \
    }

#define SAFE_GET_NON_EMPTY(property, table_name)                                                                       \
    {                                                                                                                  \
        auto option = t[#property].value<std::string>();                                                               \
        if (!option || option.value().empty()) {                                                                       \
            spdlog::warn("using default value for {}/{}", table_name, #property);                                      \
            c.property = c_default.property;                                                                           \
        } else {                                                                                                       \
            c.property = option.value();                                                                               \
        }                                                                                                              \
    }

namespace jjstack::config {

using level_t = spdlog::level::level_enum;

main_t make_default_config(const bfs::path &config_path) noexcept {
    // clang-format off
    main_t cfg;
    cfg.config_path = config_path;
    cfg.remote = constants::default_remote;
    cfg.marker = constants::default_marker;
    cfg.default_base = "";
    cfg.fallback_base = constants::fallback_base;
    cfg.push_in_dry_run = false;
    cfg.log_configs = {
        log_config_t {
            "default", level_t::info, {"stderr"}
        }
    };
    cfg.vcs_config = vcs_config_t {
        "jj",           /* executable */
        "git",          /* git_executable */
        "trunk()",      /* trunk_revset */
        "@",            /* head_revset */
    };
    cfg.code_host_config = code_host_config_t {
        "gh",                   /* executable */
        constants::list_limit,  /* list_limit */
    };
    // clang-format on
    return cfg;
}

outcome::result<bfs::path> get_default_config_path() noexcept {
    auto dir = utils::get_default_config_dir();
    if (!dir) {
        return dir.assume_error();
    }
    return dir.assume_value() / constants::config_file_name;
}

static std::string expand_sink(const std::string &sink, const utils::home_option_t &home) noexcept {
    static const constexpr std::string_view file_prefix = "file:";
    if (sink.size() > file_prefix.size() && sink.substr(0, file_prefix.size()) == file_prefix) {
        auto path = utils::expand_home(sink.substr(file_prefix.size()), home);
        return fmt::format("{}{}", file_prefix, path);
    }
    return sink;
}

static outcome::outcome<log_configs_t, std::string> get_log_configs(toml::node_view<toml::node> node,
                                                                    const log_configs_t &defaults) {
    auto logs = node.as_array();
    if (!logs) {
        spdlog::warn("using default value for log");
        return defaults;
    }

    auto home = utils::get_home_dir();
    log_configs_t r;
    for (auto &it : *logs) {
        auto t = it.as_table();
        if (!t) {
            return std::string("log entry should be a table");
        }
        auto name = (*t)["name"].value<std::string>();
        if (!name || name->empty()) {
            return std::string("log entry has no name");
        }
        auto level = level_t::info;
        if (auto level_str = (*t)["level"].value<std::string>(); level_str) {
            auto level_opt = utils::get_log_level(*level_str);
            if (!level_opt) {
                return fmt::format("log '{}' has unknown level '{}'", *name, *level_str);
            }
            level = *level_opt;
        }
        log_config_t::sinks_t sinks;
        if (auto sinks_arr = (*t)["sinks"].as_array(); sinks_arr) {
            for (auto &sink : *sinks_arr) {
                auto value = sink.value<std::string>();
                if (!value) {
                    return fmt::format("log '{}' has non-string sink", *name);
                }
                sinks.emplace_back(expand_sink(*value, home));
            }
        }
        r.emplace_back(log_config_t{std::move(*name), level, std::move(sinks)});
    }
    return r;
}

config_result_t get_config(std::istream &config, const bfs::path &config_path) {
    main_t cfg;
    cfg.config_path = config_path;

    auto r = toml::parse(config);
    if (!r) {
        return std::string(r.error().description());
    }

    auto default_config = make_default_config(config_path);

    auto &root_tbl = r.table();
    // main
    {
        auto t = root_tbl["main"];
        auto &c = cfg;
        auto &c_default = default_config;

        SAFE_GET_NON_EMPTY(remote, "main");
        SAFE_GET_NON_EMPTY(marker, "main");
        SAFE_GET_VALUE(default_base, std::string, "main");
        SAFE_GET_NON_EMPTY(fallback_base, "main");
        SAFE_GET_VALUE(push_in_dry_run, bool, "main");
    }

    // vcs
    {
        auto t = root_tbl["vcs"];
        auto &c = cfg.vcs_config;
        auto &c_default = default_config.vcs_config;

        SAFE_GET_NON_EMPTY(executable, "vcs");
        SAFE_GET_NON_EMPTY(git_executable, "vcs");
        SAFE_GET_NON_EMPTY(trunk_revset, "vcs");
        SAFE_GET_NON_EMPTY(head_revset, "vcs");
    }

    // code_host
    {
        auto t = root_tbl["code_host"];
        auto &c = cfg.code_host_config;
        auto &c_default = default_config.code_host_config;

        SAFE_GET_NON_EMPTY(executable, "code_host");
        SAFE_GET_VALUE(list_limit, std::uint32_t, "code_host");
        if (!c.list_limit) {
            return std::string("code_host/list_limit should be positive");
        }
    }

    // log
    {
        auto logs = get_log_configs(root_tbl["log"], default_config.log_configs);
        if (!logs) {
            return logs.error();
        }
        cfg.log_configs = std::move(logs.value());
    }

    return cfg;
}

outcome::result<void> serialize(const main_t &cfg, std::ostream &out) noexcept {
    auto logs = toml::array{};
    for (auto &c : cfg.log_configs) {
        auto sinks = toml::array{};
        for (auto &sink : c.sinks) {
            sinks.emplace_back<std::string>(sink);
        }
        auto log_table = toml::table{{
            {"name", c.name},
            {"level", utils::get_level_string(c.level)},
            {"sinks", sinks},
        }};
        logs.push_back(log_table);
    }

    // clang-format off
    auto tbl = toml::table{{
        {"main", toml::table{{
                     {"remote", cfg.remote},
                     {"marker", cfg.marker},
                     {"default_base", cfg.default_base},
                     {"fallback_base", cfg.fallback_base},
                     {"push_in_dry_run", cfg.push_in_dry_run},
                 }}},
        {"vcs", toml::table{{
                    {"executable", cfg.vcs_config.executable},
                    {"git_executable", cfg.vcs_config.git_executable},
                    {"trunk_revset", cfg.vcs_config.trunk_revset},
                    {"head_revset", cfg.vcs_config.head_revset},
                }}},
        {"code_host", toml::table{{
                          {"executable", cfg.code_host_config.executable},
                          {"list_limit", cfg.code_host_config.list_limit},
                      }}},
        {"log", logs},
    }};
    // clang-format on
    out << tbl;
    return outcome::success();
}

} // namespace jjstack::config
