// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "test-utils.h"
#include "config/utils.h"
#include "utils/location.h"
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace jjstack::config {

bool operator==(const log_config_t &lhs, const log_config_t &rhs) noexcept {
    return lhs.name == rhs.name && lhs.level == rhs.level && lhs.sinks == rhs.sinks;
}

bool operator==(const vcs_config_t &lhs, const vcs_config_t &rhs) noexcept {
    return lhs.executable == rhs.executable && lhs.git_executable == rhs.git_executable &&
           lhs.trunk_revset == rhs.trunk_revset && lhs.head_revset == rhs.head_revset;
}

bool operator==(const code_host_config_t &lhs, const code_host_config_t &rhs) noexcept {
    return lhs.executable == rhs.executable && lhs.list_limit == rhs.list_limit;
}

bool operator==(const main_t &lhs, const main_t &rhs) noexcept {
    return lhs.config_path == rhs.config_path && lhs.log_configs == rhs.log_configs &&
           lhs.vcs_config == rhs.vcs_config && lhs.code_host_config == rhs.code_host_config &&
           lhs.remote == rhs.remote && lhs.marker == rhs.marker && lhs.default_base == rhs.default_base &&
           lhs.fallback_base == rhs.fallback_base && lhs.push_in_dry_run == rhs.push_in_dry_run;
}

} // namespace jjstack::config

namespace sys = boost::system;
namespace fs = std::filesystem;
namespace st = jjstack::test;

using namespace jjstack;

TEST_CASE("expand_home", "[config]") {
    SECTION("valid home") {
        auto home = utils::home_option_t(fs::path("/user/home"));
        CHECK(utils::expand_home("some/path", home) == "some/path");
        CHECK(utils::expand_home("~/some/path", home) == "/user/home/some/path");
        CHECK(utils::expand_home("~user/some/path", home) == "~user/some/path");
    }

    SECTION("invalid home") {
        auto ec = sys::error_code{1, sys::system_category()};
        auto home = utils::home_option_t(ec);
        CHECK(utils::expand_home("some/path", home) == "some/path");
        CHECK(utils::expand_home("~/some/path", home) == "~/some/path");
    }
}

TEST_CASE("default config dir", "[config]") {
    auto prev = std::getenv("XDG_CONFIG_HOME");
    auto prev_value = std::string(prev ? prev : "");
    setenv("XDG_CONFIG_HOME", "/tmp/xdg-config", 1);
    auto dir = utils::get_default_config_dir();
    REQUIRE(dir);
    CHECK(dir.value() == fs::path("/tmp/xdg-config/jjstack"));
    if (prev) {
        setenv("XDG_CONFIG_HOME", prev_value.c_str(), 1);
    } else {
        unsetenv("XDG_CONFIG_HOME");
    }
}

TEST_CASE("default config is OK", "[config]") {
    auto cfg_path = fs::path("jjstack.toml");
    auto cfg = config::make_default_config(cfg_path);
    CHECK(cfg.remote == "origin");
    CHECK(cfg.marker == "jj-stack-sync");
    CHECK(cfg.default_base.empty());
    CHECK(cfg.fallback_base == "main");
    CHECK(!cfg.push_in_dry_run);
    CHECK(cfg.vcs_config.executable == "jj");
    CHECK(cfg.code_host_config.executable == "gh");
    CHECK(cfg.code_host_config.list_limit == 200);
    REQUIRE(cfg.log_configs.size() == 1);
    CHECK(cfg.log_configs[0].name == "default");

    SECTION("serialize default") {
        std::stringstream out;
        auto r = config::serialize(cfg, out);
        CHECK(r);
        INFO(out.str());
        auto cfg_opt = config::get_config(out, cfg_path);
        REQUIRE(cfg_opt);
        CHECK(cfg == cfg_opt.value());
    }

    SECTION("serialize customized") {
        cfg.remote = "upstream";
        cfg.default_base = "develop";
        cfg.push_in_dry_run = true;
        cfg.vcs_config.trunk_revset = "main@upstream";
        cfg.code_host_config.list_limit = 50;
        cfg.log_configs.push_back({"jjstack.sync", spdlog::level::debug, {"stdout"}});
        std::stringstream out;
        REQUIRE(config::serialize(cfg, out));
        auto cfg_opt = config::get_config(out, cfg_path);
        REQUIRE(cfg_opt);
        CHECK(cfg == cfg_opt.value());
    }
}

TEST_CASE("partial config", "[config]") {
    auto cfg_path = fs::path("jjstack.toml");
    auto defaults = config::make_default_config(cfg_path);

    SECTION("empty file means defaults") {
        std::stringstream in;
        auto cfg_opt = config::get_config(in, cfg_path);
        REQUIRE(cfg_opt);
        CHECK(cfg_opt.value() == defaults);
    }

    SECTION("missing keys are defaulted") {
        std::stringstream in(R"(
[main]
marker = "my-stack"
remote = ""

[code_host]
executable = "/opt/gh/bin/gh"
)");
        auto cfg_opt = config::get_config(in, cfg_path);
        REQUIRE(cfg_opt);
        auto &cfg = cfg_opt.value();
        CHECK(cfg.marker == "my-stack");
        CHECK(cfg.remote == "origin");
        CHECK(cfg.code_host_config.executable == "/opt/gh/bin/gh");
        CHECK(cfg.code_host_config.list_limit == defaults.code_host_config.list_limit);
        CHECK(cfg.vcs_config == defaults.vcs_config);
    }

    SECTION("log entries") {
        std::stringstream in(R"(
[[log]]
name = "default"
level = "warn"
sinks = ["stderr", "file:~/jjstack.log"]

[[log]]
name = "jjstack.process"
level = "trace"
)");
        auto cfg_opt = config::get_config(in, cfg_path);
        REQUIRE(cfg_opt);
        auto &logs = cfg_opt.value().log_configs;
        REQUIRE(logs.size() == 2);
        CHECK(logs[0].name == "default");
        CHECK(logs[0].level == spdlog::level::warn);
        REQUIRE(logs[0].sinks.size() == 2);
        CHECK(logs[0].sinks[0] == "stderr");
        CHECK(logs[0].sinks[1].find("~") == std::string::npos);
        CHECK(logs[0].sinks[1].find("jjstack.log") != std::string::npos);
        CHECK(logs[1].name == "jjstack.process");
        CHECK(logs[1].level == spdlog::level::trace);
        CHECK(logs[1].sinks.empty());
    }
}

TEST_CASE("incorrect config", "[config]") {
    auto cfg_path = fs::path("jjstack.toml");

    SECTION("not a toml") {
        std::stringstream in("[main\nremote = ");
        CHECK(!config::get_config(in, cfg_path));
    }

    SECTION("unknown log level") {
        std::stringstream in("[[log]]\nname = \"default\"\nlevel = \"loud\"\n");
        auto cfg_opt = config::get_config(in, cfg_path);
        REQUIRE(!cfg_opt);
        CHECK(cfg_opt.error().find("loud") != std::string::npos);
    }

    SECTION("nameless log") {
        std::stringstream in("[[log]]\nlevel = \"info\"\n");
        CHECK(!config::get_config(in, cfg_path));
    }

    SECTION("zero list limit") {
        std::stringstream in("[code_host]\nlist_limit = 0\n");
        CHECK(!config::get_config(in, cfg_path));
    }
}
