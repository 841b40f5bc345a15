// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "test-utils.h"
#include "utils/log.h"
#include "utils/log-setup.h"
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace st = jjstack::test;
namespace bfs = std::filesystem;

using namespace jjstack;

using L = spdlog::level::level_enum;

namespace {
struct root_guard_t {
    root_guard_t() {
        auto dist_sink = utils::create_root_logger();
        dist_sink->add_sink(std::make_shared<spdlog::sinks::null_sink_mt>());
    }
    ~root_guard_t() { st::init_logging(); }
};
} // namespace

TEST_CASE("log levels", "[log]") {
    CHECK(utils::get_log_level("trace") == L::trace);
    CHECK(utils::get_log_level("error") == L::err);
    CHECK(utils::get_log_level("critical") == L::critical);
    CHECK(!utils::get_log_level("loud"));
    CHECK(utils::get_log_level("crit") == L::critical);
    CHECK(utils::get_log_level("warning") == L::warn);
    CHECK(utils::get_level_string(L::critical) == "critical");
    CHECK(utils::get_level_names() == "trace, debug, info, warn, error, critical, off");
    for (auto level : {L::trace, L::debug, L::info, L::warn, L::err, L::critical, L::off}) {
        auto str = utils::get_level_string(level);
        CHECK(utils::get_log_level(str) == level);
    }
}

TEST_CASE("default logger", "[log]") {
    root_guard_t guard;
    config::log_configs_t cfg{{"default", L::trace, {"stdout"}}};
    REQUIRE(utils::init_loggers(cfg));
    auto l = utils::get_logger("default");
    CHECK(l);
    CHECK(l->level() == L::trace);
}

TEST_CASE("level override", "[log]") {
    root_guard_t guard;
    config::log_configs_t cfg{{"default", L::info, {"stdout"}}};
    REQUIRE(utils::init_loggers(cfg, L::debug));
    CHECK(spdlog::default_logger()->level() == L::debug);
    auto l = utils::get_logger("jjstack.sync");
    CHECK(l->level() == L::debug);
}

TEST_CASE("hierarchy", "[log]") {
    root_guard_t guard;
    config::log_configs_t cfg{{"default", L::trace, {"stdout"}}, {"a", L::info, {}}, {"a.b.c", L::warn, {}}};
    REQUIRE(utils::init_loggers(cfg));
    SECTION("custom") {
        auto l = utils::get_logger("a");
        REQUIRE(l);
        CHECK(l->level() == L::info);
    }
    SECTION("submatch") {
        auto l = utils::get_logger("a.b");
        REQUIRE(l);
        CHECK(l->level() == L::info);
    }
    SECTION("full match") {
        auto l = utils::get_logger("a.b.c");
        REQUIRE(l);
        CHECK(l->level() == L::warn);
    }
    SECTION("mismatch") {
        auto l = utils::get_logger("xxx");
        REQUIRE(l);
        CHECK(l->level() == L::trace);
    }
}

TEST_CASE("unknown sink", "[log]") {
    root_guard_t guard;
    config::log_configs_t cfg{{"default", L::info, {"syslog"}}};
    CHECK(!utils::init_loggers(cfg));
}

TEST_CASE("file sink", "[log]") {
    root_guard_t guard;
    auto dir = bfs::absolute(bfs::current_path() / st::unique_path());
    auto path_guard = st::path_guard_t{dir};
    bfs::create_directory(dir);
    auto log_file = dir / "log.txt";
    auto log_file_str = log_file.string();

    auto sink_config = fmt::format("file:{}", log_file_str);
    config::log_configs_t cfg{{"default", L::trace, {sink_config}}};
    REQUIRE(utils::init_loggers(cfg));
    auto l = utils::get_logger("default");
    l->info("lorem ipsum dolor");
    l->flush();
    l.reset();

    auto data = st::read_file(log_file);
    CHECK(!data.empty());
    CHECK(data.find("lorem ipsum dolor") != std::string::npos);
}
