// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "constants.h"
#include "config/utils.h"
#include "utils/error_code.h"
#include "utils/format.hpp"
#include "utils/location.h"
#include "utils/log.h"
#include "utils/log-setup.h"
#include "cli/command.h"
#include "cli/command/sync.h"

namespace bfs = std::filesystem;
namespace po = boost::program_options;

using namespace jjstack;

static config::config_result_t load_config(const po::variables_map &vm) {
    bfs::path config_file_path;
    bool explicit_path = vm.count("config");
    if (explicit_path) {
        config_file_path = bfs::path(vm["config"].as<std::string>());
    } else {
        auto path = config::get_default_config_path();
        if (!path) {
            spdlog::warn("cannot determine default config dir ({}), using defaults", path.error().message());
            return config::make_default_config({});
        }
        config_file_path = path.value();
    }

    std::error_code ec;
    if (!bfs::exists(config_file_path, ec)) {
        if (explicit_path) {
            auto message = utils::make_error_code(utils::error_code_t::config_not_found).message();
            return fmt::format("{}: {}", config_file_path, message);
        }
        spdlog::debug("config {} does not exist, using defaults", config_file_path);
        return config::make_default_config(config_file_path);
    }

    std::ifstream config_file(config_file_path);
    if (!config_file) {
        return fmt::format("cannot open config file {}", config_file_path);
    }
    auto cfg_option = config::get_config(config_file, config_file_path);
    if (!cfg_option) {
        return fmt::format("config file {} is incorrect :: {}", config_file_path, cfg_option.error());
    }
    return std::move(cfg_option.value());
}

int main(int argc, char **argv) {
    try {
        auto level_help = fmt::format("log level of the default logger ({})", utils::get_level_names());
        // clang-format off
        /* parse command-line & config options */
        po::options_description cmdline_descr("Allowed options");
        cmdline_descr.add_options()
            ("help", "show this help message")
            ("version", "show version")
            ("repo", po::value<std::string>()->default_value("."),
                        "repository directory, where jj and gh are run")
            ("config", po::value<std::string>(),
                        "configuration file path")
            ("log_level", po::value<std::string>(),
                        level_help.c_str());

        po::options_description hidden_descr;
        hidden_descr.add_options()
            ("command", po::value<std::vector<std::string>>(), "command and its arguments");
        // clang-format on

        po::options_description all_descr;
        all_descr.add(cmdline_descr).add(hidden_descr);

        po::positional_options_description positional;
        positional.add("command", -1);

        auto parsed = po::command_line_parser(argc, argv)
                          .options(all_descr)
                          .positional(positional)
                          .allow_unregistered()
                          .run();
        po::variables_map vm;
        po::store(parsed, vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << "usage: " << constants::client_name << " [options] <command> [command options]\n\n"
                      << "commands:\n"
                      << "  sync (or: stack sync)  push the stack and keep its review requests in line\n"
                      << "  dump-config            print the effective configuration\n\n"
                      << cmdline_descr << "\n"
                      << cli::command::sync_t::get_options() << "\n";
            return 0;
        }
        if (vm.count("version")) {
            std::cout << constants::client_name << " " << constants::client_version << "\n";
            return 0;
        }

        utils::level_opt_t level_override;
        if (vm.count("log_level")) {
            auto &level_str = vm["log_level"].as<std::string>();
            level_override = utils::get_log_level(level_str);
            if (!level_override) {
                std::cerr << "unknown log level: " << level_str << "\n";
                return 1;
            }
        }

        /* until the loggers are configured, everything goes to stderr */
        auto dist_sink = utils::create_root_logger();
        auto bootstrap_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        dist_sink->add_sink(bootstrap_sink);
        spdlog::set_level(level_override.value_or(spdlog::level::info));

        auto cfg_option = load_config(vm);
        if (!cfg_option) {
            spdlog::error("{}", cfg_option.error());
            return 1;
        }
        auto &cfg = cfg_option.value();

        dist_sink->remove_sink(bootstrap_sink);
        auto init_result = utils::init_loggers(cfg.log_configs, level_override);
        if (!init_result) {
            dist_sink->add_sink(bootstrap_sink);
            spdlog::error("loggers initialization failed :: {}", init_result.error().message());
            return 1;
        }
        spdlog::trace("configuration seems OK");

        auto args = po::collect_unrecognized(parsed.options, po::include_positional);
        auto cmd = cli::command_t::parse(args);
        if (!cmd) {
            spdlog::error("cannot parse command :: {}, see --help", cmd.error().message());
            return 1;
        }

        auto repo = bfs::path(vm["repo"].as<std::string>());
        auto ctx = cli::app_context_t{std::move(cfg), std::move(repo)};
        spdlog::debug("starting {} {} in {}", constants::client_name, constants::client_version, ctx.repo);
        auto r = cmd.value()->execute(ctx);
        spdlog::shutdown();
        return r ? 0 : 1;
    } catch (const po::error &ex) {
        std::cerr << ex.what() << ", see --help\n";
        return 1;
    } catch (const std::exception &ex) {
        spdlog::critical("unexpected failure: {}", ex.what());
        return 1;
    }
}
