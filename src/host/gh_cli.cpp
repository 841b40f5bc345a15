// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "gh_cli.h"

namespace jjstack::host {

using args_t = utils::args_t;

gh_cli_t::gh_cli_t(const config::code_host_config_t &config, const bfs::path &work_dir) noexcept
    : gh{config.executable, work_dir} {}

outcome::result<std::string> gh_cli_t::list_open(std::uint32_t limit) noexcept {
    return gh.run_ok({"pr", "list", "--state", "open", "--limit", std::to_string(limit), "--json",
                      "number,headRefName,baseRefName,body"});
}

outcome::result<std::string> gh_cli_t::create(std::string_view head, std::string_view base, std::string_view title,
                                              std::string_view body) noexcept {
    return gh.run_ok({"pr", "create", "--head", std::string(head), "--base", std::string(base), "--title",
                      std::string(title), "--body", std::string(body)});
}

outcome::result<void> gh_cli_t::edit(model::request_number_t number, std::optional<std::string_view> base,
                                     std::optional<std::string_view> body) noexcept {
    auto args = args_t{"pr", "edit", std::to_string(number)};
    if (base) {
        args.emplace_back("--base");
        args.emplace_back(*base);
    }
    if (body) {
        args.emplace_back("--body");
        args.emplace_back(*body);
    }
    auto r = gh.run_ok(args);
    if (!r) {
        return r.assume_error();
    }
    return outcome::success();
}

outcome::result<std::string> gh_cli_t::view_default_branch() noexcept {
    return gh.run_ok({"repo", "view", "--json", "defaultBranchRef"});
}

} // namespace jjstack::host
