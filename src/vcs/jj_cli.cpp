// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "jj_cli.h"
#include <fmt/core.h>

namespace jjstack::vcs {

using args_t = utils::args_t;

const char *jj_cli_t::bookmarks_template = "json(self) ++ \"\\n\"";
const char *jj_cli_t::text_template = "bookmarks ++ \"\\n\"";
const char *jj_cli_t::topology_template =
    "commit_id ++ \"\\t\" ++ local_bookmarks.map(|b| b.name()).join(\" \") ++ \"\\n\"";

jj_cli_t::jj_cli_t(const config::vcs_config_t &config, const bfs::path &work_dir) noexcept
    : jj{config.executable, work_dir}, git{config.git_executable, work_dir} {}

outcome::result<void> jj_cli_t::push(std::string_view remote, std::string_view revset) noexcept {
    auto args = args_t{"git", "push", "--remote", std::string(remote), "--revisions", std::string(revset), "--allow-new"};
    auto r = jj.run_ok(args);
    if (!r) {
        return r.assume_error();
    }
    return outcome::success();
}

outcome::result<std::string> jj_cli_t::list_bookmarks(std::string_view revset) noexcept {
    return jj.run_ok({"bookmark", "list", "--revisions", std::string(revset), "--template", bookmarks_template});
}

outcome::result<std::string> jj_cli_t::log_bookmarks(std::string_view revset) noexcept {
    return jj.run_ok({"log", "--no-graph", "--revisions", std::string(revset), "--template", text_template});
}

outcome::result<std::string> jj_cli_t::log_topology(std::string_view revset) noexcept {
    return jj.run_ok(
        {"log", "--no-graph", "--reversed", "--revisions", std::string(revset), "--template", topology_template});
}

outcome::result<std::string> jj_cli_t::upstream_default_branch(std::string_view remote) noexcept {
    return git.run_ok({"symbolic-ref", fmt::format("refs/remotes/{}/HEAD", remote)});
}

} // namespace jjstack::vcs
