// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include "vcs.h"
#include "config/vcs.h"
#include "utils/process.h"
#include "jjstack-export.h"

namespace jjstack::vcs {

namespace bfs = std::filesystem;

/* drives the jj command line tool; the remote HEAD is read via git
 * (colocated repositories) */
struct JJSTACK_API jj_cli_t final : vcs_t {
    jj_cli_t(const config::vcs_config_t &config, const bfs::path &work_dir) noexcept;

    outcome::result<void> push(std::string_view remote, std::string_view revset) noexcept override;
    outcome::result<std::string> list_bookmarks(std::string_view revset) noexcept override;
    outcome::result<std::string> log_bookmarks(std::string_view revset) noexcept override;
    outcome::result<std::string> log_topology(std::string_view revset) noexcept override;
    outcome::result<std::string> upstream_default_branch(std::string_view remote) noexcept override;

    static const char *bookmarks_template;
    static const char *text_template;
    static const char *topology_template;

  private:
    utils::process_t jj;
    utils::process_t git;
};

} // namespace jjstack::vcs
