// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <string>
#include <string_view>
#include <boost/outcome.hpp>

namespace jjstack::vcs {

namespace outcome = boost::outcome_v2;

/* version control collaborator; all outputs are the raw text of the tool */
struct vcs_t {
    virtual ~vcs_t() = default;

    /* pushes the revset to the remote, creating new remote refs as needed */
    virtual outcome::result<void> push(std::string_view remote, std::string_view revset) noexcept = 0;

    /* one json object per line: {"name": ..., "remote": ..., "target": [...]} */
    virtual outcome::result<std::string> list_bookmarks(std::string_view revset) noexcept = 0;

    /* one line of space-separated bookmark names per commit, newest first */
    virtual outcome::result<std::string> log_bookmarks(std::string_view revset) noexcept = 0;

    /* one line per commit, ancestors first: "<commit-id>\t<name> <name>..." */
    virtual outcome::result<std::string> log_topology(std::string_view revset) noexcept = 0;

    /* symbolic ref of the remote HEAD, e.g. "refs/remotes/origin/main" */
    virtual outcome::result<std::string> upstream_default_branch(std::string_view remote) noexcept = 0;
};

} // namespace jjstack::vcs
