// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include "code_host.h"
#include "config/code_host.h"
#include "utils/process.h"
#include "jjstack-export.h"

namespace jjstack::host {

namespace bfs = std::filesystem;

/* drives the GitHub command line tool */
struct JJSTACK_API gh_cli_t final : code_host_t {
    gh_cli_t(const config::code_host_config_t &config, const bfs::path &work_dir) noexcept;

    outcome::result<std::string> list_open(std::uint32_t limit) noexcept override;
    outcome::result<std::string> create(std::string_view head, std::string_view base, std::string_view title,
                                        std::string_view body) noexcept override;
    outcome::result<void> edit(model::request_number_t number, std::optional<std::string_view> base,
                               std::optional<std::string_view> body) noexcept override;
    outcome::result<std::string> view_default_branch() noexcept override;

  private:
    utils::process_t gh;
};

} // namespace jjstack::host
