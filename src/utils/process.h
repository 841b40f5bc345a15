// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <boost/outcome.hpp>
#include "jjstack-export.h"

namespace jjstack::utils {

namespace outcome = boost::outcome_v2;
namespace bfs = std::filesystem;

using args_t = std::vector<std::string>;

struct process_result_t {
    int exit_code;
    std::string out;
    std::string err;

    inline bool ok() const noexcept { return exit_code == 0; }
};

struct JJSTACK_API process_t {
    process_t(std::string executable, bfs::path work_dir) noexcept;

    /* runs the executable, the result is an error only if it cannot be started */
    outcome::result<process_result_t> run(const args_t &args) const noexcept;

    /* as above, plus a non-zero exit status is reported as collaborator_failure,
     * stderr of the tool is logged as is; returns stdout with trailing whitespace trimmed */
    outcome::result<std::string> run_ok(const args_t &args) const noexcept;

  private:
    std::string executable;
    bfs::path work_dir;
};

JJSTACK_API std::string join_args(std::string_view executable, const args_t &args) noexcept;

} // namespace jjstack::utils
