// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <string>

namespace jjstack::config {

struct vcs_config_t {
    std::string executable;
    std::string git_executable;
    std::string trunk_revset;
    std::string head_revset;
};

} // namespace jjstack::config
