// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <cstdint>
#include <string>

namespace jjstack::config {

struct code_host_config_t {
    std::string executable;
    std::uint32_t list_limit;
};

} // namespace jjstack::config
