// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <string>
#include <vector>
#include "jjstack-export.h"

namespace jjstack::model {

/* name is the stack identity, target is an opaque commit id, possibly empty */
struct branch_t {
    std::string name;
    std::string target;

    bool operator==(const branch_t &other) const noexcept = default;
};

using branches_t = std::vector<branch_t>;
using names_t = std::vector<std::string>;

/* oldest (nearest to trunk) first, no duplicates */
using stack_order_t = names_t;

struct commit_t {
    std::string id;
    names_t names;
};

/* ancestors precede descendants */
using topology_t = std::vector<commit_t>;

/* keeps the first occurrence of each name, preserving order */
JJSTACK_API branches_t unique(branches_t branches) noexcept;
JJSTACK_API names_t unique(names_t names) noexcept;

JJSTACK_API names_t get_names(const branches_t &branches) noexcept;

} // namespace jjstack::model
