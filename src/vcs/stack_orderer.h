// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <string>
#include <string_view>
#include "vcs.h"
#include "model/branch.h"
#include "utils/log.h"
#include "jjstack-export.h"

namespace jjstack::vcs {

/* Derives a linear order of branches (oldest first) from the commit graph.
 *
 * The graph is asked once, in topological order (ancestors first), for the
 * commits between trunk and the branches; the branch names are emitted in
 * the order their commits appear. Names the graph does not mention (e.g.
 * unresolvable ones) are appended in input order, i.e. the ordering
 * degrades but never drops a branch and never fails.
 */
struct JJSTACK_API stack_orderer_t {
    stack_orderer_t(vcs_t &vcs, std::string trunk_revset) noexcept;

    model::stack_order_t order(const model::branches_t &branches) noexcept;
    model::stack_order_t order(const model::names_t &names) noexcept;

    /* lines which cannot be parsed are skipped */
    static model::topology_t parse_topology(std::string_view output) noexcept;

    /* pure part of the ordering */
    static model::stack_order_t linearize(const model::names_t &names, const model::topology_t &topology) noexcept;

  private:
    vcs_t &vcs;
    std::string trunk_revset;
    utils::logger_t log;
};

} // namespace jjstack::vcs
