// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <boost/outcome.hpp>
#include "model/review_request.h"

namespace jjstack::host {

namespace outcome = boost::outcome_v2;

/* code host collaborator; all outputs are the raw text of the tool */
struct code_host_t {
    virtual ~code_host_t() = default;

    /* json array of {number, headRefName, baseRefName, body} */
    virtual outcome::result<std::string> list_open(std::uint32_t limit) noexcept = 0;

    /* stdout of the tool, the url of the created request is the last line */
    virtual outcome::result<std::string> create(std::string_view head, std::string_view base, std::string_view title,
                                                std::string_view body) noexcept = 0;

    /* absent fields are left intact */
    virtual outcome::result<void> edit(model::request_number_t number, std::optional<std::string_view> base,
                                       std::optional<std::string_view> body) noexcept = 0;

    /* json {"defaultBranchRef": {"name": ...}} */
    virtual outcome::result<std::string> view_default_branch() noexcept = 0;
};

} // namespace jjstack::host
