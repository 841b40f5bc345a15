// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <boost/outcome.hpp>
#include "code_host.h"
#include "model/review_request.h"
#include "utils/log.h"
#include "jjstack-export.h"

namespace jjstack::host {

namespace outcome = boost::outcome_v2;

/* open review requests of the code host, indexed by head branch; every
 * failure is reported, there are no retries */
struct JJSTACK_API review_directory_t {
    review_directory_t(code_host_t &host, std::uint32_t list_limit) noexcept;

    /* fails with truncated_listing when the host returns list_limit entries,
     * as requests past the limit would be taken for missing ones */
    outcome::result<model::review_request_index_t> list_open_by_head() noexcept;

    outcome::result<model::request_number_t> create(std::string_view head, std::string_view base,
                                                    std::string_view title, std::string_view body) noexcept;

    /* at least one of base or body must be present */
    outcome::result<void> update(model::request_number_t number, std::optional<std::string_view> base,
                                 std::optional<std::string_view> body) noexcept;

    /* the default branch configured at the code host */
    outcome::result<std::string> default_branch() noexcept;

    static outcome::result<model::review_requests_t> parse_listing(std::string_view output) noexcept;
    static outcome::result<model::request_number_t> parse_created(std::string_view output) noexcept;
    static outcome::result<std::string> parse_default_branch(std::string_view output) noexcept;

  private:
    model::review_request_index_t make_index(model::review_requests_t requests) noexcept;

    code_host_t &host;
    std::uint32_t list_limit;
    utils::logger_t log;
};

} // namespace jjstack::host
