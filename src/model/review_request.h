// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace jjstack::model {

using request_number_t = std::uint64_t;
using request_numbers_t = std::vector<request_number_t>;

/* stands for a request which would be created, but was not (dry-run) */
inline constexpr request_number_t placeholder_number = 0;

struct review_request_t {
    request_number_t number;
    std::string head;
    std::string base;
    std::string body;
};

using review_requests_t = std::vector<review_request_t>;

/* head name -> open review request */
using review_request_index_t = std::unordered_map<std::string, review_request_t>;

} // namespace jjstack::model
