// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "model/review_request.h"
#include "jjstack-export.h"

namespace jjstack::text {

JJSTACK_API std::string start_marker(std::string_view marker_key) noexcept;
JJSTACK_API std::string end_marker(std::string_view marker_key) noexcept;

/* renders the stack status block, one line per request,
 *
 * <!--key:start-->
 * - #11
 * - 👉 #12
 * <!--key:end-->
 *
 * the pointer glyph marks the line at current_index
 */
JJSTACK_API std::string render(std::string_view marker_key, const model::request_numbers_t &numbers,
                               std::size_t current_index) noexcept;

/* replaces the well-formed marker section of the body (start marker, then
 * end marker), or prepends the new section when there is none; text outside
 * the markers is kept, the joints are normalized to a single blank line.
 * The operation is idempotent. */
JJSTACK_API std::string upsert(std::string_view body, std::string_view marker_key,
                               std::string_view new_section) noexcept;

/* the well-formed section including its markers, if any */
JJSTACK_API std::optional<std::string_view> extract(std::string_view body, std::string_view marker_key) noexcept;

} // namespace jjstack::text
