// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "error_code.h"

namespace jjstack::utils::detail {

const char *error_code_category::name() const noexcept { return "jjstack_error"; }

const char *protocol_error_code_category::name() const noexcept { return "jjstack_protocol_error"; }

std::string error_code_category::message(int c) const {
    std::string r;
    switch (static_cast<error_code_t>(c)) {
    case error_code_t::success:
        r = "success";
        break;
    case error_code_t::collaborator_unreachable:
        r = "external tool cannot be started";
        break;
    case error_code_t::collaborator_failure:
        r = "external tool has failed";
        break;
    case error_code_t::empty_update:
        r = "review request update has neither base nor body";
        break;
    case error_code_t::no_listing_strategy:
        r = "no branch listing strategy is available";
        break;
    case error_code_t::cant_determine_config_dir:
        r = "config dir cannot be determined";
        break;
    case error_code_t::config_not_found:
        r = "config file does not exist";
        break;
    case error_code_t::unknown_sink:
        r = "unknown sink";
        break;
    case error_code_t::misconfigured_default_logger:
        r = "default logger is missing or has no sinks";
        break;
    default:
        r = "unknown";
    }
    r += " (";
    r += std::to_string(c) + ")";
    return r;
}

std::string protocol_error_code_category::message(int c) const {
    std::string r;
    switch (static_cast<protocol_error_code_t>(c)) {
    case protocol_error_code_t::success:
        r = "success";
        break;
    case protocol_error_code_t::malformed_json:
        r = "malformed json";
        break;
    case protocol_error_code_t::incorrect_json:
        r = "incorrect json";
        break;
    case protocol_error_code_t::malformed_output:
        r = "unparseable tool output";
        break;
    case protocol_error_code_t::missing_identifier:
        r = "no review request number in tool output";
        break;
    case protocol_error_code_t::truncated_listing:
        r = "review requests listing reached its limit";
        break;
    default:
        r = "unknown";
    }
    r += " (";
    r += std::to_string(c) + ")";
    return r;
}

} // namespace jjstack::utils::detail

namespace jjstack::utils {

const static detail::error_code_category category;
const static detail::protocol_error_code_category protocol_category;

const detail::error_code_category &error_code_category() { return category; }

const detail::protocol_error_code_category &protocol_error_code_category() { return protocol_category; }

bool is_protocol_error(const boost::system::error_code &ec) noexcept { return ec.category() == protocol_category; }

} // namespace jjstack::utils
