// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once
#include <string>
#include <system_error>
#include <boost/system/error_code.hpp>
#include "jjstack-export.h"

namespace jjstack::utils {

enum class error_code_t {
    success = 0,
    collaborator_unreachable,
    collaborator_failure,
    empty_update,
    no_listing_strategy,
    cant_determine_config_dir,
    config_not_found,
    unknown_sink,
    misconfigured_default_logger,
};

enum class protocol_error_code_t {
    success = 0,
    malformed_json,
    incorrect_json,
    malformed_output,
    missing_identifier,
    truncated_listing,
};

namespace detail {

class error_code_category : public boost::system::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

class protocol_error_code_category : public boost::system::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

} // namespace detail

JJSTACK_API const detail::error_code_category &error_code_category();

JJSTACK_API const detail::protocol_error_code_category &protocol_error_code_category();

inline boost::system::error_code make_error_code(error_code_t e) {
    return {static_cast<int>(e), error_code_category()};
}

inline boost::system::error_code make_error_code(protocol_error_code_t e) {
    return {static_cast<int>(e), protocol_error_code_category()};
}

/* protocol errors are collaborator output violating the expected shape */
JJSTACK_API bool is_protocol_error(const boost::system::error_code &ec) noexcept;

} // namespace jjstack::utils

namespace boost {
namespace system {

template <> struct is_error_code_enum<jjstack::utils::error_code_t> : std::true_type {
    static const bool value = true;
};

template <> struct is_error_code_enum<jjstack::utils::protocol_error_code_t> : std::true_type {
    static const bool value = true;
};

} // namespace system
} // namespace boost
