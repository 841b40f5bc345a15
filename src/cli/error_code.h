// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include <boost/system/error_code.hpp>
#include "jjstack-export.h"

namespace jjstack::cli {

enum class error_code_t {
    success = 0,
    command_is_missing,
    unknown_command,
    unexpected_argument,
};

namespace detail {

class error_code_category : public boost::system::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};
} // namespace detail

JJSTACK_API const detail::error_code_category &error_code_category();

inline boost::system::error_code make_error_code(error_code_t e) {
    return {static_cast<int>(e), error_code_category()};
}

} // namespace jjstack::cli

namespace boost {
namespace system {

template <> struct is_error_code_enum<jjstack::cli::error_code_t> : std::true_type {
    static const bool value = true;
};
} // namespace system
} // namespace boost
