// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "location.h"
#include "error_code.h"
#include "constants.h"
#include <cstdlib>
#include <boost/system/error_code.hpp>

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
#include <unistd.h>
#include <sys/types.h>
#include <pwd.h>
#endif

namespace jjstack::utils {

namespace sys = boost::system;

std::string expand_home(const std::string &path, const home_option_t &home) noexcept {
    if (home.has_value() && path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        auto path_view = std::string_view(path).substr(2);
        return (home.assume_value() / path_view).generic_string();
    }
    return path;
}

outcome::result<bfs::path> get_home_dir() noexcept {
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
    if (auto home = std::getenv("HOME"); home && *home) {
        return bfs::path(home);
    }
    auto *pw = getpwuid(getuid());
    if (!pw) {
        return sys::error_code{errno, sys::generic_category()};
    }
    return bfs::path(pw->pw_dir);
#else
    return error_code_t::cant_determine_config_dir;
#endif
}

outcome::result<bfs::path> get_default_config_dir() noexcept {
#if defined(__unix__)
    if (auto xdg_home = std::getenv("XDG_CONFIG_HOME"); xdg_home && *xdg_home) {
        return bfs::path(xdg_home) / constants::client_name;
    }
#endif
    auto home_opt = get_home_dir();
    if (home_opt.has_error()) {
        return home_opt.assume_error();
    }
    auto home = home_opt.assume_value();
    home /= ".config";
    home /= constants::client_name;
    return home;
}

} // namespace jjstack::utils
