// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#pragma once

#include "jjstack-export.h"
#include <filesystem>

#include <fmt/format.h>

template <> struct JJSTACK_API fmt::formatter<std::filesystem::path> {
    using Path = std::filesystem::path;

    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) { return ctx.end(); }

    template <typename FormatContext> auto format(const Path &path, FormatContext &ctx) const -> decltype(ctx.out());
};
