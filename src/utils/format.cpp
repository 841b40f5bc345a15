// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "format.hpp"

using ctx_t = fmt::format_context;
using path_t = std::filesystem::path;

template <typename FormatContext>
auto fmt::formatter<path_t>::format(const path_t &path, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}", path.string());
}

template JJSTACK_API auto fmt::formatter<std::filesystem::path>::format<ctx_t>(const Path &, ctx_t &ctx) const
    -> decltype(ctx.out());
