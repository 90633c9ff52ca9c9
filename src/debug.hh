/*
 * Copyright © 2026 The textsize authors
 *
 * This library is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library.  If not, see <https://www.gnu.org/licenses/>.
 */

/* The interfaces in this file are subject to change at any time. */

#pragma once

#include <stdint.h>
#include <glib.h>

#include "cxx-utils.hh"

#if TEXTSIZE_DEBUG
#include <cstdio>
#include <fmt/format.h>
#endif

namespace textsize::debug {

enum class category : unsigned {
        NONE          = 0,
        ALL           = ~0u,
        MISC          = 1u << 0,
        ENCODER       = 1u << 1,
        PROBE         = 1u << 2,
        IO            = 1u << 3,
        EXCEPTIONS    = 1u << 4,
};

TEXTSIZE_CXX_DEFINE_BITMASK(category);

#if TEXTSIZE_DEBUG
inline category debug_categories = category::NONE;
#endif

static inline bool
check_categories(category cats)
{
#if TEXTSIZE_DEBUG
        return (debug_categories & cats) != category::NONE;
#else
        return false;
#endif
}

#if TEXTSIZE_DEBUG

namespace detail {

static inline void
log(fmt::string_view fmt,
    fmt::format_args args)
{
        fmt::vprint(stderr, fmt, args);
        std::fputc('\n', stderr);
}

} // namespace detail

template<typename... T>
static inline void
println(fmt::format_string<T...> fmt,
        T&&... args) noexcept
try
{
        detail::log(fmt, fmt::make_format_args(args...));
}
catch (...)
{
}

#endif // TEXTSIZE_DEBUG

} // namespace textsize::debug

void _textsize_debug_init(void);
const char *_textsize_debug_sequence_to_string(const char *str,
                                               gssize length);

void _textsize_debug_hexdump(char const* str,
                             uint8_t const* buf,
                             size_t len);

#if TEXTSIZE_DEBUG
#define _TEXTSIZE_DEBUG_IF(cats) if (textsize::debug::check_categories(cats)) [[unlikely]]
#else
#define _TEXTSIZE_DEBUG_IF(cats) if constexpr (false)
#endif

#if TEXTSIZE_DEBUG
#define _textsize_debug_print(cats, ...) \
        G_STMT_START { _TEXTSIZE_DEBUG_IF(cats) { \
                        textsize::debug::println(__VA_ARGS__); \
                } \
        } G_STMT_END
#else
#define _textsize_debug_print(...) do { } while(0)
#endif // TEXTSIZE_DEBUG
