// Copyright © 2026 The textsize authors
//
// This library is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published
// by the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This library is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with this library.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <string_view>

#include <fmt/format.h>

#include "params.hh"

FMT_BEGIN_NAMESPACE

template<>
struct formatter<textsize::VerticalAlign, char> : public formatter<std::string_view> {
public:
        auto format(textsize::VerticalAlign const& align,
                    format_context& ctx) const -> format_context::iterator
        {
                return formatter<std::string_view, char>::format(textsize::to_string(align), ctx);
        }
};

template<>
struct formatter<textsize::HorizontalAlign, char> : public formatter<std::string_view> {
public:
        auto format(textsize::HorizontalAlign const& align,
                    format_context& ctx) const -> format_context::iterator
        {
                return formatter<std::string_view, char>::format(textsize::to_string(align), ctx);
        }
};

// Formats as {s=2 w=0 n=0 d=0 v=top h=left}; with the 'c' flag,
// only the fields contributing to the sequence are listed.
template<>
struct formatter<textsize::Params> {
private:
        bool m_contributing{false};

public:
        constexpr auto parse(format_parse_context& ctx) -> format_parse_context::iterator
        {
                auto it = ctx.begin();
                while (it != ctx.end()) {
                        if (*it == 'c')
                                m_contributing = true;
                        else if (*it == '}')
                                break;
                        else
                                throw format_error{"Invalid format string"};
                        ++it;
                }

                return it;
        }

        auto format(textsize::Params const& params,
                    format_context& ctx) const -> format_context::iterator
        {
                if (!m_contributing)
                        return fmt::format_to(ctx.out(),
                                              "{{s={} w={} n={} d={} v={} h={}}}",
                                              params.scale(),
                                              params.width(),
                                              params.numerator(),
                                              params.denominator(),
                                              params.vertical_align(),
                                              params.horizontal_align());

                auto&& it = ctx.out();
                *it = '{'; ++it;
                auto sep = std::string_view{};
                if (params.has_scale()) {
                        it = fmt::format_to(it, "{}s={}", sep, params.scale());
                        sep = " ";
                }
                if (params.has_width()) {
                        it = fmt::format_to(it, "{}w={}", sep, params.width());
                        sep = " ";
                }
                if (params.has_fraction()) {
                        it = fmt::format_to(it, "{}n={} d={}", sep,
                                            params.numerator(), params.denominator());
                        sep = " ";
                }
                if (params.has_vertical_align()) {
                        it = fmt::format_to(it, "{}v={}", sep, params.vertical_align());
                        sep = " ";
                }
                if (params.has_horizontal_align())
                        it = fmt::format_to(it, "{}h={}", sep, params.horizontal_align());
                *it = '}'; ++it;

                ctx.advance_to(it);
                return it;
        }

}; // class formatter

FMT_END_NAMESPACE
