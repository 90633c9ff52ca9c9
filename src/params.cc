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

#include "config.h"

#include "params.hh"

#include <utility>

#include "debug.hh"
#include "errors.hh"

using namespace std::literals;

namespace textsize {

static inline void
check_range(char const* field,
            int value,
            int min_v,
            int max_v) // throws
{
        if (value < min_v || value > max_v) [[unlikely]]
                throw ParameterOutOfRange{field, value, min_v, max_v};
}

Params::Params(int scale,
               int width,
               int numerator,
               int denominator,
               VerticalAlign valign,
               HorizontalAlign halign) // throws
{
        set_scale(scale);
        set_width(width);
        set_fraction(numerator, denominator);
        set_vertical_align(valign);
        set_horizontal_align(halign);
}

Params&
Params::set_scale(int scale)
{
        check_range("scale", scale, SCALE_MIN, SCALE_MAX);
        m_scale = uint8_t(scale);
        return *this;
}

Params&
Params::set_width(int width)
{
        check_range("width", width, WIDTH_MIN, WIDTH_MAX);
        m_width = uint8_t(width);
        return *this;
}

Params&
Params::set_fraction(int numerator,
                     int denominator)
{
        check_range("numerator", numerator, FRACTION_MIN, FRACTION_MAX);
        check_range("denominator", denominator, FRACTION_MIN, FRACTION_MAX);
        m_numerator = uint8_t(numerator);
        m_denominator = uint8_t(denominator);

        if ((numerator || denominator) && !has_fraction())
                _textsize_debug_print(debug::category::ENCODER,
                                      "Fraction {}/{} is inactive",
                                      numerator, denominator);

        return *this;
}

Params&
Params::set_vertical_align(VerticalAlign align)
{
        check_range("vertical-align",
                    std::to_underlying(align),
                    std::to_underlying(VerticalAlign::TOP),
                    std::to_underlying(VerticalAlign::CENTER));
        m_valign = align;
        return *this;
}

Params&
Params::set_horizontal_align(HorizontalAlign align)
{
        check_range("horizontal-align",
                    std::to_underlying(align),
                    std::to_underlying(HorizontalAlign::LEFT),
                    std::to_underlying(HorizontalAlign::CENTER));
        m_halign = align;
        return *this;
}

std::string_view
to_string(VerticalAlign align) noexcept
{
        switch (align) {
                using enum VerticalAlign;
        case TOP:    return "top"sv;
        case BOTTOM: return "bottom"sv;
        case CENTER: return "center"sv;
        default:     return "invalid"sv;
        }
}

std::string_view
to_string(HorizontalAlign align) noexcept
{
        switch (align) {
                using enum HorizontalAlign;
        case LEFT:   return "left"sv;
        case RIGHT:  return "right"sv;
        case CENTER: return "center"sv;
        default:     return "invalid"sv;
        }
}

std::optional<VerticalAlign>
parse_vertical_align(std::string_view str) noexcept
{
        using enum VerticalAlign;
        if (str == "top"sv || str == "0"sv)
                return TOP;
        if (str == "bottom"sv || str == "1"sv)
                return BOTTOM;
        if (str == "center"sv || str == "centre"sv || str == "2"sv)
                return CENTER;

        return std::nullopt;
}

std::optional<HorizontalAlign>
parse_horizontal_align(std::string_view str) noexcept
{
        using enum HorizontalAlign;
        if (str == "left"sv || str == "0"sv)
                return LEFT;
        if (str == "right"sv || str == "1"sv)
                return RIGHT;
        if (str == "center"sv || str == "centre"sv || str == "2"sv)
                return CENTER;

        return std::nullopt;
}

} // namespace textsize
