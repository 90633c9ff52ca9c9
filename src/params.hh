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

#include <cstdint>
#include <optional>
#include <string_view>

namespace textsize {

// The enumerator values are the wire codes of the v= and h= keys.
enum class VerticalAlign : uint8_t {
        TOP    = 0,
        BOTTOM = 1,
        CENTER = 2,
};

enum class HorizontalAlign : uint8_t {
        LEFT   = 0,
        RIGHT  = 1,
        CENTER = 2,
};

/*
 * Params:
 *
 * The sizing parameters of one text sizing sequence. Every field
 * has a default, and only fields that differ from their default
 * contribute to the encoded sequence.
 *
 * The constructor and the setters throw ParameterOutOfRange for
 * values outside the permitted ranges; values are never clamped.
 */
class Params {
public:
        static inline constexpr auto const SCALE_MIN = 1;
        static inline constexpr auto const SCALE_MAX = 7;
        static inline constexpr auto const WIDTH_MIN = 0;
        static inline constexpr auto const WIDTH_MAX = 7;
        static inline constexpr auto const FRACTION_MIN = 0;
        static inline constexpr auto const FRACTION_MAX = 15;

        constexpr Params() noexcept = default;

        Params(int scale,
               int width,
               int numerator = 0,
               int denominator = 0,
               VerticalAlign valign = VerticalAlign::TOP,
               HorizontalAlign halign = HorizontalAlign::LEFT); // throws

        constexpr Params(Params const&) noexcept = default;
        constexpr Params(Params&&) noexcept = default;
        ~Params() = default;

        constexpr Params& operator=(Params const&) noexcept = default;
        constexpr Params& operator=(Params&&) noexcept = default;

        friend constexpr bool operator==(Params const&, Params const&) noexcept = default;

        constexpr auto scale()            const noexcept { return int(m_scale);       }
        constexpr auto width()            const noexcept { return int(m_width);       }
        constexpr auto numerator()        const noexcept { return int(m_numerator);   }
        constexpr auto denominator()      const noexcept { return int(m_denominator); }
        constexpr auto vertical_align()   const noexcept { return m_valign;           }
        constexpr auto horizontal_align() const noexcept { return m_halign;           }

        Params& set_scale(int scale); // throws
        Params& set_width(int width); // throws
        Params& set_fraction(int numerator,
                             int denominator); // throws
        Params& set_vertical_align(VerticalAlign align); // throws
        Params& set_horizontal_align(HorizontalAlign align); // throws

        constexpr bool has_scale() const noexcept { return m_scale > 1; }
        constexpr bool has_width() const noexcept { return m_width > 0; }

        // The fractional pair is all-or-nothing: it only contributes when
        // 0 < numerator < denominator, regardless of the literal values.
        constexpr bool has_fraction() const noexcept
        {
                return m_numerator > 0 && m_denominator > m_numerator;
        }

        constexpr bool has_vertical_align() const noexcept
        {
                return m_valign != VerticalAlign::TOP;
        }

        constexpr bool has_horizontal_align() const noexcept
        {
                return m_halign != HorizontalAlign::LEFT;
        }

        constexpr bool is_default() const noexcept
        {
                return !has_scale() &&
                        !has_width() &&
                        !has_fraction() &&
                        !has_vertical_align() &&
                        !has_horizontal_align();
        }

private:
        uint8_t m_scale{1};
        uint8_t m_width{0};
        uint8_t m_numerator{0};
        uint8_t m_denominator{0};
        VerticalAlign m_valign{VerticalAlign::TOP};
        HorizontalAlign m_halign{HorizontalAlign::LEFT};

}; // class Params

std::string_view to_string(VerticalAlign align) noexcept;
std::string_view to_string(HorizontalAlign align) noexcept;

/*
 * parse_vertical_align:
 * @str: "top", "bottom", "center", or the wire code "0", "1", "2"
 *
 * Returns: the alignment, or nullopt if @str is not recognised
 */
std::optional<VerticalAlign> parse_vertical_align(std::string_view str) noexcept;

/*
 * parse_horizontal_align:
 * @str: "left", "right", "center", or the wire code "0", "1", "2"
 *
 * Returns: the alignment, or nullopt if @str is not recognised
 */
std::optional<HorizontalAlign> parse_horizontal_align(std::string_view str) noexcept;

} // namespace textsize
