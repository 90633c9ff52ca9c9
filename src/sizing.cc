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

#include "sizing.hh"

#include <utility>

#include <simdutf.h>

#include "debug.hh"
#include "errors.hh"
#include "params-fmt.hh"

using namespace std::literals;

namespace textsize {

void
validate_payload(std::string_view text)
{
        auto const r = simdutf::validate_utf8_with_errors(text.data(), text.size());
        if (r.error != simdutf::error_code::SUCCESS) [[unlikely]]
                throw InvalidPayload{fmt::format("Payload is not valid UTF-8 at offset {}",
                                                 r.count)};

        for (auto i = 0uz; i < text.size(); ++i) {
                switch (uint8_t(text[i])) {
                case 0x07: /* BEL */
                case 0x18: /* CAN */
                case 0x1a: /* SUB */
                case 0x1b: /* ESC */
                        throw PayloadContainsTerminator{i};
                case 0xc2:
                        // U+009C ST; the UTF-8 was validated above
                        if (uint8_t(text[i + 1]) == 0x9c)
                                throw PayloadContainsTerminator{i};
                        break;
                default: [[likely]]
                        break;
                }
        }
}

void
encode_to(std::string& s,
          Params const& params,
          std::string_view text,
          EncodeOptions const& options)
{
        if (options.strict)
                validate_payload(text);

        auto builder = SequenceBuilder{SeqType::OSC, TEXT_SIZING_OSC};
        if (params.has_scale())
                builder.append_field('s', params.scale());
        if (params.has_width())
                builder.append_field('w', params.width());
        if (params.has_fraction()) {
                builder.append_field('n', params.numerator());
                builder.append_field('d', params.denominator());
        }
        if (params.has_vertical_align())
                builder.append_field('v', std::to_underlying(params.vertical_align()));
        if (params.has_horizontal_align())
                builder.append_field('h', std::to_underlying(params.horizontal_align()));

        builder.set_string(text);
        builder.to_string(s, options.st);

        _textsize_debug_print(debug::category::ENCODER,
                              "Encoded {:c} with {} payload bytes",
                              params, text.size());
}

std::string
encode(Params const& params,
       std::string_view text,
       EncodeOptions const& options)
{
        auto s = std::string{};
        s.reserve(text.size() + 32);
        encode_to(s, params, text, options);
        return s;
}

std::string
scaled_text(int scale,
            std::string_view text)
{
        return encode(Params{}.set_scale(scale), text);
}

std::string
fractional_text(int numerator,
                int denominator,
                std::string_view text)
{
        return encode(Params{}.set_fraction(numerator, denominator), text);
}

std::string
explicit_width(int width,
               std::string_view text)
{
        return encode(Params{}.set_width(width), text);
}

std::string
scaled_text_with_width(int scale,
                       int width,
                       std::string_view text)
{
        return encode(Params{}.set_scale(scale).set_width(width), text);
}

} // namespace textsize
