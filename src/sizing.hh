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

#include <string>
#include <string_view>

#include "params.hh"
#include "sequence-builder.hh"

namespace textsize {

inline constexpr auto const TEXT_SIZING_OSC = 66u;

struct EncodeOptions {
        // The canonical terminator is the 7-bit ESC '\'.
        ST st{ST::C0};

        // Validate the payload before encoding instead of emitting
        // a sequence that would end early.
        bool strict{false};
};

/*
 * validate_payload:
 * @text: the payload
 *
 * Checks that @text is valid UTF-8 and contains nothing that ends or
 * aborts a control string (ESC, BEL, CAN, SUB, or U+009C).
 *
 * Throws InvalidPayload, or PayloadContainsTerminator.
 */
void validate_payload(std::string_view text); // throws

/*
 * encode_to:
 * @s: the string to append to
 * @params: the sizing parameters
 * @text: the payload
 * @options: encoding options
 *
 * Appends the text sizing sequence for @text to @s. Only fields that
 * differ from their default are emitted, in the order scale, width,
 * fraction, vertical alignment, horizontal alignment.
 *
 * Unless @options.strict is set, @text is not checked; a payload
 * containing a string terminator yields a sequence that ends early.
 */
void encode_to(std::string& s,
               Params const& params,
               std::string_view text,
               EncodeOptions const& options = {}); // throws in strict mode

std::string encode(Params const& params,
                   std::string_view text,
                   EncodeOptions const& options = {}); // throws in strict mode

// Shorthands, each identical to encode() with only the named fields set.
// They throw ParameterOutOfRange like the Params setters.

std::string scaled_text(int scale,
                        std::string_view text);

std::string fractional_text(int numerator,
                            int denominator,
                            std::string_view text);

std::string explicit_width(int width,
                           std::string_view text);

std::string scaled_text_with_width(int scale,
                                   int width,
                                   std::string_view text);

} // namespace textsize
