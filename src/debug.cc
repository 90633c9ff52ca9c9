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

#include "config.h"

#include "debug.hh"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <span>
#include <string>
#include <string_view>

#include <glib.h>
#include <fmt/format.h>

void
_textsize_debug_init(void)
{
#if TEXTSIZE_DEBUG
        using enum textsize::debug::category;
        const GDebugKey keys[] = {
                { "misc",         unsigned(MISC         )},
                { "encoder",      unsigned(ENCODER      )},
                { "probe",        unsigned(PROBE        )},
                { "io",           unsigned(IO           )},
                { "exceptions",   unsigned(EXCEPTIONS   )},
        };

        auto flags = g_parse_debug_string(g_getenv("TEXTSIZE_DEBUG"),
                                          keys,
                                          G_N_ELEMENTS(keys));
        textsize::debug::debug_categories = textsize::debug::category(flags);

        _textsize_debug_print(textsize::debug::category::ALL,
                              "textsize debug flags {:x}",
                              flags);
#endif /* TEXTSIZE_DEBUG */
}

/*
 * _textsize_debug_sequence_to_string:
 * @str: a byte string
 * @length: the length of @str, or -1 if @str is NUL-terminated
 *
 * Renders @str with control characters and sequence introducers
 * replaced by their names.
 *
 * Returns: a string owned by this function, valid until the next call
 */
const char *
_textsize_debug_sequence_to_string(const char *str,
                                   gssize length)
{
        static constinit char const c0_names[][6] = {
                "NUL", "SOH", "STX", "ETX", "EOT", "ENQ", "ACK", "BEL",
                "BS", "HT", "LF", "VT", "FF", "CR", "SO", "SI",
                "DLE", "DC1", "DC2", "DC3", "DC4", "NAK", "SYN", "ETB",
                "CAN", "EM", "SUB", "ESC", "FS", "GS", "RS", "US",
                "SPACE"
        };
        static std::string buf;

        if (str == nullptr)
                return "(nil)";

        auto const text = std::string_view{str, length == -1 ? strlen(str) : size_t(length)};

        buf.clear();
        auto it = std::back_inserter(buf);
        for (auto i = 0uz; i < text.size(); ++i) {
                if (i > 0)
                        *it = ' ';

                auto const c = uint8_t(text[i]);
                auto const next = i + 1 < text.size() ? uint8_t(text[i + 1]) : uint8_t(0);
                switch (c) {
                case 0x1b: /* ESC */
                        switch (next) {
                        case '[':  it = fmt::format_to(it, "CSI"); ++i; break;
                        case ']':  it = fmt::format_to(it, "OSC"); ++i; break;
                        case '\\': it = fmt::format_to(it, "ST");  ++i; break;
                        default:   it = fmt::format_to(it, "ESC");      break;
                        }
                        break;
                case 0x00 ... 0x1a:
                case 0x1c ... 0x20:
                        it = fmt::format_to(it, "{}", c0_names[c]);
                        break;
                case 0x7f:
                        it = fmt::format_to(it, "DEL");
                        break;
                case 0xc2:
                        if (next == 0x9c) { /* U+009C */
                                it = fmt::format_to(it, "ST");
                                ++i;
                                break;
                        }
                        [[fallthrough]];
                case 0x80 ... 0xc1:
                case 0xc3 ... 0xff:
                        it = fmt::format_to(it, "\\{:02x}", c);
                        break;
                default:
                        *it = char(c);
                        break;
                }
        }

        return buf.c_str();
}

void
_textsize_debug_hexdump(char const* str,
                        uint8_t const* buf,
                        size_t len)
{
#if TEXTSIZE_DEBUG
        auto out = fmt::memory_buffer{};
        auto it = std::back_inserter(out);
        it = fmt::format_to(it, "{} len = {:#x} = {}\n", str, len, len);

        for (auto ofs = 0uz; ofs < len; ofs += 16) {
                auto const line = std::span{buf + ofs, std::min(len - ofs, 16uz)};

                it = fmt::format_to(it, "{:08x}  ", ofs);
                for (auto i = 0uz; i < 16; ++i) {
                        if (i < line.size())
                                it = fmt::format_to(it, "{:02x} ", line[i]);
                        else
                                it = fmt::format_to(it, "   ");
                        if (i == 7)
                                *it = ' ';
                }

                it = fmt::format_to(it, " |");
                for (auto const c : line)
                        *it = g_ascii_isprint(c) ? char(c) : '.';
                it = fmt::format_to(it, "|\n");
        }

        textsize::debug::println("{}", fmt::to_string(out));
#endif /* TEXTSIZE_DEBUG */
}
