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

#include "cpr.hh"

#include <system_error>

#include <fast_float/fast_float.h>

#include "debug.hh"

namespace textsize {

std::optional<CursorPosition>
CursorPositionScanner::feed(uint8_t raw) noexcept
{
        switch (raw) {
        case 0x18: /* CAN */
        case 0x1a: /* SUB */
                transition(State::GROUND);
                return std::nullopt;
        default: [[likely]]
                break;
        }

        switch (m_state) {
        case State::GROUND: [[likely]]
                if (raw == 0x1b /* ESC */)
                        transition(State::ESC);
                return std::nullopt;

        case State::ESC:
                switch (raw) {
                case 0x1b:                /* ESC */
                        break;
                case 0x00 ... 0x1a:        /* C0 \ { ESC } */
                case 0x1c ... 0x1f:
                case 0x20 ... 0x2f:        /* intermediates */
                        break;
                case 0x5b:                /* '[' */
                        action_clear();
                        transition(State::CSI_ENTRY);
                        break;
                case 0x50:                /* 'P' */
                case 0x58:                /* 'X' */
                case 0x5d:                /* ']' */
                case 0x5e:                /* '^' */
                case 0x5f:                /* '_' */
                        transition(State::STRING);
                        break;
                default:
                        transition(State::GROUND);
                        break;
                }
                return std::nullopt;

        case State::CSI_ENTRY:
        case State::CSI_PARAM:
                switch (raw) {
                case 0x00 ... 0x1a:        /* C0 \ { ESC } */
                case 0x1c ... 0x1f:
                        return std::nullopt;
                case 0x1b:                /* ESC */
                        transition(State::ESC);
                        return std::nullopt;
                case 0x20 ... 0x2f:        /* [' ' - '/'] */
                        transition(State::CSI_IGNORE);
                        return std::nullopt;
                case 0x30 ... 0x3f:        /* ['0' - '?'] */
                        transition(State::CSI_PARAM);
                        action_collect(raw);
                        return std::nullopt;
                case 0x52:                /* 'R' */
                        transition(State::GROUND);
                        return action_dispatch();
                case 0x40 ... 0x51:        /* ['@' - '~'] \ { 'R' } */
                case 0x53 ... 0x7e:
                        transition(State::GROUND);
                        return std::nullopt;
                default:
                        transition(State::GROUND);
                        return std::nullopt;
                }

        case State::CSI_IGNORE:
                switch (raw) {
                case 0x1b:                /* ESC */
                        transition(State::ESC);
                        break;
                case 0x40 ... 0x7e:        /* ['@' - '~'] */
                        transition(State::GROUND);
                        break;
                default:
                        break;
                }
                return std::nullopt;

        case State::STRING:
                switch (raw) {
                case 0x07:                /* BEL */
                        transition(State::GROUND);
                        break;
                case 0x1b:                /* ESC */
                        transition(State::STRING_ESC);
                        break;
                default:
                        break;
                }
                return std::nullopt;

        case State::STRING_ESC:
                if (raw == 0x5c /* '\' */) {
                        transition(State::GROUND);
                        return std::nullopt;
                }

                /* A lone ESC ends the string and starts a new sequence */
                transition(State::ESC);
                return feed(raw);
        }

        __builtin_unreachable();
        return std::nullopt;
}

std::optional<CursorPosition>
CursorPositionScanner::action_dispatch() const noexcept
{
        auto const params = std::string_view{m_params, m_n_params};
        auto const pos = parse_cursor_position(params);

        if (pos)
                _textsize_debug_print(debug::category::PROBE,
                                      "Cursor position report row {} column {}",
                                      pos->row, pos->column);
        else
                _textsize_debug_print(debug::category::PROBE,
                                      "Ignoring malformed position report \"{}\"",
                                      params);

        return pos;
}

/*
 * parse_number:
 *
 * Parses one parameter. An empty parameter is the default value 1.
 *
 * Returns: the value, or nullopt if @str is not a number in the
 *   range 1..65535
 */
static std::optional<int>
parse_number(std::string_view str) noexcept
{
        if (str.empty())
                return 1;

        auto value = uint16_t{0};
        if (auto [ptr, err] = fast_float::from_chars(std::begin(str),
                                                     std::end(str),
                                                     value);
            err == std::errc() && ptr == std::end(str) && value > 0) [[likely]]
                return int(value);

        return std::nullopt;
}

std::optional<CursorPosition>
parse_cursor_position(std::string_view params) noexcept
{
        auto extended = false;
        if (params.starts_with('?')) {
                extended = true;
                params.remove_prefix(1);
        }

        int values[3];
        auto n_values = 0u;
        auto position = 0uz;
        while (true) {
                auto const next = params.find(';', position);
                auto const token = params.substr(position,
                                                 next == params.npos ? params.npos : next - position);

                if (n_values == G_N_ELEMENTS(values))
                        return std::nullopt;

                auto const value = parse_number(token);
                if (!value)
                        return std::nullopt;

                values[n_values++] = *value;

                if (next == params.npos)
                        break;
                position = next + 1;
        }

        // CPR has exactly row and column; DECXCPR may add the page
        if (n_values < 2 || (n_values == 3 && !extended))
                return std::nullopt;

        return CursorPosition{values[0], values[1]};
}

} // namespace textsize
