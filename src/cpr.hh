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

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace textsize {

struct CursorPosition {
        int row;
        int column;

        friend constexpr bool operator==(CursorPosition const&,
                                         CursorPosition const&) noexcept = default;
};

/*
 * CursorPositionScanner:
 *
 * Picks cursor position reports (CSI row ; column R, and the
 * DECXCPR form CSI ? row ; column ; page R) out of the bytes a
 * terminal sends back. Everything else, including other CSI
 * replies and control strings, is skipped.
 *
 * This is deliberately not a general VT parser; it only tracks
 * enough state to find where a report starts and ends.
 */
class CursorPositionScanner {
public:
        /* Longest parameter string accepted, e.g. "?65535;65535;65535" */
        static inline constexpr auto const MAX_PARAMS_LENGTH = 24u;

        CursorPositionScanner() noexcept = default;

        CursorPositionScanner(CursorPositionScanner const&) = delete;
        CursorPositionScanner(CursorPositionScanner&&) = delete;
        ~CursorPositionScanner() = default;

        CursorPositionScanner& operator=(CursorPositionScanner const&) = delete;
        CursorPositionScanner& operator=(CursorPositionScanner&&) = delete;

        /*
         * feed:
         * @raw: the next byte
         *
         * Returns: the position if @raw completed a cursor position report
         */
        std::optional<CursorPosition> feed(uint8_t raw) noexcept;

        inline void reset() noexcept
        {
                m_state = State::GROUND;
                m_n_params = 0;
        }

private:
        enum class State : uint8_t {
                GROUND,
                ESC,
                CSI_ENTRY,
                CSI_PARAM,
                CSI_IGNORE,
                STRING,
                STRING_ESC,
        };

        State m_state{State::GROUND};
        char m_params[MAX_PARAMS_LENGTH];
        unsigned m_n_params{0};

        inline void transition(State state) noexcept
        {
                m_state = state;
        }

        inline void action_clear() noexcept
        {
                m_n_params = 0;
        }

        inline void action_collect(uint8_t raw) noexcept
        {
                if (m_n_params == MAX_PARAMS_LENGTH) [[unlikely]] {
                        // too long to be a position report
                        transition(State::CSI_IGNORE);
                        return;
                }

                m_params[m_n_params++] = char(raw);
        }

        std::optional<CursorPosition> action_dispatch() const noexcept;

}; // class CursorPositionScanner

/*
 * parse_cursor_position:
 * @params: the parameter string of a CSI R sequence
 *
 * Returns: the position, or nullopt if @params is not a valid
 *   position report
 */
std::optional<CursorPosition> parse_cursor_position(std::string_view params) noexcept;

} // namespace textsize
