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

#include <stdexcept>
#include <string>

namespace textsize {

// Thrown when a sizing parameter is constructed or set outside
// of its permitted range. Parameters are never clamped.
class ParameterOutOfRange : public std::out_of_range {
public:
        ParameterOutOfRange(char const* field,
                            int value,
                            int min_v,
                            int max_v);

        constexpr auto field() const noexcept { return m_field; }
        constexpr auto value() const noexcept { return m_value; }

private:
        char const* m_field;
        int m_value;
}; // class ParameterOutOfRange

// Thrown in strict mode when the payload cannot be
// embedded verbatim into a control string.
class InvalidPayload : public std::invalid_argument {
public:
        using std::invalid_argument::invalid_argument;
}; // class InvalidPayload

class PayloadContainsTerminator : public InvalidPayload {
public:
        explicit PayloadContainsTerminator(std::size_t offset);

        constexpr auto offset() const noexcept { return m_offset; }

private:
        std::size_t m_offset;
}; // class PayloadContainsTerminator

} // namespace textsize
