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

#include "errors.hh"

#include <fmt/format.h>

namespace textsize {

ParameterOutOfRange::ParameterOutOfRange(char const* field,
                                         int value,
                                         int min_v,
                                         int max_v)
        : std::out_of_range{fmt::format("Parameter {} value {} out of range {}..{}",
                                        field, value, min_v, max_v)},
          m_field{field},
          m_value{value}
{
}

PayloadContainsTerminator::PayloadContainsTerminator(std::size_t offset)
        : InvalidPayload{fmt::format("Payload contains a string terminator at offset {}",
                                     offset)},
          m_offset{offset}
{
}

} // namespace textsize
