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

#include <cassert>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace textsize {

enum class SeqType : uint8_t {
        CSI,
        OSC,
};

// How a control string is terminated.
enum class ST : uint8_t {
        C0,  // ESC '\'
        C1,  // U+009C, UTF-8 encoded
        BEL, // xterm
};

/*
 * SequenceBuilder:
 *
 * Builds CSI sequences (ESC [ params final) and OSC control strings
 * of the form
 *
 *   ESC ] command ; field[:field]... ; string ST
 *
 * where each field is key=value. The parameter block of an OSC is
 * always present, even when there are no fields.
 */
class SequenceBuilder {
public:
        static inline constexpr auto const MAX_PARAMS = 8u;

        constexpr SequenceBuilder(SeqType type,
                                  unsigned final_or_command) noexcept
                : m_type{type},
                  m_final{final_or_command}
        {
        }

        SequenceBuilder(SequenceBuilder const&) = delete;
        SequenceBuilder(SequenceBuilder&&) = delete;
        ~SequenceBuilder() = default;

        SequenceBuilder& operator= (SequenceBuilder const&) = delete;
        SequenceBuilder& operator= (SequenceBuilder&&) = delete;

        /* CSI only; -1 is a default parameter */
        constexpr auto& append_param(int p) noexcept
        {
                assert(m_type == SeqType::CSI);
                assert(m_n_params + 1u <= MAX_PARAMS);
                m_params[m_n_params++] = {0, p};
                return *this;
        }

        /* OSC only */
        constexpr auto& append_field(char key,
                                     int value) noexcept
        {
                assert(m_type == SeqType::OSC);
                assert(m_n_params + 1u <= MAX_PARAMS);
                m_params[m_n_params++] = {key, value};
                return *this;
        }

        constexpr auto& set_string(std::string_view str) noexcept
        {
                m_arg_str = str;
                return *this;
        }

        void to_string(std::string& s,
                       ST st = ST::C0) const
        {
                s.push_back(0x1b); // ESC
                switch (m_type) {
                case SeqType::CSI:
                        s.push_back(0x5b); // [
                        append_csi_params(s);
                        s.push_back(char(m_final));
                        break;
                case SeqType::OSC:
                        s.push_back(0x5d); // ]
                        append_osc_params(s);
                        append_arg_string(s, st);
                        break;
                }
        }

        std::string to_string(ST st = ST::C0) const
        {
                auto s = std::string{};
                to_string(s, st);
                return s;
        }

private:
        struct param {
                char key;
                int value;
        };

        SeqType m_type;
        unsigned m_final;
        param m_params[MAX_PARAMS]{};
        unsigned char m_n_params{0};
        std::string_view m_arg_str{};

        void append_csi_params(std::string& s) const
        {
                auto it = std::back_inserter(s);
                for (auto n = 0u; n < m_n_params; n++) {
                        if (auto const arg = m_params[n].value; arg != -1)
                                it = fmt::format_to(it, "{}", arg);
                        if (n + 1 < m_n_params)
                                *it = ';';
                }
        }

        void append_osc_params(std::string& s) const
        {
                auto it = std::back_inserter(s);
                it = fmt::format_to(it, "{};", m_final);
                for (auto n = 0u; n < m_n_params; n++) {
                        it = fmt::format_to(it, "{}={}", m_params[n].key, m_params[n].value);
                        if (n + 1 < m_n_params)
                                *it = ':';
                }
                *it = ';';
        }

        void append_arg_string(std::string& s,
                               ST st) const
        {
                s.append(m_arg_str);

                switch (st) {
                case ST::C0:
                        s.push_back(0x1b); // ESC
                        s.push_back(0x5c); // BACKSLASH
                        break;
                case ST::C1:
                        s.push_back(char(0xc2));
                        s.push_back(char(0x9c)); // ST
                        break;
                case ST::BEL:
                        s.push_back(0x7); // BEL
                        break;
                }
        }

}; // class SequenceBuilder

} // namespace textsize
