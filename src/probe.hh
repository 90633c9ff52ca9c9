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
#include <string>
#include <string_view>

#include "cpr.hh"

namespace textsize {

enum class Capability : uint8_t {
        EXPLICIT_WIDTH,
        SCALED_TEXT,
};

inline constexpr auto const EXPLICIT_WIDTH_QUERY = std::string_view{"\e]66;w=1; \e\\"};
inline constexpr auto const SCALED_TEXT_QUERY = std::string_view{"\e]66;s=2; \e\\"};
inline constexpr auto const CURSOR_POSITION_REQUEST = std::string_view{"\e[6n"};

/*
 * Capabilities:
 *
 * The outcome of probing the terminal. Both flags stay false unless
 * the terminal positively confirmed support.
 */
struct Capabilities {
        bool explicit_width{false};
        bool scaled_text{false};

        friend constexpr bool operator==(Capabilities const&,
                                         Capabilities const&) noexcept = default;
};

/*
 * CapabilityProbe:
 *
 * Probes for one capability by printing a single space with a sizing
 * directive, and measuring how far the cursor moved. A terminal not
 * implementing text sizing drops the whole control string including
 * its payload, so the cursor does not move at all.
 *
 * NOT_PROBED -> PROBE_SENT -> AWAITING_REPLY -> RESOLVED
 *
 * Any state may go to RESOLVED with a negative result through fail().
 */
class CapabilityProbe {
public:
        enum class State : uint8_t {
                NOT_PROBED,
                PROBE_SENT,
                AWAITING_REPLY,
                RESOLVED,
        };

        explicit constexpr CapabilityProbe(Capability capability) noexcept
                : m_capability{capability}
        {
        }

        constexpr auto capability() const noexcept { return m_capability; }
        constexpr auto state() const noexcept { return m_state; }
        constexpr auto resolved() const noexcept { return m_state == State::RESOLVED; }
        constexpr auto supported() const noexcept { return resolved() && m_supported; }

        // The number of cells the directive makes a single space occupy.
        constexpr int expected_advance() const noexcept
        {
                switch (m_capability) {
                case Capability::EXPLICIT_WIDTH: return 1;
                case Capability::SCALED_TEXT:    return 2;
                default: __builtin_unreachable(); return 0;
                }
        }

        // The sizing sequence to send, without the position request.
        std::string_view query() const noexcept;

        void sent() noexcept;
        void awaiting() noexcept;

        /*
         * resolve:
         * @before: the cursor position before the query was processed
         * @after: the cursor position after the query was processed
         *
         * The capability is supported iff the cursor stayed on its row
         * and advanced by exactly expected_advance() cells.
         */
        void resolve(CursorPosition const& before,
                     CursorPosition const& after) noexcept;

        void fail() noexcept;

private:
        Capability m_capability;
        State m_state{State::NOT_PROBED};
        bool m_supported{false};

}; // class CapabilityProbe

/*
 * Prober:
 *
 * Probes both capabilities at once. The request consists of a
 * baseline position request followed by each query and its own
 * position request. Terminals answer in order, so the n-th report
 * resolves the n-th probe against the report before it.
 */
class Prober {
public:
        Prober() noexcept = default;

        Prober(Prober const&) = delete;
        Prober(Prober&&) = delete;
        ~Prober() = default;

        Prober& operator=(Prober const&) = delete;
        Prober& operator=(Prober&&) = delete;

        // Returns the bytes to write to the terminal; moves the probes
        // to PROBE_SENT.
        std::string request();

        void feed(std::string_view data) noexcept;

        // No (further) replies will arrive; resolves what is left as
        // unsupported.
        void timeout() noexcept;
        void cancel() noexcept;

        constexpr bool done() const noexcept
        {
                return m_probes[0].resolved() && m_probes[1].resolved();
        }

        constexpr auto const& probe(Capability capability) const noexcept
        {
                return m_probes[unsigned(capability)];
        }

        constexpr Capabilities capabilities() const noexcept
        {
                return {probe(Capability::EXPLICIT_WIDTH).supported(),
                        probe(Capability::SCALED_TEXT).supported()};
        }

private:
        CursorPositionScanner m_scanner{};
        CapabilityProbe m_probes[2]{CapabilityProbe{Capability::EXPLICIT_WIDTH},
                                    CapabilityProbe{Capability::SCALED_TEXT}};
        std::optional<CursorPosition> m_last_position{};
        unsigned m_next{0};
        bool m_requested{false};

        void fail_all() noexcept;

}; // class Prober

} // namespace textsize
