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

#include "probe.hh"

#include "debug.hh"
#include "sequence-builder.hh"

using namespace std::literals;

namespace textsize {

static constexpr std::string_view
capability_name(Capability capability) noexcept
{
        switch (capability) {
        case Capability::EXPLICIT_WIDTH: return "explicit-width"sv;
        case Capability::SCALED_TEXT:    return "scaled-text"sv;
        default: __builtin_unreachable(); return {};
        }
}

std::string_view
CapabilityProbe::query() const noexcept
{
        switch (m_capability) {
        case Capability::EXPLICIT_WIDTH: return EXPLICIT_WIDTH_QUERY;
        case Capability::SCALED_TEXT:    return SCALED_TEXT_QUERY;
        default: __builtin_unreachable(); return {};
        }
}

void
CapabilityProbe::sent() noexcept
{
        if (m_state == State::NOT_PROBED)
                m_state = State::PROBE_SENT;
}

void
CapabilityProbe::awaiting() noexcept
{
        if (m_state == State::PROBE_SENT)
                m_state = State::AWAITING_REPLY;
}

void
CapabilityProbe::resolve(CursorPosition const& before,
                         CursorPosition const& after) noexcept
{
        if (m_state != State::AWAITING_REPLY) [[unlikely]]
                return;

        m_supported = before.row == after.row &&
                after.column - before.column == expected_advance();
        m_state = State::RESOLVED;

        _textsize_debug_print(debug::category::PROBE,
                              "Probe {} moved cursor from {};{} to {};{}: {}",
                              capability_name(m_capability),
                              before.row, before.column,
                              after.row, after.column,
                              m_supported ? "supported" : "unsupported");
}

void
CapabilityProbe::fail() noexcept
{
        if (m_state == State::RESOLVED)
                return;

        m_supported = false;
        m_state = State::RESOLVED;

        _textsize_debug_print(debug::category::PROBE,
                              "Probe {} got no reply, assuming unsupported",
                              capability_name(m_capability));
}

std::string
Prober::request()
{
        auto cpr = SequenceBuilder{SeqType::CSI, 'n'};
        cpr.append_param(6);

        auto s = std::string{};
        cpr.to_string(s);
        for (auto& probe : m_probes) {
                s.append(probe.query());
                cpr.to_string(s);
                probe.sent();
        }

        m_requested = true;
        m_next = 0;
        m_last_position.reset();
        m_scanner.reset();

        return s;
}

void
Prober::feed(std::string_view data) noexcept
{
        if (!m_requested || done())
                return;

        for (auto const c : data) {
                auto const position = m_scanner.feed(uint8_t(c));
                if (!position)
                        continue;

                if (m_last_position) {
                        m_probes[m_next++].resolve(*m_last_position, *position);
                        if (m_next == G_N_ELEMENTS(m_probes))
                                return;
                }

                m_last_position = position;
                m_probes[m_next].awaiting();
        }
}

void
Prober::fail_all() noexcept
{
        for (auto& probe : m_probes)
                probe.fail();
}

void
Prober::timeout() noexcept
{
        _textsize_debug_print(debug::category::PROBE,
                              "Probe timed out");
        fail_all();
}

void
Prober::cancel() noexcept
{
        _textsize_debug_print(debug::category::PROBE,
                              "Probe cancelled");
        fail_all();
}

} // namespace textsize
