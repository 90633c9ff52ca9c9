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

#include "probe.hh"
#include "cpr.hh"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glib.h>

#include "sizing.hh"

using namespace std::literals;
using namespace textsize;

static auto
scan(CursorPositionScanner& scanner,
     std::string_view data)
{
        auto positions = std::vector<CursorPosition>{};
        for (auto const c : data) {
                if (auto const pos = scanner.feed(uint8_t(c)))
                        positions.push_back(*pos);
        }
        return positions;
}

static auto
scan(std::string_view data)
{
        auto scanner = CursorPositionScanner{};
        return scan(scanner, data);
}

static void
test_probe_parse_position(void)
{
        g_assert_true(parse_cursor_position("12;40"sv) == (CursorPosition{12, 40}));
        g_assert_true(parse_cursor_position("1;1"sv) == (CursorPosition{1, 1}));
        g_assert_true(parse_cursor_position(";"sv) == (CursorPosition{1, 1}));
        g_assert_true(parse_cursor_position("5;"sv) == (CursorPosition{5, 1}));
        g_assert_true(parse_cursor_position("65535;65535"sv) == (CursorPosition{65535, 65535}));
        g_assert_true(parse_cursor_position("?3;7"sv) == (CursorPosition{3, 7}));
        g_assert_true(parse_cursor_position("?3;7;1"sv) == (CursorPosition{3, 7}));

        g_assert_false(parse_cursor_position(""sv).has_value());
        g_assert_false(parse_cursor_position("12"sv).has_value());
        g_assert_false(parse_cursor_position("1;2;3"sv).has_value());
        g_assert_false(parse_cursor_position("?1;2;3;4"sv).has_value());
        g_assert_false(parse_cursor_position("0;5"sv).has_value());
        g_assert_false(parse_cursor_position("65536;1"sv).has_value());
        g_assert_false(parse_cursor_position("1:2;3"sv).has_value());
        g_assert_false(parse_cursor_position("-1;3"sv).has_value());
        g_assert_false(parse_cursor_position("1;3?"sv).has_value());
        g_assert_false(parse_cursor_position(">1;3"sv).has_value());
}

static void
test_probe_scanner(void)
{
        auto positions = scan("\e[12;40R"sv);
        g_assert_cmpuint(positions.size(), ==, 1);
        g_assert_true(positions[0] == (CursorPosition{12, 40}));

        positions = scan("\e[1;1R\e[?2;3;1R\e[4;5R"sv);
        g_assert_cmpuint(positions.size(), ==, 3);
        g_assert_true(positions[0] == (CursorPosition{1, 1}));
        g_assert_true(positions[1] == (CursorPosition{2, 3}));
        g_assert_true(positions[2] == (CursorPosition{4, 5}));

        // Split at every possible point
        auto const report = "\e[7;9R"sv;
        for (auto split = 0uz; split <= report.size(); ++split) {
                auto scanner = CursorPositionScanner{};
                auto first = scan(scanner, report.substr(0, split));
                auto second = scan(scanner, report.substr(split));
                g_assert_cmpuint(first.size() + second.size(), ==, 1);
                auto const& pos = first.empty() ? second[0] : first[0];
                g_assert_true(pos == (CursorPosition{7, 9}));
        }
}

static void
test_probe_scanner_noise(void)
{
        // Keyboard input, other replies and control strings around the report
        auto positions = scan("typed\e[?62;22c"
                              "\e]11;rgb:0000/0000/0000\e\\"
                              "\eP1$r0m\e\\"
                              "\e_Gi=1;OK\e\\"
                              "\e]10;rgb:ffff/ffff/ffff\a"
                              "\e[1;5A" "\eOP"
                              "\e[3;4R"
                              "more"sv);
        g_assert_cmpuint(positions.size(), ==, 1);
        g_assert_true(positions[0] == (CursorPosition{3, 4}));

        // Report-like text inside a control string
        positions = scan("\e]0;[1;1R\a\e[2;2R"sv);
        g_assert_cmpuint(positions.size(), ==, 1);
        g_assert_true(positions[0] == (CursorPosition{2, 2}));

        // A lone ESC ends a string and starts the next sequence
        positions = scan("\e]0;title\e\e[5;6R"sv);
        g_assert_cmpuint(positions.size(), ==, 1);
        g_assert_true(positions[0] == (CursorPosition{5, 6}));

        // CAN and SUB abort a sequence
        positions = scan("\e[1\x18;2R\e[3\x1a;4R\e[5;6R"sv);
        g_assert_cmpuint(positions.size(), ==, 1);
        g_assert_true(positions[0] == (CursorPosition{5, 6}));

        // Intermediates and overlong parameters
        positions = scan("\e[1;2 R\e[1111111111111111111111111;1R\e[8;9R"sv);
        g_assert_cmpuint(positions.size(), ==, 1);
        g_assert_true(positions[0] == (CursorPosition{8, 9}));

        // Malformed reports
        positions = scan("\e[0;1R\e[1R\e[1;2;3R\e[99999;1R"sv);
        g_assert_cmpuint(positions.size(), ==, 0);

        // UTF-8 text containing a 0x9b byte
        positions = scan("\xe2\x9b\x84" "1;1R"sv);
        g_assert_cmpuint(positions.size(), ==, 0);
}

static void
test_probe_queries(void)
{
        g_assert_true(EXPLICIT_WIDTH_QUERY == "\e]66;w=1; \e\\"sv);
        g_assert_true(SCALED_TEXT_QUERY == "\e]66;s=2; \e\\"sv);
        g_assert_true(CURSOR_POSITION_REQUEST == "\e[6n"sv);

        g_assert_true(explicit_width(1, " "sv) == EXPLICIT_WIDTH_QUERY);
        g_assert_true(scaled_text(2, " "sv) == SCALED_TEXT_QUERY);

        g_assert_true(CapabilityProbe{Capability::EXPLICIT_WIDTH}.query() == EXPLICIT_WIDTH_QUERY);
        g_assert_true(CapabilityProbe{Capability::SCALED_TEXT}.query() == SCALED_TEXT_QUERY);
        g_assert_cmpint(CapabilityProbe{Capability::EXPLICIT_WIDTH}.expected_advance(), ==, 1);
        g_assert_cmpint(CapabilityProbe{Capability::SCALED_TEXT}.expected_advance(), ==, 2);
}

static void
test_probe_request(void)
{
        auto prober = Prober{};
        g_assert_true(prober.probe(Capability::EXPLICIT_WIDTH).state() == CapabilityProbe::State::NOT_PROBED);
        g_assert_true(prober.probe(Capability::SCALED_TEXT).state() == CapabilityProbe::State::NOT_PROBED);

        auto const request = prober.request();
        auto expected = std::string{};
        expected.append(CURSOR_POSITION_REQUEST);
        expected.append(EXPLICIT_WIDTH_QUERY);
        expected.append(CURSOR_POSITION_REQUEST);
        expected.append(SCALED_TEXT_QUERY);
        expected.append(CURSOR_POSITION_REQUEST);
        g_assert_true(request == expected);

        g_assert_true(prober.probe(Capability::EXPLICIT_WIDTH).state() == CapabilityProbe::State::PROBE_SENT);
        g_assert_true(prober.probe(Capability::SCALED_TEXT).state() == CapabilityProbe::State::PROBE_SENT);
        g_assert_false(prober.done());
}

static void
test_probe_supported(void)
{
        auto prober = Prober{};
        prober.request();
        prober.feed("\e[3;1R\e[3;2R\e[3;4R"sv);

        g_assert_true(prober.done());
        g_assert_true(prober.capabilities() == (Capabilities{true, true}));
}

static void
test_probe_unsupported(void)
{
        {
                // The sequences were swallowed together with their payload
                auto prober = Prober{};
                prober.request();
                prober.feed("\e[3;1R\e[3;1R\e[3;1R"sv);
                g_assert_true(prober.done());
                g_assert_true(prober.capabilities() == (Capabilities{false, false}));
        }

        {
                // Width honoured, scale rendered as a plain space
                auto prober = Prober{};
                prober.request();
                prober.feed("\e[3;1R\e[3;2R\e[3;3R"sv);
                g_assert_true(prober.capabilities() == (Capabilities{true, false}));
        }

        {
                // Width overshooting, scale honoured
                auto prober = Prober{};
                prober.request();
                prober.feed("\e[3;1R\e[3;3R\e[3;5R"sv);
                g_assert_true(prober.capabilities() == (Capabilities{false, true}));
        }

        {
                // Wrapping to the next line is not an advance
                auto prober = Prober{};
                prober.request();
                prober.feed("\e[3;80R\e[4;1R\e[4;3R"sv);
                g_assert_true(prober.capabilities() == (Capabilities{false, true}));
        }

        {
                // Moving backwards
                auto prober = Prober{};
                prober.request();
                prober.feed("\e[3;5R\e[3;4R\e[3;6R"sv);
                g_assert_true(prober.capabilities() == (Capabilities{false, true}));
        }
}

static void
test_probe_chunked(void)
{
        auto const reply = "noise\e[3;1R\e]11;rgb:0/0/0\a\e[3;2Rx\e[?1;2c\e[3;4R"sv;
        for (auto chunk = 1uz; chunk <= reply.size(); ++chunk) {
                auto prober = Prober{};
                prober.request();
                for (auto pos = 0uz; pos < reply.size(); pos += chunk)
                        prober.feed(reply.substr(pos, chunk));

                g_assert_true(prober.done());
                g_assert_true(prober.capabilities() == (Capabilities{true, true}));
        }
}

static void
test_probe_in_order(void)
{
        auto prober = Prober{};
        prober.request();

        prober.feed("\e[10;20R"sv);
        g_assert_true(prober.probe(Capability::EXPLICIT_WIDTH).state() == CapabilityProbe::State::AWAITING_REPLY);
        g_assert_true(prober.probe(Capability::SCALED_TEXT).state() == CapabilityProbe::State::PROBE_SENT);

        // Resolves the first probe only, against the baseline
        prober.feed("\e[10;21R"sv);
        g_assert_true(prober.probe(Capability::EXPLICIT_WIDTH).resolved());
        g_assert_true(prober.probe(Capability::EXPLICIT_WIDTH).supported());
        g_assert_true(prober.probe(Capability::SCALED_TEXT).state() == CapabilityProbe::State::AWAITING_REPLY);
        g_assert_false(prober.done());

        // Measured against the previous report, not the baseline
        prober.feed("\e[10;23R"sv);
        g_assert_true(prober.probe(Capability::SCALED_TEXT).supported());
        g_assert_true(prober.done());

        // Late reports change nothing
        prober.feed("\e[1;1R\e[1;1R"sv);
        g_assert_true(prober.capabilities() == (Capabilities{true, true}));
}

static void
test_probe_timeout(void)
{
        {
                // No reply at all
                auto prober = Prober{};
                prober.request();
                prober.timeout();
                g_assert_true(prober.done());
                g_assert_true(prober.capabilities() == (Capabilities{false, false}));
                g_assert_true(prober.probe(Capability::EXPLICIT_WIDTH).state() == CapabilityProbe::State::RESOLVED);
        }

        {
                // Only the first probe answered
                auto prober = Prober{};
                prober.request();
                prober.feed("\e[3;1R\e[3;2R\e[3"sv);
                g_assert_false(prober.done());
                prober.timeout();
                g_assert_true(prober.done());
                g_assert_true(prober.capabilities() == (Capabilities{true, false}));

                prober.feed(";4R"sv);
                g_assert_true(prober.capabilities() == (Capabilities{true, false}));
        }

        {
                // Replies that are not position reports
                auto prober = Prober{};
                prober.request();
                prober.feed("\e[?62;22c\e]11;rgb:0/0/0\e\\"sv);
                prober.timeout();
                g_assert_true(prober.capabilities() == (Capabilities{false, false}));
        }
}

static void
test_probe_cancel(void)
{
        {
                auto prober = Prober{};
                prober.cancel();
                g_assert_true(prober.done());
                g_assert_true(prober.capabilities() == (Capabilities{false, false}));
        }

        {
                auto prober = Prober{};
                prober.request();
                prober.feed("\e[3;1R"sv);
                prober.cancel();
                g_assert_true(prober.capabilities() == (Capabilities{false, false}));
        }

        {
                // Reports before the request was made are ignored
                auto prober = Prober{};
                prober.feed("\e[3;1R\e[3;2R\e[3;4R"sv);
                g_assert_false(prober.done());
                g_assert_true(prober.capabilities() == (Capabilities{false, false}));
        }
}

int
main(int argc,
     char** argv)
{
        g_test_init(&argc, &argv, nullptr);

        g_test_add_func("/textsize/probe/parse-position", test_probe_parse_position);
        g_test_add_func("/textsize/probe/scanner", test_probe_scanner);
        g_test_add_func("/textsize/probe/scanner-noise", test_probe_scanner_noise);
        g_test_add_func("/textsize/probe/queries", test_probe_queries);
        g_test_add_func("/textsize/probe/request", test_probe_request);
        g_test_add_func("/textsize/probe/supported", test_probe_supported);
        g_test_add_func("/textsize/probe/unsupported", test_probe_unsupported);
        g_test_add_func("/textsize/probe/chunked", test_probe_chunked);
        g_test_add_func("/textsize/probe/in-order", test_probe_in_order);
        g_test_add_func("/textsize/probe/timeout", test_probe_timeout);
        g_test_add_func("/textsize/probe/cancel", test_probe_cancel);

        return g_test_run();
}
