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

#include "sizing.hh"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <glib.h>

#include "errors.hh"
#include "glib-glue.hh"
#include "sequence-builder.hh"

using namespace std::literals;
using namespace textsize;

static void
assert_encoding(Params const& params,
                std::string_view text,
                std::string_view expected,
                EncodeOptions const& options = {})
{
        auto const str = encode(params, text, options);
        g_assert_cmpuint(str.size(), ==, expected.size());
        g_assert_true(str == expected);
}

static void
test_sizing_default(void)
{
        assert_encoding(Params{}, "hi"sv, "\e]66;;hi\e\\"sv);
        assert_encoding(Params{}, ""sv, "\e]66;;\e\\"sv);
}

static void
test_sizing_fields(void)
{
        assert_encoding(Params{}.set_scale(2), "Hello"sv, "\e]66;s=2;Hello\e\\"sv);
        assert_encoding(Params{}.set_scale(7), "x"sv, "\e]66;s=7;x\e\\"sv);
        assert_encoding(Params{}.set_width(3), "x"sv, "\e]66;w=3;x\e\\"sv);
        assert_encoding(Params{}.set_fraction(1, 2), "x"sv, "\e]66;n=1:d=2;x\e\\"sv);
        assert_encoding(Params{}.set_fraction(14, 15), "x"sv, "\e]66;n=14:d=15;x\e\\"sv);
        assert_encoding(Params{}.set_vertical_align(VerticalAlign::BOTTOM), "x"sv, "\e]66;v=1;x\e\\"sv);
        assert_encoding(Params{}.set_vertical_align(VerticalAlign::CENTER), "x"sv, "\e]66;v=2;x\e\\"sv);
        assert_encoding(Params{}.set_horizontal_align(HorizontalAlign::RIGHT), "x"sv, "\e]66;h=1;x\e\\"sv);
        assert_encoding(Params{}.set_horizontal_align(HorizontalAlign::CENTER), "x"sv, "\e]66;h=2;x\e\\"sv);

        assert_encoding(Params{}.set_scale(2).set_width(2), "🐈"sv, "\e]66;s=2:w=2;🐈\e\\"sv);
        assert_encoding(Params{}.set_scale(2).set_horizontal_align(HorizontalAlign::CENTER),
                        "CENTER"sv, "\e]66;s=2:h=2;CENTER\e\\"sv);

        // Scale and fraction together are both emitted
        assert_encoding(Params{}.set_scale(3).set_fraction(1, 3), "x"sv, "\e]66;s=3:n=1:d=3;x\e\\"sv);
}

static void
test_sizing_inactive_fraction(void)
{
        assert_encoding(Params{}.set_fraction(3, 2), "x"sv, "\e]66;;x\e\\"sv);
        assert_encoding(Params{}.set_fraction(2, 2), "x"sv, "\e]66;;x\e\\"sv);
        assert_encoding(Params{}.set_fraction(0, 2), "x"sv, "\e]66;;x\e\\"sv);
        assert_encoding(Params{}.set_fraction(1, 0), "x"sv, "\e]66;;x\e\\"sv);
        assert_encoding(Params{}.set_scale(2).set_fraction(3, 2), "x"sv, "\e]66;s=2;x\e\\"sv);
}

static void
test_sizing_order(void)
{
        auto const params = Params(3, 2, 1, 2, VerticalAlign::BOTTOM, HorizontalAlign::CENTER);
        assert_encoding(params, "x"sv, "\e]66;s=3:w=2:n=1:d=2:v=1:h=2;x\e\\"sv);

        // Setting order does not matter
        auto reversed = Params{};
        reversed.set_horizontal_align(HorizontalAlign::CENTER)
                .set_vertical_align(VerticalAlign::BOTTOM)
                .set_fraction(1, 2)
                .set_width(2)
                .set_scale(3);
        assert_encoding(reversed, "x"sv, "\e]66;s=3:w=2:n=1:d=2:v=1:h=2;x\e\\"sv);

        assert_encoding(Params(1, 4, 0, 0, VerticalAlign::CENTER, HorizontalAlign::RIGHT),
                        "ab"sv, "\e]66;w=4:v=2:h=1;ab\e\\"sv);
}

static void
test_sizing_projections(void)
{
        for (auto scale = Params::SCALE_MIN; scale <= Params::SCALE_MAX; ++scale) {
                g_assert_true(scaled_text(scale, "Hello"sv) ==
                              encode(Params{}.set_scale(scale), "Hello"sv));

                for (auto width = Params::WIDTH_MIN; width <= Params::WIDTH_MAX; ++width)
                        g_assert_true(scaled_text_with_width(scale, width, "🐈"sv) ==
                                      encode(Params{}.set_scale(scale).set_width(width), "🐈"sv));
        }

        for (auto width = Params::WIDTH_MIN; width <= Params::WIDTH_MAX; ++width)
                g_assert_true(explicit_width(width, "x"sv) ==
                              encode(Params{}.set_width(width), "x"sv));

        for (auto n = Params::FRACTION_MIN; n <= Params::FRACTION_MAX; ++n) {
                for (auto d = Params::FRACTION_MIN; d <= Params::FRACTION_MAX; ++d)
                        g_assert_true(fractional_text(n, d, "x"sv) ==
                                      encode(Params{}.set_fraction(n, d), "x"sv));
        }

        g_assert_true(scaled_text(2, "Hello"sv) == "\e]66;s=2;Hello\e\\"sv);
        g_assert_true(fractional_text(1, 2, "x"sv) == "\e]66;n=1:d=2;x\e\\"sv);
        g_assert_true(explicit_width(1, " "sv) == "\e]66;w=1; \e\\"sv);
        g_assert_true(scaled_text_with_width(2, 2, "🐈"sv) == "\e]66;s=2:w=2;🐈\e\\"sv);

        try {
                scaled_text(0, "x"sv);
                g_assert_not_reached();
        } catch (ParameterOutOfRange const& e) {
                g_assert_cmpstr(e.field(), ==, "scale");
        }

        try {
                explicit_width(8, "x"sv);
                g_assert_not_reached();
        } catch (ParameterOutOfRange const& e) {
                g_assert_cmpstr(e.field(), ==, "width");
        }
}

static void
test_sizing_deterministic(void)
{
        auto const params = Params(2, 2, 1, 3, VerticalAlign::CENTER, HorizontalAlign::RIGHT);
        auto const a = encode(params, "same"sv);
        auto const b = encode(params, "same"sv);
        g_assert_true(a == b);

        auto s = std::string{"prefix"};
        encode_to(s, params, "same"sv);
        g_assert_true(s == "prefix"s + a);
}

static void
test_sizing_st(void)
{
        assert_encoding(Params{}.set_scale(2), "x"sv, "\e]66;s=2;x\xc2\x9c"sv, {ST::C1});
        assert_encoding(Params{}.set_scale(2), "x"sv, "\e]66;s=2;x\a"sv, {ST::BEL});
        assert_encoding(Params{}, "x"sv, "\e]66;;x\e\\"sv, {ST::C0});
}

static void
test_sizing_strict(void)
{
        auto const strict = EncodeOptions{ST::C0, true};

        // Well-formed payloads encode the same as in lenient mode
        assert_encoding(Params{}.set_scale(2), "Hello, wörld 🐈"sv,
                        "\e]66;s=2;Hello, wörld 🐈\e\\"sv, strict);
        assert_encoding(Params{}, "a\tb"sv, "\e]66;;a\tb\e\\"sv, strict);

        struct {
                std::string_view text;
                size_t offset;
        } const terminators[] = {
                { "ab\e\\cd"sv, 2 },
                { "\ex"sv, 0 },
                { "bell\a"sv, 4 },
                { "x\x18"sv, 1 },
                { "x\x1a"sv, 1 },
                { "ab\xc2\x9c"sv, 2 },
        };

        for (auto const& item : terminators) {
                try {
                        encode(Params{}, item.text, strict);
                        g_assert_not_reached();
                } catch (PayloadContainsTerminator const& e) {
                        g_assert_cmpuint(e.offset(), ==, item.offset);
                }
        }

        std::string_view const invalid[] = {
                "\xff"sv,
                "ab\xc2"sv,
                "\xc0\x80"sv,
                "\xed\xa0\x80"sv, // surrogate
        };

        for (auto const text : invalid) {
                try {
                        encode(Params{}, text, strict);
                        g_assert_not_reached();
                } catch (PayloadContainsTerminator const&) {
                        g_assert_not_reached();
                } catch (InvalidPayload const&) {
                }
        }

        // Lenient mode passes the payload through verbatim
        assert_encoding(Params{}, "a\eb"sv, "\e]66;;a\eb\e\\"sv);
}

static void
test_sizing_builder(void)
{
        auto str = SequenceBuilder{SeqType::CSI, 'n'}.append_param(6).to_string();
        g_assert_true(str == "\e[6n"sv);

        str = SequenceBuilder{SeqType::CSI, 'R'}.append_param(12).append_param(40).to_string();
        g_assert_true(str == "\e[12;40R"sv);

        str = SequenceBuilder{SeqType::CSI, 'm'}.append_param(-1).append_param(1).to_string();
        g_assert_true(str == "\e[;1m"sv);

        auto builder = SequenceBuilder{SeqType::OSC, TEXT_SIZING_OSC};
        builder.set_string("t"sv);
        g_assert_true(builder.to_string() == "\e]66;;t\e\\"sv);

        builder.append_field('w', 1);
        g_assert_true(builder.to_string(ST::BEL) == "\e]66;w=1;t\a"sv);

        builder.append_field('h', 2);
        g_assert_true(builder.to_string() == "\e]66;w=1:h=2;t\e\\"sv);
}

template<typename F>
static bool
catch_error(F&& func,
            GError** error) noexcept
try
{
        func();
        return true;
}
catch (...)
{
        return glib::set_error_from_exception(error);
}

static void
test_sizing_errors(void)
{
        auto error = glib::Error{};

        g_assert_false(catch_error([] { scaled_text(9, "x"sv); }, error));
        g_assert_true(error.matches(TEXTSIZE_EXCEPTION_ERROR, TEXTSIZE_EXCEPTION_INVALID_PARAMETER));
        g_assert_nonnull(strstr(error.message(), "scale"));
        error.reset();

        auto const strict = EncodeOptions{ST::C0, true};
        g_assert_false(catch_error([&] { encode(Params{}, "a\eb"sv, strict); }, error));
        g_assert_true(error.matches(TEXTSIZE_EXCEPTION_ERROR, TEXTSIZE_EXCEPTION_INVALID_PAYLOAD));
        error.reset();

        g_assert_false(catch_error([&] { encode(Params{}, "\xff"sv, strict); }, error));
        g_assert_true(error.matches(TEXTSIZE_EXCEPTION_ERROR, TEXTSIZE_EXCEPTION_INVALID_PAYLOAD));
        error.reset();

        g_assert_false(catch_error([] { throw std::system_error{EPIPE, std::generic_category(), "write"}; }, error));
        g_assert_true(error.matches(TEXTSIZE_EXCEPTION_ERROR, TEXTSIZE_EXCEPTION_IO));
        error.reset();

        g_assert_false(catch_error([] {
                try {
                        throw std::runtime_error{"inner"};
                } catch (...) {
                        std::throw_with_nested(std::runtime_error{"outer"});
                }
        }, error));
        g_assert_true(error.matches(TEXTSIZE_EXCEPTION_ERROR, TEXTSIZE_EXCEPTION_GENERIC));
        g_assert_cmpstr(error.message(), ==, "outer: inner");
        error.reset();

        g_assert_true(catch_error([] { scaled_text(2, "x"sv); }, error));
        g_assert_false(error.error());
}

int
main(int argc,
     char** argv)
{
        g_test_init(&argc, &argv, nullptr);

        g_test_add_func("/textsize/sizing/default", test_sizing_default);
        g_test_add_func("/textsize/sizing/fields", test_sizing_fields);
        g_test_add_func("/textsize/sizing/inactive-fraction", test_sizing_inactive_fraction);
        g_test_add_func("/textsize/sizing/order", test_sizing_order);
        g_test_add_func("/textsize/sizing/projections", test_sizing_projections);
        g_test_add_func("/textsize/sizing/deterministic", test_sizing_deterministic);
        g_test_add_func("/textsize/sizing/st", test_sizing_st);
        g_test_add_func("/textsize/sizing/strict", test_sizing_strict);
        g_test_add_func("/textsize/sizing/builder", test_sizing_builder);
        g_test_add_func("/textsize/sizing/errors", test_sizing_errors);

        return g_test_run();
}
