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

#include "params.hh"
#include "params-fmt.hh"

#include <cstring>

#include <glib.h>

#include "errors.hh"

using namespace std::literals;
using namespace textsize;

static void
assert_out_of_range(Params& params,
                    Params& (Params::*setter)(int),
                    int value,
                    char const* field)
{
        auto const saved = params;
        try {
                (params.*setter)(value);
                g_assert_not_reached();
        } catch (ParameterOutOfRange const& e) {
                g_assert_cmpstr(e.field(), ==, field);
                g_assert_cmpint(e.value(), ==, value);
        }

        // Unchanged by the failed set
        g_assert_true(params == saved);
}

static void
test_params_default(void)
{
        auto const params = Params{};
        g_assert_cmpint(params.scale(), ==, 1);
        g_assert_cmpint(params.width(), ==, 0);
        g_assert_cmpint(params.numerator(), ==, 0);
        g_assert_cmpint(params.denominator(), ==, 0);
        g_assert_true(params.vertical_align() == VerticalAlign::TOP);
        g_assert_true(params.horizontal_align() == HorizontalAlign::LEFT);
        g_assert_true(params.is_default());

        g_assert_true(params == Params(1, 0));
        g_assert_true(params == Params(1, 0, 0, 0, VerticalAlign::TOP, HorizontalAlign::LEFT));
}

static void
test_params_range(void)
{
        auto params = Params{};

        for (auto v = Params::SCALE_MIN; v <= Params::SCALE_MAX; ++v) {
                params.set_scale(v);
                g_assert_cmpint(params.scale(), ==, v);
        }
        assert_out_of_range(params, &Params::set_scale, 0, "scale");
        assert_out_of_range(params, &Params::set_scale, 8, "scale");
        assert_out_of_range(params, &Params::set_scale, -1, "scale");

        for (auto v = Params::WIDTH_MIN; v <= Params::WIDTH_MAX; ++v) {
                params.set_width(v);
                g_assert_cmpint(params.width(), ==, v);
        }
        assert_out_of_range(params, &Params::set_width, -1, "width");
        assert_out_of_range(params, &Params::set_width, 8, "width");

        params.set_fraction(15, 15);
        g_assert_cmpint(params.numerator(), ==, 15);
        g_assert_cmpint(params.denominator(), ==, 15);

        try {
                params.set_fraction(16, 2);
                g_assert_not_reached();
        } catch (ParameterOutOfRange const& e) {
                g_assert_cmpstr(e.field(), ==, "numerator");
                g_assert_cmpint(e.value(), ==, 16);
        }

        try {
                params.set_fraction(1, -2);
                g_assert_not_reached();
        } catch (ParameterOutOfRange const& e) {
                g_assert_cmpstr(e.field(), ==, "denominator");
                g_assert_cmpint(e.value(), ==, -2);
        }

        g_assert_cmpint(params.numerator(), ==, 15);
        g_assert_cmpint(params.denominator(), ==, 15);

        try {
                params.set_vertical_align(VerticalAlign(3));
                g_assert_not_reached();
        } catch (ParameterOutOfRange const& e) {
                g_assert_cmpstr(e.field(), ==, "vertical-align");
        }

        try {
                params.set_horizontal_align(HorizontalAlign(7));
                g_assert_not_reached();
        } catch (ParameterOutOfRange const& e) {
                g_assert_cmpstr(e.field(), ==, "horizontal-align");
        }

        try {
                auto p = Params(9, 0);
                g_assert_not_reached();
        } catch (std::out_of_range const& e) {
                g_assert_nonnull(strstr(e.what(), "scale"));
                g_assert_nonnull(strstr(e.what(), "1..7"));
        }

        try {
                auto p = Params(1, 0, 0, 0, VerticalAlign::CENTER, HorizontalAlign::CENTER);
                g_assert_true(p.vertical_align() == VerticalAlign::CENTER);
                g_assert_true(p.horizontal_align() == HorizontalAlign::CENTER);
        } catch (...) {
                g_assert_not_reached();
        }
}

static void
test_params_contributes(void)
{
        auto params = Params{};

        params.set_scale(2);
        g_assert_true(params.has_scale());
        g_assert_false(params.is_default());
        params.set_scale(1);
        g_assert_false(params.has_scale());

        params.set_width(1);
        g_assert_true(params.has_width());
        params.set_width(0);
        g_assert_false(params.has_width());

        params.set_fraction(1, 2);
        g_assert_true(params.has_fraction());
        params.set_fraction(3, 2);
        g_assert_false(params.has_fraction());
        params.set_fraction(2, 2);
        g_assert_false(params.has_fraction());
        params.set_fraction(0, 5);
        g_assert_false(params.has_fraction());
        params.set_fraction(5, 0);
        g_assert_false(params.has_fraction());
        params.set_fraction(14, 15);
        g_assert_true(params.has_fraction());
        params.set_fraction(0, 0);

        params.set_vertical_align(VerticalAlign::BOTTOM);
        g_assert_true(params.has_vertical_align());
        params.set_vertical_align(VerticalAlign::TOP);
        g_assert_false(params.has_vertical_align());

        params.set_horizontal_align(HorizontalAlign::RIGHT);
        g_assert_true(params.has_horizontal_align());
        params.set_horizontal_align(HorizontalAlign::LEFT);
        g_assert_false(params.has_horizontal_align());

        g_assert_true(params.is_default());

        // An inactive fraction leaves the set default
        params.set_fraction(3, 2);
        g_assert_true(params.is_default());
        g_assert_false(params == Params{});
}

static void
test_params_parse_align(void)
{
        g_assert_true(parse_vertical_align("top"sv) == VerticalAlign::TOP);
        g_assert_true(parse_vertical_align("bottom"sv) == VerticalAlign::BOTTOM);
        g_assert_true(parse_vertical_align("center"sv) == VerticalAlign::CENTER);
        g_assert_true(parse_vertical_align("centre"sv) == VerticalAlign::CENTER);
        g_assert_true(parse_vertical_align("0"sv) == VerticalAlign::TOP);
        g_assert_true(parse_vertical_align("1"sv) == VerticalAlign::BOTTOM);
        g_assert_true(parse_vertical_align("2"sv) == VerticalAlign::CENTER);
        g_assert_false(parse_vertical_align("left"sv).has_value());
        g_assert_false(parse_vertical_align("3"sv).has_value());
        g_assert_false(parse_vertical_align(""sv).has_value());
        g_assert_false(parse_vertical_align("Top"sv).has_value());

        g_assert_true(parse_horizontal_align("left"sv) == HorizontalAlign::LEFT);
        g_assert_true(parse_horizontal_align("right"sv) == HorizontalAlign::RIGHT);
        g_assert_true(parse_horizontal_align("center"sv) == HorizontalAlign::CENTER);
        g_assert_true(parse_horizontal_align("1"sv) == HorizontalAlign::RIGHT);
        g_assert_false(parse_horizontal_align("bottom"sv).has_value());
        g_assert_false(parse_horizontal_align("12"sv).has_value());

        g_assert_true(to_string(VerticalAlign::BOTTOM) == "bottom"sv);
        g_assert_true(to_string(HorizontalAlign::CENTER) == "center"sv);
}

static void
test_params_format(void)
{
        auto str = fmt::format("{}", Params{});
        g_assert_cmpstr(str.c_str(), ==, "{s=1 w=0 n=0 d=0 v=top h=left}");

        auto const params = Params(2, 3, 1, 2, VerticalAlign::BOTTOM, HorizontalAlign::CENTER);
        str = fmt::format("{}", params);
        g_assert_cmpstr(str.c_str(), ==, "{s=2 w=3 n=1 d=2 v=bottom h=center}");

        str = fmt::format("{:c}", params);
        g_assert_cmpstr(str.c_str(), ==, "{s=2 w=3 n=1 d=2 v=bottom h=center}");

        str = fmt::format("{:c}", Params{}.set_scale(2).set_horizontal_align(HorizontalAlign::CENTER));
        g_assert_cmpstr(str.c_str(), ==, "{s=2 h=center}");

        str = fmt::format("{:c}", Params{}.set_fraction(3, 2));
        g_assert_cmpstr(str.c_str(), ==, "{}");

        str = fmt::format("{:>8}", VerticalAlign::CENTER);
        g_assert_cmpstr(str.c_str(), ==, "  center");
}

int
main(int argc,
     char** argv)
{
        g_test_init(&argc, &argv, nullptr);

        g_test_add_func("/textsize/params/default", test_params_default);
        g_test_add_func("/textsize/params/range", test_params_range);
        g_test_add_func("/textsize/params/contributes", test_params_contributes);
        g_test_add_func("/textsize/params/parse-align", test_params_parse_align);
        g_test_add_func("/textsize/params/format", test_params_format);

        return g_test_run();
}
