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

#include "glib-glue.hh"

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "debug.hh"
#include "errors.hh"

namespace textsize {

using namespace std::literals;

static void
exception_append_to_string(std::exception const& e,
                           std::string& what,
                           int level = 0)
{
        if (level > 0)
                what += ": "sv;
        what += e.what();

        try {
                std::rethrow_if_nested(e);
        } catch (std::bad_alloc const& en) {
                g_error("Allocation failure: %s\n", what.c_str());
        } catch (std::exception const& en) {
                exception_append_to_string(en, what, level + 1);
        } catch (...) {
                what += ": Unknown nested exception"sv;
        }
}

namespace glib {

GQuark
exception_error_quark() noexcept
{
        return g_quark_from_static_string("textsize-exception-error-quark");
}

bool set_error_from_exception(GError** error
#if TEXTSIZE_DEBUG
                              , char const* func
                              , char const* filename
                              , int const line
#endif
                              ) noexcept
try
{
        auto what = std::string{};
        auto code = int{TEXTSIZE_EXCEPTION_GENERIC};

        try {
                throw; // rethrow current exception
        } catch (std::bad_alloc const& e) {
                g_error("Allocation failure: %s\n", e.what());
        } catch (textsize::ParameterOutOfRange const& e) {
                code = TEXTSIZE_EXCEPTION_INVALID_PARAMETER;
                exception_append_to_string(e, what);
        } catch (textsize::InvalidPayload const& e) {
                code = TEXTSIZE_EXCEPTION_INVALID_PAYLOAD;
                exception_append_to_string(e, what);
        } catch (std::system_error const& e) {
                code = TEXTSIZE_EXCEPTION_IO;
                exception_append_to_string(e, what);
        } catch (std::exception const& e) {
                exception_append_to_string(e, what);
        } catch (...) {
                what = "Unknown exception"sv;
        }

#if TEXTSIZE_DEBUG
        _textsize_debug_print(textsize::debug::category::EXCEPTIONS,
                              "Caught exception in {} [{}:{}]: {}",
                              func, filename, line, what);
#endif

        auto msg_str = textsize::glib::take_string(g_utf8_make_valid(what.c_str(), what.size()));
        g_set_error_literal(error,
                            TEXTSIZE_EXCEPTION_ERROR,
                            code,
                            msg_str.get());
        return false;
}
catch (...)
{
        g_set_error_literal(error,
                            TEXTSIZE_EXCEPTION_ERROR,
                            TEXTSIZE_EXCEPTION_GENERIC,
                            "Unknown exception");
        return false;
}

} // namespace glib

} // namespace textsize
