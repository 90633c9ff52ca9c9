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

#include <memory>

#include <glib.h>

#include "cxx-utils.hh"
#include "std-glue.hh"

namespace textsize::glib {

template<typename T>
using FreePtr = textsize::FreeablePtr<T, decltype(&g_free), &g_free>;

using StringPtr = FreePtr<char>;

inline StringPtr
take_string(char* str)
{
        return StringPtr{str};
}

using StrvPtr = textsize::FreeablePtr<char*, decltype(&g_strfreev), &g_strfreev>;

class Error {
public:
        Error() noexcept = default;
        ~Error() noexcept { reset(); }

        Error(Error const&) = delete;
        Error(Error&&) = delete;
        Error& operator=(Error const&) = delete;
        Error& operator=(Error&&) = delete;

        operator GError** () noexcept { return &m_error; }

        auto error()   const noexcept { return m_error != nullptr; }
        auto code()    const noexcept { return error() ? m_error->code : -1; }
        auto message() const noexcept { return error() ? m_error->message : nullptr; }

        bool matches(GQuark domain, int code) const noexcept
        {
                return error() && g_error_matches(m_error, domain, code);
        }

        void reset() noexcept { g_clear_error(&m_error); }

private:
        GError* m_error{nullptr};
};

/*
 * set_error_from_exception:
 * @error: a #GError location
 *
 * Must be called from a catch block. Converts the exception currently
 * being handled, including any nested exceptions, into a #GError in
 * the TEXTSIZE_EXCEPTION_ERROR domain.
 *
 * Returns: %false
 */
bool set_error_from_exception(GError** error
#if TEXTSIZE_DEBUG
                              , char const* func = __builtin_FUNCTION()
                              , char const* filename = __builtin_FILE()
                              , int const line = __builtin_LINE()
#endif
                              ) noexcept;

} // namespace textsize::glib

#define TEXTSIZE_EXCEPTION_ERROR (textsize::glib::exception_error_quark())

typedef enum {
        TEXTSIZE_EXCEPTION_GENERIC,
        TEXTSIZE_EXCEPTION_INVALID_PARAMETER,
        TEXTSIZE_EXCEPTION_INVALID_PAYLOAD,
        TEXTSIZE_EXCEPTION_IO,
} TextsizeException;

namespace textsize::glib {

GQuark exception_error_quark() noexcept;

} // namespace textsize::glib

namespace textsize {

TEXTSIZE_DECLARE_FREEABLE(GOptionContext, g_option_context_free);

} // namespace textsize
