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

#include <cerrno>

#include <unistd.h>
#include <fcntl.h>

namespace textsize::libc {

class ErrnoSaver {
public:
        ErrnoSaver() noexcept : m_errsv{errno} { }
        ~ErrnoSaver() noexcept { errno = m_errsv; }

        ErrnoSaver(ErrnoSaver const&) = delete;
        ErrnoSaver(ErrnoSaver&&) = delete;
        ErrnoSaver& operator=(ErrnoSaver const&) = delete;
        ErrnoSaver& operator=(ErrnoSaver&&) = delete;

private:
        int m_errsv;
}; // class ErrnoSaver

class FD {
public:
        explicit constexpr FD(int fd) noexcept : m_fd{fd} { } // adopts the FD
        FD(FD const&) = delete;
        FD(FD&&) = delete;

        ~FD() noexcept { reset(); }

        FD& operator=(FD const&) = delete;
        FD& operator=(FD&&) = delete;

        explicit constexpr operator bool() const noexcept { return m_fd != -1; }

        constexpr int get() const noexcept { return m_fd; }

        void reset()
        {
                if (m_fd != -1) {
                        auto errsv = ErrnoSaver{};
                        close(m_fd);
                        m_fd = -1;
                }
        }

private:
        int m_fd{-1};

}; // class FD

static inline int
fd_open_cloexec(char const* path,
                int flags)
{
        auto r = int{};
        do {
                r = open(path, flags | O_CLOEXEC);
        } while (r == -1 && errno == EINTR);

        return r;
}

} // namespace textsize::libc
