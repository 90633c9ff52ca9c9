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

#include <string_view>

#include <termios.h>

#include "probe.hh"

namespace textsize::tty {

inline constexpr auto const DEFAULT_PROBE_TIMEOUT_MS = 500;

/*
 * write_all:
 * @fd: a file descriptor
 * @data: the bytes to write
 *
 * Writes all of @data to @fd, waiting if @fd is non-blocking.
 *
 * Throws std::system_error if the write fails.
 */
void write_all(int fd,
               std::string_view data); // throws

/*
 * RawMode:
 *
 * Switches a terminal to non-canonical mode without echo for the
 * lifetime of the object, so that replies can be read as they
 * arrive and do not show up on the screen. Input still unread when
 * the mode is restored is discarded. Does nothing if the descriptor
 * is not a terminal.
 */
class RawMode {
public:
        explicit RawMode(int fd); // throws
        ~RawMode() noexcept;

        RawMode(RawMode const&) = delete;
        RawMode(RawMode&&) = delete;
        RawMode& operator=(RawMode const&) = delete;
        RawMode& operator=(RawMode&&) = delete;

        constexpr auto active() const noexcept { return m_active; }

private:
        int m_fd;
        bool m_active{false};
        struct termios m_saved;
}; // class RawMode

/*
 * probe:
 * @in_fd: the descriptor the terminal's replies are read from
 * @out_fd: the descriptor the queries are written to
 * @timeout_ms: how long to wait for all replies
 *
 * Runs the capability probe. Probes without a reply when the timeout
 * expires, when @in_fd reaches end of file or fails, or when the
 * process is interrupted, resolve as unsupported. On interruption,
 * the terminal mode is restored and the signal is re-raised before
 * returning.
 *
 * Throws std::system_error if writing the queries fails.
 *
 * Returns: the probed capabilities
 */
Capabilities probe(int in_fd,
                   int out_fd,
                   int timeout_ms = DEFAULT_PROBE_TIMEOUT_MS); // throws

} // namespace textsize::tty
