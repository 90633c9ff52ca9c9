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

#include "tty.hh"

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <system_error>

#include <poll.h>
#include <pthread.h>
#include <time.h>
#include <unistd.h>

#include <glib.h>

#include "debug.hh"
#include "libc-glue.hh"

namespace textsize::tty {

namespace {

constinit volatile sig_atomic_t s_pending_signal = 0;

void
interrupt_handler(int signum) noexcept
{
        s_pending_signal = signum;
}

/*
 * InterruptGuard:
 *
 * Catches SIGINT, SIGTERM and SIGHUP while probing. The signals stay
 * blocked except while waiting in ppoll(), so one arriving at any
 * other time is delivered as soon as the wait starts. Any caught
 * signal is re-raised on destruction, after the previous handlers
 * and signal mask were reinstated.
 */
class InterruptGuard {
public:
        InterruptGuard() noexcept
        {
                s_pending_signal = 0;

                struct sigaction sa{};
                sa.sa_handler = interrupt_handler;
                sigemptyset(&sa.sa_mask);
                sa.sa_flags = 0; // no SA_RESTART, ppoll() must return EINTR

                sigset_t block;
                sigemptyset(&block);

                for (auto i = 0u; i < G_N_ELEMENTS(k_signals); ++i) {
                        m_installed[i] = false;
                        if (sigaction(k_signals[i], nullptr, &m_saved[i]) == -1 ||
                            m_saved[i].sa_handler == SIG_IGN)
                                continue;

                        if (sigaction(k_signals[i], &sa, nullptr) == 0) {
                                m_installed[i] = true;
                                sigaddset(&block, k_signals[i]);
                        } else {
                                _textsize_debug_print(debug::category::IO,
                                                      "Failed to install handler for signal {}: {}",
                                                      k_signals[i], g_strerror(errno));
                        }
                }

                if (auto const r = pthread_sigmask(SIG_BLOCK, &block, &m_saved_mask); r != 0) {
                        _textsize_debug_print(debug::category::IO,
                                              "Failed to block signals: {}",
                                              g_strerror(r));
                        pthread_sigmask(SIG_SETMASK, nullptr, &m_saved_mask);
                }

                m_wait_mask = m_saved_mask;
                for (auto i = 0u; i < G_N_ELEMENTS(k_signals); ++i) {
                        if (m_installed[i])
                                sigdelset(&m_wait_mask, k_signals[i]);
                }
        }

        ~InterruptGuard() noexcept
        {
                auto errsv = libc::ErrnoSaver{};

                for (auto i = 0u; i < G_N_ELEMENTS(k_signals); ++i) {
                        if (m_installed[i] &&
                            sigaction(k_signals[i], &m_saved[i], nullptr) == -1)
                                _textsize_debug_print(debug::category::IO,
                                                      "Failed to restore handler for signal {}: {}",
                                                      k_signals[i], g_strerror(errno));
                }

                // A signal still pending from while it was blocked goes
                // to the previous handler here.
                if (auto const r = pthread_sigmask(SIG_SETMASK, &m_saved_mask, nullptr); r != 0)
                        _textsize_debug_print(debug::category::IO,
                                              "Failed to restore signal mask: {}",
                                              g_strerror(r));

                if (auto const signum = s_pending_signal; signum != 0) {
                        s_pending_signal = 0;
                        raise(signum);
                }
        }

        InterruptGuard(InterruptGuard const&) = delete;
        InterruptGuard(InterruptGuard&&) = delete;
        InterruptGuard& operator=(InterruptGuard const&) = delete;
        InterruptGuard& operator=(InterruptGuard&&) = delete;

        static bool interrupted() noexcept { return s_pending_signal != 0; }

        // The signal mask to wait with
        auto wait_mask() const noexcept { return &m_wait_mask; }

private:
        static inline constexpr int const k_signals[] = {SIGINT, SIGTERM, SIGHUP};

        struct sigaction m_saved[G_N_ELEMENTS(k_signals)];
        bool m_installed[G_N_ELEMENTS(k_signals)];
        sigset_t m_saved_mask;
        sigset_t m_wait_mask;
}; // class InterruptGuard

} // anon namespace

void
write_all(int fd,
          std::string_view data)
{
        _textsize_debug_print(debug::category::IO,
                              "Writing {}",
                              _textsize_debug_sequence_to_string(data.data(), data.size()));

        while (!data.empty()) {
                auto const r = write(fd, data.data(), data.size());
                if (r == -1) {
                        if (errno == EINTR)
                                continue;

                        if (errno == EAGAIN || errno == EWOULDBLOCK) {
                                auto pfd = pollfd{fd, POLLOUT, 0};
                                if (poll(&pfd, 1, -1) == -1 && errno != EINTR)
                                        throw std::system_error{errno,
                                                                std::generic_category(),
                                                                "Failed to wait for output"};
                                continue;
                        }

                        throw std::system_error{errno,
                                                std::generic_category(),
                                                "Failed to write to terminal"};
                }

                data.remove_prefix(size_t(r));
        }
}

RawMode::RawMode(int fd)
        : m_fd{fd}
{
        if (!isatty(fd))
                return;

        if (tcgetattr(fd, &m_saved) == -1)
                throw std::system_error{errno,
                                        std::generic_category(),
                                        "Failed to get terminal attributes"};

        auto mode = m_saved;
        mode.c_lflag &= ~(ICANON | ECHO);
        mode.c_cc[VMIN] = 0;
        mode.c_cc[VTIME] = 0;

        if (tcsetattr(fd, TCSANOW, &mode) == -1)
                throw std::system_error{errno,
                                        std::generic_category(),
                                        "Failed to set terminal attributes"};

        m_active = true;
}

RawMode::~RawMode() noexcept
{
        if (!m_active)
                return;

        // Also discards replies that arrived too late to be read
        auto errsv = libc::ErrnoSaver{};
        if (tcsetattr(m_fd, TCSAFLUSH, &m_saved) == -1)
                _textsize_debug_print(debug::category::IO,
                                      "Failed to restore terminal attributes: {}",
                                      g_strerror(errno));
}

Capabilities
probe(int in_fd,
      int out_fd,
      int timeout_ms)
{
        // Destroyed in reverse order: the terminal mode is restored
        // before a caught signal is re-raised.
        auto guard = InterruptGuard{};
        auto raw = RawMode{in_fd};

        auto prober = Prober{};
        write_all(out_fd, prober.request());

        auto const deadline = g_get_monotonic_time() + gint64(timeout_ms) * 1000;
        char buf[256];

        while (!prober.done()) {
                if (guard.interrupted()) [[unlikely]] {
                        prober.cancel();
                        break;
                }

                auto const now = g_get_monotonic_time();
                if (now >= deadline) {
                        prober.timeout();
                        break;
                }

                auto const remaining = deadline - now;
                auto const timeout = timespec{time_t(remaining / G_USEC_PER_SEC),
                                              long(remaining % G_USEC_PER_SEC) * 1000};
                auto pfd = pollfd{in_fd, POLLIN, 0};
                auto const r = ppoll(&pfd, 1, &timeout, guard.wait_mask());
                if (r == -1) {
                        if (errno == EINTR)
                                continue;

                        _textsize_debug_print(debug::category::IO,
                                              "Failed to poll for replies: {}",
                                              g_strerror(errno));
                        prober.cancel();
                        break;
                }
                if (r == 0)
                        continue;

                if (!(pfd.revents & POLLIN)) {
                        _textsize_debug_print(debug::category::IO,
                                              "Reply channel closed (revents {:x})",
                                              unsigned(pfd.revents));
                        prober.cancel();
                        break;
                }

                auto const n = read(in_fd, buf, sizeof(buf));
                if (n == -1) {
                        if (errno == EINTR || errno == EAGAIN)
                                continue;

                        _textsize_debug_print(debug::category::IO,
                                              "Failed to read replies: {}",
                                              g_strerror(errno));
                        prober.cancel();
                        break;
                }
                if (n == 0) {
                        prober.cancel();
                        break;
                }

                _textsize_debug_hexdump("Read replies",
                                        reinterpret_cast<uint8_t const*>(buf),
                                        size_t(n));
                prober.feed({buf, size_t(n)});
        }

        return prober.capabilities();
}

} // namespace textsize::tty
