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

#include "tty.hh"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

#include <poll.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <glib.h>

#include "libc-glue.hh"

using namespace std::literals;
using namespace textsize;

class Pipe {
public:
        Pipe()
                : Pipe{make_pipe()}
        {
        }

        auto& read_end() noexcept { return m_read; }
        auto& write_end() noexcept { return m_write; }

        std::string read_all()
        {
                m_write.reset();

                auto str = std::string{};
                char buf[256];
                while (true) {
                        auto const r = read(m_read.get(), buf, sizeof(buf));
                        if (r == -1 && errno == EINTR)
                                continue;
                        g_assert_cmpint(r, >=, 0);
                        if (r == 0)
                                break;
                        str.append(buf, size_t(r));
                }
                return str;
        }

private:
        struct Fds {
                int read;
                int write;
        };

        explicit Pipe(Fds fds) noexcept
                : m_read{fds.read},
                  m_write{fds.write}
        {
        }

        static Fds make_pipe()
        {
                int fds[2];
                g_assert_cmpint(pipe2(fds, O_CLOEXEC), ==, 0);
                return {fds[0], fds[1]};
        }

        libc::FD m_read;
        libc::FD m_write;
}; // class Pipe

static std::string
expected_request()
{
        auto prober = Prober{};
        return prober.request();
}

static void
test_tty_write_all(void)
{
        auto p = Pipe{};
        tty::write_all(p.write_end().get(), "\e]66;s=2;Hello\e\\"sv);
        tty::write_all(p.write_end().get(), ""sv);
        tty::write_all(p.write_end().get(), "\n"sv);
        g_assert_true(p.read_all() == "\e]66;s=2;Hello\e\\\n"sv);
}

static void
test_tty_write_failure(void)
{
        auto p = Pipe{};
        try {
                // Not open for writing
                tty::write_all(p.read_end().get(), "x"sv);
                g_assert_not_reached();
        } catch (std::system_error const& e) {
                g_assert_cmpint(e.code().value(), ==, EBADF);
        }

        auto in = Pipe{};
        try {
                tty::probe(in.read_end().get(), in.read_end().get(), 50);
                g_assert_not_reached();
        } catch (std::system_error const& e) {
                g_assert_cmpint(e.code().value(), ==, EBADF);
        }
}

static void
test_tty_raw_mode(void)
{
        auto p = Pipe{};
        auto raw = tty::RawMode{p.read_end().get()};
        g_assert_false(raw.active());
}

static void
test_tty_probe_supported(void)
{
        auto in = Pipe{};
        auto out = Pipe{};

        tty::write_all(in.write_end().get(), "\e[3;1R\e[3;2R\e[3;4R"sv);

        auto const caps = tty::probe(in.read_end().get(), out.write_end().get(), 5000);
        g_assert_true(caps == (Capabilities{true, true}));
        g_assert_true(out.read_all() == expected_request());
}

static void
test_tty_probe_unsupported(void)
{
        auto in = Pipe{};
        auto out = Pipe{};

        tty::write_all(in.write_end().get(), "\e[3;1R\e[3;1R\e[3;1R"sv);

        auto const caps = tty::probe(in.read_end().get(), out.write_end().get(), 5000);
        g_assert_true(caps == (Capabilities{false, false}));
}

static void
test_tty_probe_timeout(void)
{
        auto in = Pipe{};
        auto out = Pipe{};

        auto const start = g_get_monotonic_time();
        auto const caps = tty::probe(in.read_end().get(), out.write_end().get(), 100);
        auto const elapsed = g_get_monotonic_time() - start;

        g_assert_true(caps == (Capabilities{false, false}));
        g_assert_cmpint(elapsed, >=, 100 * 1000);
        g_assert_true(out.read_all() == expected_request());
}

static void
test_tty_probe_eof(void)
{
        {
                auto in = Pipe{};
                auto out = Pipe{};
                in.write_end().reset();

                auto const start = g_get_monotonic_time();
                auto const caps = tty::probe(in.read_end().get(), out.write_end().get(), 5000);
                auto const elapsed = g_get_monotonic_time() - start;

                g_assert_true(caps == (Capabilities{false, false}));
                g_assert_cmpint(elapsed, <, 5000 * 1000);
        }

        {
                // Only the first probe answered before the channel closed
                auto in = Pipe{};
                auto out = Pipe{};
                tty::write_all(in.write_end().get(), "\e[3;1R\e[3;2R"sv);
                in.write_end().reset();

                auto const caps = tty::probe(in.read_end().get(), out.write_end().get(), 5000);
                g_assert_true(caps == (Capabilities{true, false}));
        }
}

static void
test_tty_raw_mode_discard(void)
{
        auto master = libc::FD{posix_openpt(O_RDWR | O_NOCTTY)};
        if (!master ||
            grantpt(master.get()) == -1 ||
            unlockpt(master.get()) == -1) {
                g_test_skip("No pseudo terminal available");
                return;
        }

        auto const name = ptsname(master.get());
        g_assert_nonnull(name);
        auto pts = libc::FD{libc::fd_open_cloexec(name, O_RDWR | O_NOCTTY)};
        g_assert_true(bool(pts));

        struct termios tio;
        {
                auto raw = tty::RawMode{pts.get()};
                g_assert_true(raw.active());

                g_assert_cmpint(tcgetattr(pts.get(), &tio), ==, 0);
                g_assert_cmpuint(tio.c_lflag & (ICANON | ECHO), ==, 0);

                // A reply that arrives but is never read
                tty::write_all(master.get(), "\e[3;4R\n"sv);
                auto pfd = pollfd{pts.get(), POLLIN, 0};
                g_assert_cmpint(poll(&pfd, 1, 5000), ==, 1);
        }

        g_assert_cmpint(tcgetattr(pts.get(), &tio), ==, 0);
        g_assert_cmpuint(tio.c_lflag & ICANON, ==, ICANON);
        g_assert_cmpuint(tio.c_lflag & ECHO, ==, ECHO);

        // Nothing is left for the shell to read
        auto pfd = pollfd{pts.get(), POLLIN, 0};
        g_assert_cmpint(poll(&pfd, 1, 100), ==, 0);
}

static constinit volatile sig_atomic_t s_hangups = 0;

static void
count_hangup(int signum)
{
        s_hangups = s_hangups + 1;
}

class HangupHandler {
public:
        HangupHandler()
        {
                s_hangups = 0;

                struct sigaction sa{};
                sa.sa_handler = count_hangup;
                sigemptyset(&sa.sa_mask);
                g_assert_cmpint(sigaction(SIGHUP, &sa, &m_saved), ==, 0);
        }

        ~HangupHandler()
        {
                sigaction(SIGHUP, &m_saved, nullptr);
        }

        HangupHandler(HangupHandler const&) = delete;
        HangupHandler(HangupHandler&&) = delete;
        HangupHandler& operator=(HangupHandler const&) = delete;
        HangupHandler& operator=(HangupHandler&&) = delete;

        static bool installed()
        {
                struct sigaction sa;
                g_assert_cmpint(sigaction(SIGHUP, nullptr, &sa), ==, 0);
                return sa.sa_handler == count_hangup;
        }

private:
        struct sigaction m_saved;
}; // class HangupHandler

static void
test_tty_interrupt(void)
{
        auto handler = HangupHandler{};

        auto in = Pipe{};
        auto out = Pipe{};

        auto const pid = fork();
        g_assert_cmpint(pid, !=, -1);
        if (pid == 0) {
                usleep(100 * 1000);
                kill(getppid(), SIGHUP);
                _exit(EXIT_SUCCESS);
        }

        auto const start = g_get_monotonic_time();
        auto const caps = tty::probe(in.read_end().get(), out.write_end().get(), 5000);
        auto const elapsed = g_get_monotonic_time() - start;

        auto status = 0;
        while (waitpid(pid, &status, 0) == -1)
                g_assert_cmpint(errno, ==, EINTR);

        g_assert_true(caps == (Capabilities{false, false}));
        g_assert_cmpint(elapsed, <, 2000 * 1000);

        // Delivered once more to the previous handler, which is back in place
        g_assert_cmpint(s_hangups, ==, 1);
        g_assert_true(HangupHandler::installed());
}

static void
test_tty_interrupt_pending(void)
{
        auto handler = HangupHandler{};

        // A signal already pending when the wait starts
        sigset_t block, saved;
        sigemptyset(&block);
        sigaddset(&block, SIGHUP);
        g_assert_cmpint(pthread_sigmask(SIG_BLOCK, &block, &saved), ==, 0);
        raise(SIGHUP);
        g_assert_cmpint(s_hangups, ==, 0);

        auto in = Pipe{};
        auto out = Pipe{};

        auto const start = g_get_monotonic_time();
        auto const caps = tty::probe(in.read_end().get(), out.write_end().get(), 5000);
        auto const elapsed = g_get_monotonic_time() - start;

        g_assert_true(caps == (Capabilities{false, false}));
        g_assert_cmpint(elapsed, <, 2000 * 1000);
        g_assert_true(HangupHandler::installed());

        // Re-raised, and blocked again like before the call
        g_assert_cmpint(s_hangups, ==, 0);
        g_assert_cmpint(pthread_sigmask(SIG_SETMASK, &saved, nullptr), ==, 0);
        g_assert_cmpint(s_hangups, ==, 1);
}

int
main(int argc,
     char** argv)
{
        g_test_init(&argc, &argv, nullptr);

        g_test_add_func("/textsize/tty/write-all", test_tty_write_all);
        g_test_add_func("/textsize/tty/write-failure", test_tty_write_failure);
        g_test_add_func("/textsize/tty/raw-mode", test_tty_raw_mode);
        g_test_add_func("/textsize/tty/raw-mode/discard", test_tty_raw_mode_discard);
        g_test_add_func("/textsize/tty/probe/supported", test_tty_probe_supported);
        g_test_add_func("/textsize/tty/probe/unsupported", test_tty_probe_unsupported);
        g_test_add_func("/textsize/tty/probe/timeout", test_tty_probe_timeout);
        g_test_add_func("/textsize/tty/probe/eof", test_tty_probe_eof);
        g_test_add_func("/textsize/tty/interrupt", test_tty_interrupt);
        g_test_add_func("/textsize/tty/interrupt-pending", test_tty_interrupt_pending);

        return g_test_run();
}
