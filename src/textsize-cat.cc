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

#include <cerrno>
#include <clocale>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

#include <glib.h>
#include <fmt/format.h>

#include "debug.hh"
#include "glib-glue.hh"
#include "libc-glue.hh"
#include "params.hh"
#include "params-fmt.hh"
#include "sizing.hh"
#include "std-glue.hh"
#include "tty.hh"

using namespace std::literals;

class Options {
private:
        bool m_bel{false};
        bool m_c1{false};
        bool m_escaped{false};
        bool m_probe{false};
        bool m_strict{false};
        int m_scale{1};
        int m_width{0};
        int m_numerator{0};
        int m_denominator{0};
        int m_timeout{textsize::tty::DEFAULT_PROBE_TIMEOUT_MS};
        textsize::glib::StringPtr m_valign{};
        textsize::glib::StringPtr m_halign{};
        textsize::glib::StrvPtr m_texts{};

public:

        Options() noexcept = default;
        Options(Options const&) = delete;
        Options(Options&&) = delete;

        ~Options() = default;

        inline constexpr bool bel()         const noexcept { return m_bel;         }
        inline constexpr bool c1()          const noexcept { return m_c1;          }
        inline constexpr bool escaped()     const noexcept { return m_escaped;     }
        inline constexpr bool probe()       const noexcept { return m_probe;       }
        inline constexpr bool strict()      const noexcept { return m_strict;      }
        inline constexpr int  scale()       const noexcept { return m_scale;       }
        inline constexpr int  width()       const noexcept { return m_width;       }
        inline constexpr int  numerator()   const noexcept { return m_numerator;   }
        inline constexpr int  denominator() const noexcept { return m_denominator; }
        inline constexpr int  timeout()     const noexcept { return m_timeout;     }
        inline char const* valign() const noexcept { return m_valign.get(); }
        inline char const* halign() const noexcept { return m_halign.get(); }
        inline char const* const* texts() const noexcept { return m_texts.get(); }

        bool parse(int argc,
                   char* argv[],
                   GError** error) noexcept
        {
                using BoolOption = textsize::ValueGetter<bool, gboolean>;
                using IntOption = textsize::ValueGetter<int, int>;
                using StringOption = textsize::ValueGetter<textsize::glib::StringPtr, char*, nullptr>;
                using StrvOption = textsize::ValueGetter<textsize::glib::StrvPtr, char**, nullptr>;

                auto bel = BoolOption{m_bel, false};
                auto c1 = BoolOption{m_c1, false};
                auto escaped = BoolOption{m_escaped, false};
                auto probe = BoolOption{m_probe, false};
                auto strict = BoolOption{m_strict, false};
                auto scale = IntOption{m_scale, 1};
                auto width = IntOption{m_width, 0};
                auto numerator = IntOption{m_numerator, 0};
                auto denominator = IntOption{m_denominator, 0};
                auto timeout = IntOption{m_timeout, textsize::tty::DEFAULT_PROBE_TIMEOUT_MS};
                auto valign = StringOption{m_valign, nullptr};
                auto halign = StringOption{m_halign, nullptr};
                auto texts = StrvOption{m_texts, nullptr};

                GOptionEntry const entries[] = {
                        { "bel", 0, 0, G_OPTION_ARG_NONE, &bel,
                          "Terminate sequences with BEL", nullptr },
                        { "c1", 0, 0, G_OPTION_ARG_NONE, &c1,
                          "Terminate sequences with the C1 string terminator", nullptr },
                        { "denominator", 'd', 0, G_OPTION_ARG_INT, &denominator,
                          "Fractional scale denominator (0..15)", "D" },
                        { "escaped", 'e', 0, G_OPTION_ARG_NONE, &escaped,
                          "Output sequences in readable form", nullptr },
                        { "halign", 'H', 0, G_OPTION_ARG_STRING, &halign,
                          "Horizontal alignment (left, right, center)", "ALIGN" },
                        { "numerator", 'n', 0, G_OPTION_ARG_INT, &numerator,
                          "Fractional scale numerator (0..15)", "N" },
                        { "probe", 'p', 0, G_OPTION_ARG_NONE, &probe,
                          "Probe the terminal for text sizing support", nullptr },
                        { "scale", 's', 0, G_OPTION_ARG_INT, &scale,
                          "Scale factor (1..7)", "SCALE" },
                        { "strict", 0, 0, G_OPTION_ARG_NONE, &strict,
                          "Reject text that would end the sequence early", nullptr },
                        { "timeout", 't', 0, G_OPTION_ARG_INT, &timeout,
                          "Probe timeout in milliseconds", "MS" },
                        { "valign", 'v', 0, G_OPTION_ARG_STRING, &valign,
                          "Vertical alignment (top, bottom, center)", "ALIGN" },
                        { "width", 'w', 0, G_OPTION_ARG_INT, &width,
                          "Width in cells (0..7)", "WIDTH" },
                        { G_OPTION_REMAINING, 0, 0, G_OPTION_ARG_STRING_ARRAY, &texts,
                          nullptr, nullptr },
                        { nullptr },
                };

                auto context = textsize::take_freeable(g_option_context_new("[TEXT…] — text sizing cat"));
                g_option_context_set_help_enabled(context.get(), true);
                g_option_context_add_main_entries(context.get(), entries, nullptr);

                return g_option_context_parse(context.get(), &argc, &argv, error);
        }
}; // class Options

static auto
make_params(Options const& options) /* throws */
{
        auto params = textsize::Params{};
        params.set_scale(options.scale())
                .set_width(options.width())
                .set_fraction(options.numerator(), options.denominator());

        if (auto const str = options.valign()) {
                auto const align = textsize::parse_vertical_align(str);
                if (!align)
                        throw std::invalid_argument{fmt::format("Invalid vertical alignment \"{}\"", str)};

                params.set_vertical_align(*align);
        }

        if (auto const str = options.halign()) {
                auto const align = textsize::parse_horizontal_align(str);
                if (!align)
                        throw std::invalid_argument{fmt::format("Invalid horizontal alignment \"{}\"", str)};

                params.set_horizontal_align(*align);
        }

        return params;
}

class Encoder {
public:
        Encoder(Options const& options,
                textsize::Params const& params) noexcept
                : m_params{params},
                  m_options{terminator(options), options.strict()},
                  m_escaped{options.escaped()}
        {
        }

        Encoder(Encoder const&) = delete;
        Encoder(Encoder&&) = delete;
        Encoder& operator=(Encoder const&) = delete;
        Encoder& operator=(Encoder&&) = delete;

        void encode(std::string_view text) /* throws */
        {
                m_buffer.clear();
                textsize::encode_to(m_buffer, m_params, text, m_options);

                if (m_escaped) {
                        auto const escaped = _textsize_debug_sequence_to_string(m_buffer.data(),
                                                                                m_buffer.size());
                        m_buffer.assign(escaped);
                }

                m_buffer.push_back('\n');
                textsize::tty::write_all(STDOUT_FILENO, m_buffer);
        }

private:
        static constexpr auto terminator(Options const& options) noexcept
        {
                if (options.c1())
                        return textsize::ST::C1;
                if (options.bel())
                        return textsize::ST::BEL;
                return textsize::ST::C0;
        }

        textsize::Params m_params;
        textsize::EncodeOptions m_options;
        bool m_escaped;
        std::string m_buffer{};
}; // class Encoder

static bool
encode(Options const& options,
       GError** error) noexcept
try
{
        auto const params = make_params(options);
        _textsize_debug_print(textsize::debug::category::ENCODER,
                              "Encoding with {:c}", params);

        auto encoder = Encoder{options, params};
        if (auto const texts = options.texts()) {
                for (auto i = 0u; texts[i]; ++i)
                        encoder.encode(texts[i]);
        } else {
                auto line = std::string{};
                while (std::getline(std::cin, line))
                        encoder.encode(line);

                if (std::cin.bad())
                        throw std::system_error{EIO,
                                                std::generic_category(),
                                                "Failed to read from standard input"};
        }

        return true;
}
catch (...)
{
        return textsize::glib::set_error_from_exception(error);
}

static bool
probe(Options const& options,
      GError** error) noexcept
try
{
        auto const timeout = textsize::clamp(options.timeout(), 1, 60000);

        auto fd = textsize::libc::FD{textsize::libc::fd_open_cloexec("/dev/tty", O_RDWR | O_NOCTTY)};
        auto const in_fd = fd ? fd.get() : STDIN_FILENO;
        auto const out_fd = fd ? fd.get() : STDOUT_FILENO;
        if (!fd)
                _textsize_debug_print(textsize::debug::category::IO,
                                      "No controlling terminal: {}",
                                      g_strerror(errno));

        auto const caps = textsize::tty::probe(in_fd, out_fd, timeout);

        auto const output = fmt::format("explicit-width: {}\nscaled-text: {}\n",
                                        caps.explicit_width ? "yes"sv : "no"sv,
                                        caps.scaled_text ? "yes"sv : "no"sv);
        textsize::tty::write_all(STDOUT_FILENO, output);

        return true;
}
catch (...)
{
        return textsize::glib::set_error_from_exception(error);
}

int
main(int argc,
     char *argv[])
{
        setlocale(LC_ALL, "");
        _textsize_debug_init();

        // Report write errors instead of dying on a closed pipe.
        signal(SIGPIPE, SIG_IGN);

        Options options{};
        auto error = textsize::glib::Error{};
        if (!options.parse(argc, argv, error)) {
                fmt::print(stderr,
                           "Failed to parse arguments: {}\n",
                           error.message());
                return EXIT_FAILURE;
        }

        auto const rv = options.probe() ? probe(options, error) : encode(options, error);
        if (!rv) {
                fmt::print(stderr, "{}\n", error.message());
                return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;
}
