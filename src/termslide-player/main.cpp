#include <termslide/ansi_terminal.hpp>
#include <termslide/compiler.hpp>
#include <termslide/document.hpp>
#include <termslide/player.hpp>
#include <termslide/signal_source.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdlib>

namespace {

[[nodiscard]] bool read_file_in_buffer(
    const std::string& path, std::string& buffer)
{
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs)
    {
        std::cerr << "((TERMSLIDE ERROR)): Failed to open file '" << path
                  << "'\n\n";

        return false;
    }

    const auto size = static_cast<std::streamsize>(ifs.tellg());
    ifs.seekg(0, std::ios::beg);

    buffer.clear();
    buffer.resize(static_cast<std::size_t>(size));

    if (!ifs.read(buffer.data(), size))
    {
        std::cerr << "((TERMSLIDE ERROR)): Failed to read file '" << path
                  << "'\n\n";

        return false;
    }

    return true;
}

[[nodiscard]] std::size_t env_size(const char* name, const std::size_t fallback)
{
    const char* const value = std::getenv(name);
    if (value == nullptr)
    {
        return fallback;
    }

    const long parsed = std::strtol(value, nullptr, 10);
    return parsed > 0 ? static_cast<std::size_t>(parsed) : fallback;
}

void print_usage(const char* argv0)
{
    std::cerr << "usage: " << argv0 << " [-s <seconds>] <file>\n"
              << "\t -s <seconds>\tautoplay, waiting <seconds> between "
                 "pages\n\n"
              << "keys: Enter/space/j/l next, k/h/b/p previous, s first, "
                 "g <n> jump, ? help, q quit\n";
}

} // namespace

int main(int argc, char** argv)
{
    std::ios_base::sync_with_stdio(false);

    std::optional<std::chrono::seconds> autoplay_delay;
    const char* input_path = nullptr;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        if (arg == "-s")
        {
            if (i + 1 == argc)
            {
                std::cerr << "((TERMSLIDE ERROR)): '-s' requires a number of "
                             "seconds\n\n";

                print_usage(argv[0]);
                return 1;
            }

            autoplay_delay = termslide::parse_autoplay_delay(argv[++i]);
            if (!autoplay_delay.has_value())
            {
                std::cerr << "((TERMSLIDE ERROR)): Invalid autoplay delay '"
                          << argv[i] << "'\n\n";

                print_usage(argv[0]);
                return 1;
            }
        }
        else if (arg == "-h" || arg == "--help")
        {
            print_usage(argv[0]);
            return 0;
        }
        else if (input_path == nullptr)
        {
            input_path = argv[i];
        }
        else
        {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (input_path == nullptr)
    {
        print_usage(argv[0]);
        return 1;
    }

    std::string source;
    if (!read_file_in_buffer(input_path, source))
    {
        return 1;
    }

    termslide::document doc;
    termslide::compiler compiler{std::cerr};

    if (compiler.compile(doc, source).has_value())
    {
        return 1;
    }

    // Keys come from the controlling terminal so that stdin stays usable.
    std::ifstream tty{"/dev/tty"};

    std::unique_ptr<termslide::signal_source> signals;
    if (autoplay_delay.has_value())
    {
        signals =
            std::make_unique<termslide::timed_signal_source>(*autoplay_delay);
    }
    else
    {
        signals = std::make_unique<termslide::key_signal_source>(
            tty.is_open() ? static_cast<std::istream&>(tty) : std::cin);
    }

    termslide::ansi_terminal terminal{
        std::cout, env_size("COLUMNS", 80), env_size("LINES", 24)};

    constexpr termslide::player_config cfg{
        ._indent = 3,
        ._top_offset = 5,
        ._show_status = true,
        ._expand_date = true //
    };

    termslide::play(doc, terminal, *signals, cfg);
    return 0;
}
