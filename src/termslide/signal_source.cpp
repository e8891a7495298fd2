#include "signal_source.hpp"

#include <charconv>
#include <chrono>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <cstddef>

namespace termslide {

namespace {

// Parses the 1-based page number following a jump key.
[[nodiscard]] std::optional<std::size_t> jump_target(std::string_view text)
{
    while (!text.empty() && text.front() == ' ')
    {
        text.remove_prefix(1);
    }

    std::size_t page = 0;
    const auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), page);

    if (ec != std::errc{} || ptr != text.data() + text.size() || page == 0)
    {
        return std::nullopt;
    }

    return page - 1;
}

} // namespace

void signal_source::pause_for(const std::chrono::milliseconds duration)
{
    std::this_thread::sleep_for(duration);
}

std::optional<std::chrono::seconds> parse_autoplay_delay(
    const std::string_view text) noexcept
{
    std::chrono::seconds::rep seconds = 0;
    const auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), seconds);

    if (ec != std::errc{} || ptr != text.data() + text.size() || seconds <= 0)
    {
        return std::nullopt;
    }

    return std::chrono::seconds{seconds};
}

playback_signal signal_for_key(const char key) noexcept
{
    switch (key)
    {
        case 'q':
        case 'Q': return playback_signal::quit;

        case 'k':
        case 'K':
        case 'h':
        case 'H':
        case 'a':
        case 'A':
        case 'b':
        case 'B':
        case 'p':
        case 'P': return playback_signal::previous;

        case 's':
        case 'S': return playback_signal::first;

        case 'g':
        case 'G': return playback_signal::jump;

        case '?': return playback_signal::help;

        default: return playback_signal::advance;
    }
}

key_signal_source::key_signal_source(std::istream& is) noexcept : _is{is}
{}

playback_request key_signal_source::next()
{
    std::string line;
    if (!std::getline(_is, line))
    {
        return playback_request{._signal = playback_signal::quit};
    }

    // An empty line (just Enter) advances.
    if (line.empty())
    {
        return playback_request{._signal = playback_signal::advance};
    }

    const playback_signal signal = signal_for_key(line.front());

    if (signal == playback_signal::jump)
    {
        return playback_request{._signal = signal,
            ._page = jump_target(std::string_view{line}.substr(1))};
    }

    return playback_request{._signal = signal};
}

timed_signal_source::timed_signal_source(
    const std::chrono::milliseconds interval) noexcept
    : _interval{interval}
{}

playback_request timed_signal_source::next()
{
    pause_for(_interval);
    return playback_request{._signal = playback_signal::advance};
}

} // namespace termslide
