#pragma once

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string_view>

#include <cstddef>

namespace termslide {

enum class playback_signal
{
    advance,
    previous,
    first,
    jump,
    help,
    quit
};

struct playback_request
{
    playback_signal _signal;

    // 0-based target page of a `jump`; empty when none was given.
    std::optional<std::size_t> _page;

    [[nodiscard]] bool operator==(const playback_request&) const = default;
};

class signal_source
{
public:
    virtual ~signal_source() = default;

    // Blocks until the next request is available.
    [[nodiscard]] virtual playback_request next() = 0;

    // Blocks for `duration`. Used by timed delays inside a page.
    virtual void pause_for(const std::chrono::milliseconds duration);
};

// Reads one key per line. End of input is a quit request. A jump is
// written as `g <page>` with a 1-based page number.
class key_signal_source final : public signal_source
{
private:
    std::istream& _is;

public:
    [[nodiscard]] explicit key_signal_source(std::istream& is) noexcept;

    [[nodiscard]] playback_request next() override;
};

[[nodiscard]] playback_signal signal_for_key(const char key) noexcept;

// Parses a whole, positive number of seconds.
[[nodiscard]] std::optional<std::chrono::seconds> parse_autoplay_delay(
    const std::string_view text) noexcept;

// Advances after a fixed delay.
class timed_signal_source final : public signal_source
{
private:
    std::chrono::milliseconds _interval;

public:
    [[nodiscard]] explicit timed_signal_source(
        const std::chrono::milliseconds interval) noexcept;

    [[nodiscard]] playback_request next() override;
};

} // namespace termslide
