#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace termslide {

enum class named_color
{
    white,
    yellow,
    red,
    green,
    blue,
    cyan,
    magenta,
    black,
    terminal_default
};

[[nodiscard]] std::optional<named_color> color_from_name(
    const std::string_view name) noexcept;

[[nodiscard]] std::string_view color_name(const named_color c) noexcept;

struct style_set
{
    bool _bold = false;
    bool _underline = false;
    bool _reverse = false;
    std::optional<named_color> _color;
    std::optional<named_color> _background;

    [[nodiscard]] bool is_default() const noexcept
    {
        return !_bold && !_underline && !_reverse && !_color.has_value() &&
               !_background.has_value();
    }

    [[nodiscard]] bool operator==(const style_set&) const = default;
};

struct styled_run
{
    std::string _text;
    style_set _style;

    [[nodiscard]] bool operator==(const styled_run&) const = default;
};

enum class alignment
{
    left,
    center,
    right
};

namespace block {

struct heading
{
    std::string _text;
};

struct paragraph
{
    std::vector<styled_run> _runs;
    alignment _alignment = alignment::left;
};

struct verbatim
{
    std::vector<std::string> _lines;
};

struct rule
{};

struct pause
{};

// Frame around the whole screen.
struct border
{};

// Timed delay before the rest of the page is drawn.
struct sleep
{
    std::chrono::seconds _duration;
};

} // namespace block

using block_variant = std::variant<block::heading, block::paragraph,
    block::verbatim, block::rule, block::pause, block::border, block::sleep>;

struct page
{
    std::string _title;
    std::vector<block_variant> _blocks;
};

struct document
{
    std::optional<std::string> _title;
    std::optional<std::string> _author;
    std::optional<std::string> _date;
    std::optional<std::string> _header;
    std::optional<std::string> _footer;

    // Screen colors for the whole presentation.
    std::optional<named_color> _foreground;
    std::optional<named_color> _background;

    std::vector<page> _pages;
};

} // namespace termslide
