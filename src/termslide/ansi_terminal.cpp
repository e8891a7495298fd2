#include "ansi_terminal.hpp"

#include "document.hpp"

#include <ostream>
#include <string>
#include <string_view>

#include <cstddef>

namespace termslide {

namespace ansi {

using namespace std::string_view_literals;

// SGR (Select Graphic Rendition) codes
enum sgr : int
{
    reset = 0,
    bold = 1,
    underline = 4,
    reversed = 7,
    fg_default = 39
};

constexpr int fg_base = 30;
constexpr int bg_base = 40;

constexpr std::string_view esc_start = "\x1b["sv;
constexpr char esc_end = 'm';
constexpr char sep = ';';

constexpr std::string_view clear_screen = "\x1b[2J\x1b[H"sv;
constexpr std::string_view hide_cursor = "\x1b[?25l"sv;
constexpr std::string_view show_cursor = "\x1b[?25h"sv;

// Offset from `fg_base`/`bg_base`; the default color maps to offset 9.
[[nodiscard]] int color_offset(const named_color c) noexcept
{
    switch (c)
    {
        case named_color::black: return 0;
        case named_color::red: return 1;
        case named_color::green: return 2;
        case named_color::yellow: return 3;
        case named_color::blue: return 4;
        case named_color::magenta: return 5;
        case named_color::cyan: return 6;
        case named_color::white: return 7;
        case named_color::terminal_default: return fg_default - fg_base;
    }

    return fg_default - fg_base;
}

} // namespace ansi

std::string sgr_sequence(const style_set& style)
{
    std::string result{ansi::esc_start};
    result += std::to_string(ansi::reset);

    const auto append_sgr = [&result](const int code)
    {
        result += ansi::sep;
        result += std::to_string(code);
    };

    if (style._bold)
    {
        append_sgr(ansi::bold);
    }

    if (style._underline)
    {
        append_sgr(ansi::underline);
    }

    if (style._reverse)
    {
        append_sgr(ansi::reversed);
    }

    if (style._color.has_value())
    {
        append_sgr(ansi::fg_base + ansi::color_offset(*style._color));
    }

    if (style._background.has_value())
    {
        append_sgr(ansi::bg_base + ansi::color_offset(*style._background));
    }

    result += ansi::esc_end;
    return result;
}

ansi_terminal::ansi_terminal(
    std::ostream& os, const std::size_t width, const std::size_t height)
    : _os{os}, _width{width}, _height{height}
{
    _os << ansi::hide_cursor;
}

ansi_terminal::~ansi_terminal()
{
    _os << sgr_sequence(style_set{}) << ansi::show_cursor;
    _os.flush();
}

std::size_t ansi_terminal::width() const noexcept
{
    return _width;
}

std::size_t ansi_terminal::height() const noexcept
{
    return _height;
}

void ansi_terminal::clear()
{
    _os << ansi::clear_screen;
}

void ansi_terminal::move_to(const std::size_t row, const std::size_t col)
{
    _os << ansi::esc_start << (row + 1) << ansi::sep << (col + 1) << 'H';
}

void ansi_terminal::write(const std::string_view text)
{
    _os << text;
}

void ansi_terminal::set_style(const style_set& style)
{
    _os << sgr_sequence(style);
}

void ansi_terminal::reset_style()
{
    _os << sgr_sequence(style_set{});
}

void ansi_terminal::flush()
{
    _os.flush();
}

} // namespace termslide
