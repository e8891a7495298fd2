#include "player.hpp"

#include "document.hpp"
#include "signal_source.hpp"
#include "terminal.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <cassert>
#include <cstddef>
#include <ctime>

namespace termslide {

namespace {

using namespace std::string_view_literals;

constexpr std::string_view today_sentinel = "today"sv;
constexpr std::string_view default_date_format = "%b %d %Y"sv;

constexpr style_set bold_style{._bold = true};

constexpr std::array<std::string_view, 10> help_lines{
    "termslide help"sv,
    ""sv,
    "enter, space, j, l ........ next entry or page"sv,
    "b, k, h, a, p ............. previous page"sv,
    "s ......................... first page"sv,
    "g <n> ..................... jump to page n"sv,
    "q ......................... quit"sv,
    "? ......................... this help screen"sv,
    ""sv,
    "Each key is followed by enter."sv //
};

constexpr std::string_view help_footer = "Press any key to return to slide"sv;

[[nodiscard]] bool is_continuation_byte(const char c) noexcept
{
    return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
}

// Length in bytes of the code point starting at `idx`.
[[nodiscard]] std::size_t glyph_length(
    const std::string_view text, const std::size_t idx) noexcept
{
    std::size_t end = idx + 1;
    while (end < text.size() && is_continuation_byte(text[end]))
    {
        ++end;
    }

    return end - idx;
}

[[nodiscard]] std::size_t display_width(const std::string_view text) noexcept
{
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(),
        [](const char c) { return !is_continuation_byte(c); }));
}

// Drops whole code points from the end until `text` fits in `width`.
void truncate_to_width(std::string& text, const std::size_t width)
{
    std::size_t columns = 0;
    for (std::size_t i = 0; i < text.size(); i += glyph_length(text, i))
    {
        if (columns == width)
        {
            text.resize(i);
            return;
        }

        ++columns;
    }
}

} // namespace

std::string expand_date(const std::string_view value, const std::time_t now)
{
    std::string format;

    if (value == today_sentinel)
    {
        format = default_date_format;
    }
    else if (value.starts_with(today_sentinel) &&
             value.size() > today_sentinel.size() + 1 &&
             value[today_sentinel.size()] == ' ')
    {
        format = value.substr(today_sentinel.size() + 1);
    }
    else
    {
        return std::string{value};
    }

    const std::tm* const local = std::localtime(&now);
    if (local == nullptr)
    {
        return std::string{value};
    }

    std::array<char, 256> buffer{};
    const std::size_t n =
        std::strftime(buffer.data(), buffer.size(), format.c_str(), local);

    return std::string{buffer.data(), n};
}

// ----------------------------------------------------------------------------

player::player(terminal& term, signal_source& signals,
    const player_config& cfg) noexcept
    : _terminal{term},
      _signals{signals},
      _cfg{cfg},
      _document{nullptr},
      _state{state::finished},
      _page_idx{0},
      _block_idx{0},
      _row{0},
      _replaying{false}
{}

const page& player::current_page_ref() const noexcept
{
    assert(_document != nullptr);
    assert(_page_idx < _document->_pages.size());

    return _document->_pages[_page_idx];
}

std::size_t player::text_width() const noexcept
{
    const std::size_t margins = 2 * _cfg._indent;
    return _terminal.width() > margins ? _terminal.width() - margins : 1;
}

std::size_t player::column_for(
    const std::size_t length, const alignment align) const noexcept
{
    const std::size_t width = _terminal.width();

    switch (align)
    {
        case alignment::left: return _cfg._indent;

        case alignment::center:
            return length < width ? (width - length) / 2 : 0;

        case alignment::right:
            if (length + _cfg._indent < width)
            {
                return std::max(width - _cfg._indent - length, _cfg._indent);
            }

            return _cfg._indent;
    }

    return _cfg._indent;
}

//
// Screen colors
// ----------------------------------------------------------------------------

style_set player::base_style() const noexcept
{
    assert(_document != nullptr);

    return style_set{._color = _document->_foreground,
        ._background = _document->_background};
}

style_set player::on_base(const style_set& style) const noexcept
{
    assert(_document != nullptr);

    style_set result = style;

    if (!result._color.has_value())
    {
        result._color = _document->_foreground;
    }

    if (!result._background.has_value())
    {
        result._background = _document->_background;
    }

    return result;
}

void player::apply_style(const style_set& style)
{
    _terminal.set_style(on_base(style));
}

void player::restore_base_style()
{
    if (const style_set base = base_style(); !base.is_default())
    {
        _terminal.set_style(base);
        return;
    }

    _terminal.reset_style();
}

// ----------------------------------------------------------------------------

void player::write_centered(const std::string_view text,
    const style_set& style, const std::size_t row)
{
    _terminal.move_to(row, column_for(display_width(text), alignment::center));
    apply_style(style);
    _terminal.write(text);
    restore_base_style();
}

void player::render_title()
{
    assert(_document != nullptr);

    if (_document->_title.has_value())
    {
        write_centered(*_document->_title, bold_style, _row);
        _row += 2;
    }

    if (_document->_author.has_value())
    {
        write_centered(*_document->_author, style_set{}, _row);
        _row += 2;
    }

    if (_document->_date.has_value())
    {
        const std::string date = _cfg._expand_date
                                     ? expand_date(*_document->_date,
                                           std::time(nullptr))
                                     : *_document->_date;

        write_centered(date, style_set{}, _row);
        _row += 2;
    }
}

void player::render_cells(const std::vector<cell>& cells, const alignment align)
{
    _terminal.move_to(_row, column_for(cells.size(), align));

    std::size_t i = 0;
    while (i < cells.size())
    {
        // One segment per run: the attributes are set from scratch each time.
        const style_set* const style = cells[i]._style;

        std::string segment;
        while (i < cells.size() && cells[i]._style == style)
        {
            segment.append(cells[i]._glyph);
            ++i;
        }

        apply_style(*style);
        _terminal.write(segment);
    }

    ++_row;
}

void player::render_runs(
    const std::span<const styled_run> runs, const alignment align)
{
    const std::size_t width = text_width();

    const auto wrap_line = [&](const std::vector<cell>& cells)
    {
        if (cells.empty())
        {
            ++_row;
            return;
        }

        std::size_t idx = 0;
        while (idx < cells.size())
        {
            if (cells.size() - idx <= width)
            {
                render_cells({cells.begin() + idx, cells.end()}, align);
                break;
            }

            // Break at the last space that fits, or hard-cut the word.
            std::size_t break_idx = idx + width - 1;
            while (break_idx > idx && cells[break_idx]._glyph != " "sv)
            {
                --break_idx;
            }

            if (break_idx == idx)
            {
                render_cells(
                    {cells.begin() + idx, cells.begin() + idx + width}, align);

                idx += width;
            }
            else
            {
                render_cells(
                    {cells.begin() + idx, cells.begin() + break_idx}, align);

                idx = break_idx + 1;
            }
        }
    };

    std::vector<cell> line;
    for (const styled_run& run : runs)
    {
        const std::string_view text = run._text;

        for (std::size_t i = 0; i < text.size();)
        {
            if (text[i] == '\n')
            {
                wrap_line(line);
                line.clear();
                ++i;
                continue;
            }

            const std::size_t length = glyph_length(text, i);
            line.push_back(
                cell{._glyph = text.substr(i, length), ._style = &run._style});

            i += length;
        }
    }

    if (!line.empty())
    {
        wrap_line(line);
    }

    restore_base_style();
}

void player::render_verbatim(const std::vector<std::string>& lines)
{
    const std::size_t inner =
        text_width() > 4 ? text_width() - 4 /* "| " and " |" */ : 0;

    restore_base_style();

    _terminal.move_to(_row++, _cfg._indent);
    _terminal.write("." + std::string(inner + 2, '-') + ".");

    for (const std::string& line : lines)
    {
        // Lines wider than the frame are written in full.
        std::string framed = "| " + line;
        if (const std::size_t width = display_width(line); width < inner)
        {
            framed.append(inner - width, ' ');
        }
        framed.append(" |");

        _terminal.move_to(_row++, _cfg._indent);
        _terminal.write(framed);
    }

    _terminal.move_to(_row++, _cfg._indent);
    _terminal.write("`" + std::string(inner + 2, '-') + "'");
}

void player::render_rule()
{
    _terminal.move_to(_row++, 0);
    apply_style(bold_style);
    _terminal.write(std::string(_terminal.width(), '-'));
    restore_base_style();
}

void player::render_border()
{
    const std::size_t width = _terminal.width();
    const std::size_t height = _terminal.height();

    if (width < 2 || height < 3)
    {
        return;
    }

    const std::string edge(width - 2, '-');

    restore_base_style();

    _terminal.move_to(0, 0);
    _terminal.write("." + edge + ".");

    for (std::size_t row = 1; row + 2 < height; ++row)
    {
        _terminal.move_to(row, 0);
        _terminal.write("|");
        _terminal.move_to(row, width - 1);
        _terminal.write("|");
    }

    _terminal.move_to(height - 2, 0);
    _terminal.write("`" + edge + "'");
}

void player::render_help()
{
    restore_base_style();
    _terminal.clear();

    std::size_t row = _cfg._top_offset;
    for (const std::string_view line : help_lines)
    {
        _terminal.move_to(row++, _cfg._indent);
        _terminal.write(line);
    }

    if (_terminal.height() >= 2)
    {
        _terminal.move_to(_terminal.height() - 2, _cfg._indent);
        _terminal.write(help_footer);
    }

    _terminal.flush();
}

void player::begin_page(const std::size_t page_idx)
{
    assert(_document != nullptr);
    assert(page_idx < _document->_pages.size());

    _page_idx = page_idx;
    _block_idx = 0;
    _row = _cfg._top_offset;

    // The screen is cleared with the base colors so that a background color
    // fills it.
    restore_base_style();
    _terminal.clear();

    if (_page_idx == 0)
    {
        render_title();
    }
}

bool player::render_until_pause()
{
    const std::vector<block_variant>& blocks = current_page_ref()._blocks;

    while (_block_idx < blocks.size())
    {
        const block_variant& blk = blocks[_block_idx++];

        if (std::holds_alternative<block::pause>(blk))
        {
            return _block_idx == blocks.size();
        }

        std::visit(
            [&](const auto& b)
            {
                using type = std::decay_t<decltype(b)>;

                if constexpr (std::is_same_v<type, block::heading>)
                {
                    const std::array<styled_run, 1> runs{
                        styled_run{._text = b._text, ._style = bold_style}};

                    render_runs(runs, alignment::center);
                }
                else if constexpr (std::is_same_v<type, block::paragraph>)
                {
                    render_runs(b._runs, b._alignment);
                }
                else if constexpr (std::is_same_v<type, block::verbatim>)
                {
                    render_verbatim(b._lines);
                }
                else if constexpr (std::is_same_v<type, block::rule>)
                {
                    render_rule();
                }
                else if constexpr (std::is_same_v<type, block::border>)
                {
                    render_border();
                }
                else if constexpr (std::is_same_v<type, block::sleep>)
                {
                    if (!_replaying)
                    {
                        _terminal.flush();
                        _signals.pause_for(b._duration);
                    }
                }
            },
            blk);
    }

    return true;
}

void player::finish_frame(const bool page_complete)
{
    assert(_document != nullptr);

    restore_base_style();

    const std::size_t height = _terminal.height();

    if (_document->_header.has_value())
    {
        write_centered(*_document->_header, style_set{}, 1);
    }

    if (_document->_footer.has_value() && height >= 3)
    {
        write_centered(*_document->_footer, style_set{}, height - 3);
    }

    if (_cfg._show_status && height >= 2)
    {
        std::string status = "[slide " + std::to_string(_page_idx + 1) + "/" +
                             std::to_string(_document->_pages.size()) + "]";

        if (const std::string& title = current_page_ref()._title;
            !title.empty())
        {
            status += ' ';
            status += title;
        }

        const std::size_t max_width = _terminal.width() > _cfg._indent
                                          ? _terminal.width() - _cfg._indent
                                          : 0;

        truncate_to_width(status, max_width);

        _terminal.move_to(height - 2, _cfg._indent);
        _terminal.write(status);

        if (page_complete && _cfg._indent > 0)
        {
            _terminal.move_to(height - 2, _cfg._indent - 1);
            apply_style(bold_style);
            _terminal.write("*");
            restore_base_style();
        }
    }

    _terminal.flush();
}

void player::redraw_current(const bool page_complete)
{
    const std::size_t shown = _block_idx;

    _replaying = true;
    begin_page(_page_idx);

    while (_block_idx < shown)
    {
        (void)render_until_pause();
    }

    _replaying = false;
    finish_frame(page_complete);
}

void player::await_request(const bool page_complete)
{
    assert(_document != nullptr);

    const std::size_t page_count = _document->_pages.size();

    while (true)
    {
        const playback_request request = _signals.next();

        switch (request._signal)
        {
            case playback_signal::quit: _state = state::finished; return;

            case playback_signal::advance:
                if (!page_complete)
                {
                    return; // resume after the pause marker
                }

                if (_page_idx + 1 < page_count)
                {
                    begin_page(_page_idx + 1);
                }
                else
                {
                    _state = state::finished;
                }

                return;

            case playback_signal::previous:
                begin_page(_page_idx > 0 ? _page_idx - 1 : 0);
                return;

            case playback_signal::first: begin_page(0); return;

            case playback_signal::jump:
                if (request._page.has_value() && *request._page < page_count)
                {
                    begin_page(*request._page);
                    return;
                }

                break; // no such page: keep waiting

            case playback_signal::help:
                render_help();

                if (_signals.next()._signal == playback_signal::quit)
                {
                    _state = state::finished;
                    return;
                }

                redraw_current(page_complete);
                break;
        }
    }
}

void player::play(const document& doc)
{
    assert(!doc._pages.empty());

    _document = &doc;
    _state = state::rendering;
    begin_page(0);

    while (_state != state::finished)
    {
        _state = state::rendering;
        const bool page_complete = render_until_pause();
        finish_frame(page_complete);

        _state = state::awaiting_advance;
        await_request(page_complete);
    }
}

player::state player::current_state() const noexcept
{
    return _state;
}

std::size_t player::current_page() const noexcept
{
    return _page_idx;
}

void play(const document& doc, terminal& term, signal_source& signals,
    const player_config& cfg)
{
    player{term, signals, cfg}.play(doc);
}

} // namespace termslide
