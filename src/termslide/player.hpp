#pragma once

#include "document.hpp"
#include "signal_source.hpp"
#include "terminal.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>
#include <ctime>

namespace termslide {

struct player_config
{
    std::size_t _indent = 3;
    std::size_t _top_offset = 5;
    bool _show_status = true;
    bool _expand_date = true;
};

// Drives a terminal through a compiled document, one page at a time.
//
// After a page (or the part of it before a pause marker) is drawn, the
// player waits for the next signal. `quit` ends playback from any page;
// `advance` past the last page ends it too. Text is laid out one column per
// UTF-8 code point.
class player
{
public:
    enum class state
    {
        rendering,
        awaiting_advance,
        finished
    };

private:
    struct cell
    {
        std::string_view _glyph; // one code point
        const style_set* _style;
    };

    terminal& _terminal;
    signal_source& _signals;
    const player_config _cfg;

    const document* _document;
    state _state;
    std::size_t _page_idx;
    std::size_t _block_idx;
    std::size_t _row;
    bool _replaying;

    [[nodiscard]] const page& current_page_ref() const noexcept;
    [[nodiscard]] std::size_t text_width() const noexcept;
    [[nodiscard]] std::size_t column_for(
        const std::size_t length, const alignment align) const noexcept;

    [[nodiscard]] style_set base_style() const noexcept;
    [[nodiscard]] style_set on_base(const style_set& style) const noexcept;
    void apply_style(const style_set& style);
    void restore_base_style();

    void write_centered(const std::string_view text, const style_set& style,
        const std::size_t row);

    void render_title();
    void render_cells(const std::vector<cell>& cells, const alignment align);
    void render_runs(
        const std::span<const styled_run> runs, const alignment align);
    void render_verbatim(const std::vector<std::string>& lines);
    void render_rule();
    void render_border();
    void render_help();

    void begin_page(const std::size_t page_idx);
    [[nodiscard]] bool render_until_pause();
    void finish_frame(const bool page_complete);
    void redraw_current(const bool page_complete);
    void await_request(const bool page_complete);

public:
    [[nodiscard]] explicit player(terminal& term, signal_source& signals,
        const player_config& cfg) noexcept;

    void play(const document& doc);

    [[nodiscard]] state current_state() const noexcept;
    [[nodiscard]] std::size_t current_page() const noexcept;
};

void play(const document& doc, terminal& term, signal_source& signals,
    const player_config& cfg = {});

// Expands `today` and `today <strftime format>`; other values are returned
// unchanged.
[[nodiscard]] std::string expand_date(
    const std::string_view value, const std::time_t now);

} // namespace termslide
