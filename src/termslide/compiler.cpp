#include "compiler.hpp"

#include "document.hpp"
#include "lexer.hpp"
#include "parse_error.hpp"
#include "style_resolver.hpp"
#include "token.hpp"

#include <charconv>
#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <cassert>
#include <cstddef>

namespace termslide {

class compiler::pass
{
private:
    enum class state
    {
        normal,
        in_verbatim
    };

    lexer _lexer;
    document _document;
    state _state;
    std::size_t _verbatim_begin_line;

    std::vector<token> _paragraph_tokens;
    alignment _paragraph_alignment;
    style_set _line_style;
    bool _line_has_content;
    bool _pending_line_break;

    [[nodiscard]] page& current_page() noexcept
    {
        assert(!_document._pages.empty());
        return _document._pages.back();
    }

    [[nodiscard]] std::optional<parse_error> seal_paragraph()
    {
        const alignment align =
            std::exchange(_paragraph_alignment, alignment::left);

        _line_has_content = false;
        _pending_line_break = false;

        if (_paragraph_tokens.empty())
        {
            return std::nullopt;
        }

        std::vector<styled_run> runs;
        const std::optional<parse_error> err =
            resolve_styles(_paragraph_tokens, runs, _line_style);

        _paragraph_tokens.clear();

        if (err.has_value())
        {
            return err;
        }

        if (!runs.empty())
        {
            current_page()._blocks.emplace_back(block::paragraph{
                ._runs = std::move(runs), ._alignment = align});
        }

        return std::nullopt;
    }

    [[nodiscard]] static std::optional<parse_error> require_argument(
        const token& tkn)
    {
        if (tkn._argument.has_value())
        {
            return std::nullopt;
        }

        return parse_error{._kind = error_kind::missing_argument,
            ._line = tkn._line,
            ._detail = "--" + std::string{directive_name(tkn._directive)}};
    }

    [[nodiscard]] std::optional<parse_error> set_metadata(
        std::optional<std::string>& field, const token& tkn)
    {
        if (std::optional<parse_error> err = require_argument(tkn))
        {
            return err;
        }

        // Later occurrences overwrite earlier ones.
        field = *tkn._argument;
        return std::nullopt;
    }

    [[nodiscard]] static std::optional<parse_error> read_color(
        const token& tkn, std::optional<named_color>& field)
    {
        if (std::optional<parse_error> err = require_argument(tkn))
        {
            return err;
        }

        const std::optional<named_color> color =
            color_from_name(*tkn._argument);
        if (!color.has_value())
        {
            return parse_error{._kind = error_kind::invalid_color,
                ._line = tkn._line,
                ._detail = *tkn._argument};
        }

        field = color;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<parse_error> add_sleep(const token& tkn)
    {
        if (std::optional<parse_error> err = require_argument(tkn))
        {
            return err;
        }

        const std::string& arg = *tkn._argument;

        std::chrono::seconds::rep seconds = 0;
        const auto [ptr, ec] =
            std::from_chars(arg.data(), arg.data() + arg.size(), seconds);

        if (ec != std::errc{} || ptr != arg.data() + arg.size() || seconds < 0)
        {
            return parse_error{._kind = error_kind::invalid_argument,
                ._line = tkn._line,
                ._detail =
                    "'--sleep' expects whole seconds, got '" + arg + "'"};
        }

        current_page()._blocks.emplace_back(
            block::sleep{._duration = std::chrono::seconds{seconds}});

        return std::nullopt;
    }

    void open_page(const token& tkn)
    {
        std::string title = tkn._argument.value_or(
            "slide " + std::to_string(_document._pages.size() + 1));

        _document._pages.push_back(page{._title = std::move(title)});
    }

    [[nodiscard]] std::optional<parse_error> process_directive(const token& tkn)
    {
        if (std::optional<parse_error> err = seal_paragraph())
        {
            return err;
        }

        switch (tkn._directive)
        {
            case directive_kind::title:
                return set_metadata(_document._title, tkn);

            case directive_kind::author:
                return set_metadata(_document._author, tkn);

            case directive_kind::date:
                return set_metadata(_document._date, tkn);

            case directive_kind::header:
                return set_metadata(_document._header, tkn);

            case directive_kind::footer:
                return set_metadata(_document._footer, tkn);

            case directive_kind::newpage: open_page(tkn); break;

            case directive_kind::heading:
                if (std::optional<parse_error> err = require_argument(tkn))
                {
                    return err;
                }

                current_page()._blocks.emplace_back(
                    block::heading{._text = *tkn._argument});

                break;

            case directive_kind::begin_output:
                current_page()._blocks.emplace_back(block::verbatim{});
                _verbatim_begin_line = tkn._line;
                _state = state::in_verbatim;
                break;

            case directive_kind::end_output:
                return parse_error{._kind = error_kind::unmatched_end_output,
                    ._line = tkn._line};

            case directive_kind::center:
                _paragraph_alignment = alignment::center;
                break;

            case directive_kind::right:
                _paragraph_alignment = alignment::right;
                break;

            case directive_kind::horline:
                current_page()._blocks.emplace_back(block::rule{});
                break;

            case directive_kind::pause:
                current_page()._blocks.emplace_back(block::pause{});
                break;

            case directive_kind::withborder:
                current_page()._blocks.emplace_back(block::border{});
                break;

            case directive_kind::sleep: return add_sleep(tkn);

            //
            // Line-level toggles apply to every following paragraph
            // ----------------------------------------------------------------
            case directive_kind::bold_on: _line_style._bold = true; break;
            case directive_kind::bold_off: _line_style._bold = false; break;
            case directive_kind::reverse_on:
                _line_style._reverse = true;
                break;
            case directive_kind::reverse_off:
                _line_style._reverse = false;
                break;
            case directive_kind::underline_on:
                _line_style._underline = true;
                break;
            case directive_kind::underline_off:
                _line_style._underline = false;
                break;

            case directive_kind::color:
                return read_color(tkn, _line_style._color);

            case directive_kind::fgcolor:
                return read_color(tkn, _document._foreground);

            case directive_kind::bgcolor:
                return read_color(tkn, _document._background);
        }

        return std::nullopt;
    }

    [[nodiscard]] std::optional<parse_error> process_normal(token&& tkn)
    {
        switch (tkn._kind)
        {
            case token_kind::directive: return process_directive(tkn);

            case token_kind::line_end:
                //
                // A blank line or the end of an aligned line ends the
                // paragraph; otherwise the next line continues it.
                // ------------------------------------------------------------
                if (!_line_has_content ||
                    _paragraph_alignment != alignment::left)
                {
                    return seal_paragraph();
                }

                _line_has_content = false;
                _pending_line_break = true;
                return std::nullopt;

            case token_kind::text:
            case token_kind::escaped_literal:
            case token_kind::inline_open:
            case token_kind::inline_close:
                if (std::exchange(_pending_line_break, false))
                {
                    _paragraph_tokens.push_back(token{
                        ._kind = token_kind::line_end, ._line = tkn._line});
                }

                _paragraph_tokens.push_back(std::move(tkn));
                _line_has_content = true;
                return std::nullopt;

            case token_kind::verbatim_line: break;
        }

        assert(false && "verbatim line outside of a verbatim region");
        return std::nullopt;
    }

    [[nodiscard]] std::optional<parse_error> process_verbatim(token&& tkn)
    {
        if (tkn._kind == token_kind::verbatim_line)
        {
            auto* const vb =
                std::get_if<block::verbatim>(&current_page()._blocks.back());

            assert(vb != nullptr);
            vb->_lines.push_back(std::move(tkn._text));

            return std::nullopt;
        }

        assert(tkn._kind == token_kind::directive);

        if (tkn._directive == directive_kind::begin_output)
        {
            return parse_error{._kind = error_kind::nested_verbatim,
                ._line = tkn._line,
                ._detail = "region opened on line " +
                           std::to_string(_verbatim_begin_line)};
        }

        assert(tkn._directive == directive_kind::end_output);
        _state = state::normal;

        return std::nullopt;
    }

    [[nodiscard]] std::optional<parse_error> step(token&& tkn)
    {
        switch (_state)
        {
            case state::normal: return process_normal(std::move(tkn));
            case state::in_verbatim: return process_verbatim(std::move(tkn));
        }

        return std::nullopt;
    }

public:
    [[nodiscard]] explicit pass(const std::string_view source)
        : _lexer{source},
          _state{state::normal},
          _verbatim_begin_line{0},
          _paragraph_alignment{alignment::left},
          _line_style{},
          _line_has_content{false},
          _pending_line_break{false}
    {
        _document._pages.push_back(page{._title = "Title"});
    }

    [[nodiscard]] std::optional<parse_error> compile(document& output)
    {
        while (std::optional<token> tkn = _lexer.next())
        {
            if (std::optional<parse_error> err = step(std::move(*tkn)))
            {
                return err;
            }
        }

        if (_lexer.error().has_value())
        {
            return _lexer.error();
        }

        if (_state == state::in_verbatim)
        {
            return parse_error{._kind = error_kind::unterminated_verbatim,
                ._line = _verbatim_begin_line};
        }

        if (std::optional<parse_error> err = seal_paragraph())
        {
            return err;
        }

        output = std::move(_document);
        return std::nullopt;
    }
};

compiler::compiler(std::ostream& err_stream) noexcept
    : _err_stream{err_stream}
{}

std::optional<parse_error> compiler::compile(
    document& output, const std::string_view source) noexcept
{
    std::optional<parse_error> err = pass{source}.compile(output);

    if (err.has_value())
    {
        _err_stream << *err << "\n\n";
    }

    return err;
}

} // namespace termslide
