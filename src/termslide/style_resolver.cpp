#include "style_resolver.hpp"

#include "document.hpp"
#include "parse_error.hpp"
#include "token.hpp"

#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cassert>

namespace termslide {

style_resolver::style_resolver(const style_set& base) noexcept : _base{base}
{}

style_set style_resolver::current_style() const noexcept
{
    style_set result = _base;

    for (const open_tag& ot : _stack)
    {
        switch (ot._tag)
        {
            case tag_kind::bold: result._bold = true; break;
            case tag_kind::underline: result._underline = true; break;
            case tag_kind::reverse: result._reverse = true; break;
            case tag_kind::color: result._color = ot._color; break;
        }
    }

    return result;
}

void style_resolver::flush_pending_text()
{
    if (_pending_text.empty())
    {
        return;
    }

    _runs.push_back(styled_run{
        ._text = std::move(_pending_text), ._style = current_style()});

    _pending_text.clear();
}

std::optional<parse_error> style_resolver::open(const token& tkn)
{
    std::optional<named_color> color;

    if (tkn._tag == tag_kind::color)
    {
        assert(tkn._argument.has_value());

        color = color_from_name(*tkn._argument);
        if (!color.has_value())
        {
            return parse_error{._kind = error_kind::invalid_color,
                ._line = tkn._line,
                ._detail = *tkn._argument};
        }
    }

    flush_pending_text();
    _stack.push_back(
        open_tag{._tag = tkn._tag, ._color = color, ._line = tkn._line});

    return std::nullopt;
}

std::optional<parse_error> style_resolver::close(const token& tkn)
{
    if (_stack.empty())
    {
        return parse_error{._kind = error_kind::mismatched_tag,
            ._line = tkn._line,
            ._detail = "'--/" + std::string{tag_name(tkn._tag)} +
                       "' closes nothing"};
    }

    if (_stack.back()._tag != tkn._tag)
    {
        return parse_error{._kind = error_kind::mismatched_tag,
            ._line = tkn._line,
            ._detail = "expected '--/" +
                       std::string{tag_name(_stack.back()._tag)} +
                       "', found '--/" + std::string{tag_name(tkn._tag)} +
                       "'"};
    }

    flush_pending_text();
    _stack.pop_back();

    return std::nullopt;
}

std::optional<parse_error> style_resolver::feed(const token& tkn)
{
    switch (tkn._kind)
    {
        case token_kind::text:
        case token_kind::escaped_literal:
            _pending_text.append(tkn._text);
            return std::nullopt;

        case token_kind::line_end:
            _pending_text.append(1, '\n');
            return std::nullopt;

        case token_kind::inline_open: return open(tkn);
        case token_kind::inline_close: return close(tkn);

        case token_kind::directive:
        case token_kind::verbatim_line: break;
    }

    assert(false && "token does not belong to a paragraph");
    return std::nullopt;
}

std::optional<parse_error> style_resolver::finish(
    std::vector<styled_run>& output)
{
    if (!_stack.empty())
    {
        const open_tag& innermost = _stack.back();

        parse_error err{._kind = error_kind::unclosed_tag,
            ._line = innermost._line,
            ._detail = "'--" + std::string{tag_name(innermost._tag)} +
                       "' is never closed"};

        _stack.clear();
        _runs.clear();
        _pending_text.clear();

        return err;
    }

    flush_pending_text();
    output = std::move(_runs);
    _runs.clear();

    return std::nullopt;
}

std::optional<parse_error> resolve_styles(
    const std::span<const token> tokens, std::vector<styled_run>& output,
    const style_set& base)
{
    style_resolver resolver{base};

    for (const token& tkn : tokens)
    {
        if (std::optional<parse_error> err = resolver.feed(tkn))
        {
            return err;
        }
    }

    return resolver.finish(output);
}

} // namespace termslide
