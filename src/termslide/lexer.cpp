#include "lexer.hpp"

#include "document.hpp"
#include "parse_error.hpp"
#include "token.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <cassert>
#include <cctype>
#include <cstddef>

namespace termslide {

namespace {

using namespace std::string_view_literals;

constexpr std::string_view directive_prefix = "--"sv;

[[nodiscard]] bool is_space(const char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_alpha(const char c) noexcept
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_alnum(const char c) noexcept
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_spelling_char(const char c) noexcept
{
    return is_alnum(c) || c == '/' || c == '#' || c == '_' || c == '-';
}

[[nodiscard]] std::string_view trim(std::string_view sv) noexcept
{
    while (!sv.empty() && is_space(sv.front()))
    {
        sv.remove_prefix(1);
    }

    while (!sv.empty() && is_space(sv.back()))
    {
        sv.remove_suffix(1);
    }

    return sv;
}

// Directive arguments are plain text; only the escape marker is removed.
[[nodiscard]] std::string unescape_argument(const std::string_view arg)
{
    std::string result;
    result.reserve(arg.size());

    for (std::size_t i = 0; i < arg.size(); ++i)
    {
        if (arg[i] == '\\' && arg.substr(i + 1).starts_with(directive_prefix))
        {
            continue;
        }

        result.append(1, arg[i]);
    }

    return result;
}

// Word following the directive prefix, up to the first whitespace.
[[nodiscard]] std::string_view directive_word(const std::string_view line)
{
    assert(line.starts_with(directive_prefix));

    std::size_t end = directive_prefix.size();
    while (end < line.size() && !is_space(line[end]))
    {
        ++end;
    }

    return line.substr(
        directive_prefix.size(), end - directive_prefix.size());
}

struct tag_spelling
{
    std::string_view _spelling;
    token_kind _kind;
    tag_kind _tag;
};

// Longest spellings first, so that `--/rev` is never read as `--/r`.
constexpr std::array<tag_spelling, 8> tag_spellings{{
    {"--/rev"sv, token_kind::inline_close, tag_kind::reverse},
    {"--rev"sv, token_kind::inline_open, tag_kind::reverse},
    {"--/b"sv, token_kind::inline_close, tag_kind::bold},
    {"--/u"sv, token_kind::inline_close, tag_kind::underline},
    {"--/c"sv, token_kind::inline_close, tag_kind::color},
    {"--b"sv, token_kind::inline_open, tag_kind::bold},
    {"--u"sv, token_kind::inline_open, tag_kind::underline},
    {"--c"sv, token_kind::inline_open, tag_kind::color} //
}};

} // namespace

lexer::lexer(const std::string_view source) noexcept
    : _source{source},
      _curr_idx{0},
      _curr_line{0},
      _in_verbatim{false},
      _pending_idx{0}
{}

bool lexer::is_done() const noexcept
{
    return _curr_idx >= _source.size();
}

std::string_view lexer::read_line() noexcept
{
    assert(!is_done());

    const std::size_t newline_idx = _source.find('\n', _curr_idx);
    const std::size_t end_idx =
        newline_idx == std::string_view::npos ? _source.size() : newline_idx;

    std::string_view line = _source.substr(_curr_idx, end_idx - _curr_idx);
    if (line.ends_with('\r'))
    {
        line.remove_suffix(1);
    }

    _curr_idx = end_idx + 1 /* newline */;
    ++_curr_line;

    return line;
}

void lexer::fail(const error_kind kind, std::string detail)
{
    _pending.clear();
    _pending_idx = 0;

    _error = parse_error{
        ._kind = kind, ._line = _curr_line, ._detail = std::move(detail)};
}

void lexer::push(token&& tkn)
{
    _pending.push_back(std::move(tkn));
}

void lexer::push_simple(const token_kind kind, std::string text)
{
    push(token{._kind = kind, ._line = _curr_line, ._text = std::move(text)});
}

std::optional<lexer::tag_match> lexer::try_match_tag(
    const std::string_view text, const std::size_t idx)
{
    const std::string_view rest = text.substr(idx);

    for (const auto& [spelling, kind, tag] : tag_spellings)
    {
        if (!rest.starts_with(spelling))
        {
            continue;
        }

        const std::size_t end = spelling.size();
        if (end < rest.size() && is_alnum(rest[end]))
        {
            // `--bold`, `--up` and the like are not tags.
            continue;
        }

        token tkn{._kind = kind, ._line = _curr_line, ._tag = tag};

        if (kind == token_kind::inline_close || tag != tag_kind::color)
        {
            return tag_match{._token = std::move(tkn), ._length = end};
        }

        //
        // `--c` consumes the following color name
        // ----------------------------------------------------------------
        std::size_t name_begin = end;
        while (name_begin < rest.size() && is_space(rest[name_begin]))
        {
            ++name_begin;
        }

        std::size_t name_end = name_begin;
        while (name_end < rest.size() && is_alpha(rest[name_end]))
        {
            ++name_end;
        }

        const std::string_view name =
            rest.substr(name_begin, name_end - name_begin);

        if (name_begin == end || name.empty())
        {
            fail(error_kind::invalid_color, "'--c' requires a color name");
            return std::nullopt;
        }

        if (!color_from_name(name).has_value())
        {
            fail(error_kind::invalid_color, std::string{name});
            return std::nullopt;
        }

        tkn._argument = std::string{name};
        return tag_match{._token = std::move(tkn), ._length = name_end};
    }

    return std::nullopt;
}

void lexer::lex_running_text(const std::string_view text)
{
    std::string buffer;

    const auto flush_buffer = [&]
    {
        if (!buffer.empty())
        {
            push_simple(token_kind::text, std::move(buffer));
            buffer.clear();
        }
    };

    std::size_t i = 0;
    while (i < text.size())
    {
        const std::string_view rest = text.substr(i);

        //
        // Escaped directive prefix
        // ----------------------------------------------------------------
        if (rest.starts_with("\\--"sv))
        {
            std::size_t spelling_end = 3;
            while (spelling_end < rest.size() &&
                   is_spelling_char(rest[spelling_end]))
            {
                ++spelling_end;
            }

            flush_buffer();
            push_simple(token_kind::escaped_literal,
                std::string{rest.substr(1, spelling_end - 1)});

            i += spelling_end;
            continue;
        }

        //
        // Inline tag
        // ----------------------------------------------------------------
        if (rest.starts_with(directive_prefix))
        {
            std::optional<tag_match> match = try_match_tag(text, i);

            if (_error.has_value())
            {
                return;
            }

            if (match.has_value())
            {
                flush_buffer();
                push(std::move(match->_token));

                i += match->_length;
                continue;
            }
        }

        buffer.append(1, text[i]);
        ++i;
    }

    flush_buffer();
    push_simple(token_kind::line_end);
}

void lexer::lex_verbatim_line(const std::string_view line)
{
    if (line.starts_with(directive_prefix))
    {
        const std::optional<directive_kind> kind =
            directive_from_name(directive_word(line));

        if (kind == directive_kind::end_output)
        {
            _in_verbatim = false;
        }

        if (kind == directive_kind::end_output ||
            kind == directive_kind::begin_output)
        {
            push(token{._kind = token_kind::directive,
                ._line = _curr_line,
                ._directive = *kind});

            return;
        }
    }

    push_simple(token_kind::verbatim_line, std::string{line});
}

void lexer::lex_line(const std::string_view line)
{
    if (_in_verbatim)
    {
        lex_verbatim_line(line);
        return;
    }

    if (line.starts_with("--##"sv))
    {
        return;
    }

    // Whitespace-only lines are blank lines.
    if (trim(line).empty())
    {
        push_simple(token_kind::line_end);
        return;
    }

    if (line.starts_with("---"sv))
    {
        push(token{._kind = token_kind::directive,
            ._line = _curr_line,
            ._directive = directive_kind::pause});

        return;
    }

    const bool looks_like_directive =
        line.size() > directive_prefix.size() &&
        line.starts_with(directive_prefix) &&
        (is_alpha(line[2]) || line[2] == '/');

    if (!looks_like_directive)
    {
        lex_running_text(line);
        return;
    }

    const std::string_view word = directive_word(line);
    const std::optional<directive_kind> kind = directive_from_name(word);

    if (!kind.has_value())
    {
        if (try_match_tag(line, 0).has_value())
        {
            lex_running_text(line);
        }
        else if (!_error.has_value())
        {
            fail(error_kind::unknown_directive, "--" + std::string{word});
        }

        return;
    }

    const std::string_view rest =
        line.substr(directive_prefix.size() + word.size());

    token tkn{._kind = token_kind::directive,
        ._line = _curr_line,
        ._directive = *kind};

    //
    // Aligned lines keep their inline markup
    // ----------------------------------------------------------------
    if (*kind == directive_kind::center || *kind == directive_kind::right)
    {
        if (trim(rest).empty())
        {
            fail(error_kind::missing_argument, "--" + std::string{word});
            return;
        }

        push(std::move(tkn));

        std::string_view body = rest;
        if (!body.empty() && is_space(body.front()))
        {
            body.remove_prefix(1);
        }

        lex_running_text(body);
        return;
    }

    if (const std::string_view arg = trim(rest); !arg.empty())
    {
        tkn._argument = unescape_argument(arg);
    }

    if (*kind == directive_kind::begin_output)
    {
        _in_verbatim = true;
    }

    push(std::move(tkn));
}

std::optional<token> lexer::next()
{
    while (_pending_idx >= _pending.size())
    {
        if (_error.has_value() || is_done())
        {
            return std::nullopt;
        }

        _pending.clear();
        _pending_idx = 0;

        lex_line(read_line());
    }

    return std::move(_pending[_pending_idx++]);
}

const std::optional<parse_error>& lexer::error() const noexcept
{
    return _error;
}

std::size_t lexer::current_line() const noexcept
{
    return _curr_line;
}

} // namespace termslide
