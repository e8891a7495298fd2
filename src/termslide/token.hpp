#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <cstddef>

namespace termslide {

enum class token_kind
{
    directive,
    inline_open,
    inline_close,
    escaped_literal,
    text,
    verbatim_line,
    line_end
};

enum class directive_kind
{
    title,
    author,
    date,
    newpage,
    heading,
    begin_output,
    end_output,
    center,
    right,
    horline,
    header,
    footer,
    pause,
    withborder,
    sleep,
    bold_on,
    bold_off,
    reverse_on,
    reverse_off,
    underline_on,
    underline_off,
    color,
    fgcolor,
    bgcolor
};

enum class tag_kind
{
    bold,
    underline,
    reverse,
    color
};

[[nodiscard]] std::optional<directive_kind> directive_from_name(
    const std::string_view name) noexcept;

[[nodiscard]] std::string_view directive_name(
    const directive_kind kind) noexcept;

[[nodiscard]] std::string_view tag_name(const tag_kind kind) noexcept;

struct token
{
    token_kind _kind;
    std::size_t _line;

    // Payload of `text`, `escaped_literal` and `verbatim_line` tokens.
    std::string _text;

    // Directive argument, or the color name of an opening `--c`.
    std::optional<std::string> _argument;

    directive_kind _directive = directive_kind::title;
    tag_kind _tag = tag_kind::bold;
};

} // namespace termslide
