#pragma once

#include "parse_error.hpp"
#include "token.hpp"

#include <optional>
#include <string_view>
#include <vector>

#include <cstddef>

namespace termslide {

// Splits a presentation source into tokens, one input line at a time.
// `next()` returns `std::nullopt` at the end of the input or on the first
// lexical error, which is then available through `error()`. Lexing cannot
// be resumed after an error; construct a new lexer instead.
class lexer
{
private:
    struct tag_match
    {
        token _token;
        std::size_t _length;
    };

    const std::string_view _source;
    std::size_t _curr_idx;
    std::size_t _curr_line;
    bool _in_verbatim;

    std::vector<token> _pending;
    std::size_t _pending_idx;

    std::optional<parse_error> _error;

    [[nodiscard]] bool is_done() const noexcept;
    [[nodiscard]] std::string_view read_line() noexcept;

    void fail(const error_kind kind, std::string detail);

    void push(token&& tkn);
    void push_simple(const token_kind kind, std::string text = {});

    [[nodiscard]] std::optional<tag_match> try_match_tag(
        const std::string_view text, const std::size_t idx);

    void lex_running_text(const std::string_view text);
    void lex_verbatim_line(const std::string_view line);
    void lex_line(const std::string_view line);

public:
    [[nodiscard]] explicit lexer(const std::string_view source) noexcept;

    [[nodiscard]] std::optional<token> next();

    [[nodiscard]] const std::optional<parse_error>& error() const noexcept;

    [[nodiscard]] std::size_t current_line() const noexcept;
};

} // namespace termslide
