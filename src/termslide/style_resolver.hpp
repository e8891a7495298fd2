#pragma once

#include "document.hpp"
#include "parse_error.hpp"
#include "token.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

#include <cstddef>

namespace termslide {

// Turns the raw tokens of one paragraph into styled runs. Tags nest
// strictly: a closing tag must match the innermost open tag, and every tag
// must be closed before the paragraph ends. Tags add to a base style set
// by the line-level toggles.
class style_resolver
{
private:
    struct open_tag
    {
        tag_kind _tag;
        std::optional<named_color> _color;
        std::size_t _line;
    };

    style_set _base;
    std::vector<open_tag> _stack;
    std::vector<styled_run> _runs;
    std::string _pending_text;

    void flush_pending_text();

    [[nodiscard]] std::optional<parse_error> open(const token& tkn);
    [[nodiscard]] std::optional<parse_error> close(const token& tkn);

public:
    [[nodiscard]] explicit style_resolver(const style_set& base = {}) noexcept;

    [[nodiscard]] style_set current_style() const noexcept;

    [[nodiscard]] std::optional<parse_error> feed(const token& tkn);

    // Seals the paragraph. On success the runs are moved into `output` and
    // the resolver is ready for the next paragraph.
    [[nodiscard]] std::optional<parse_error> finish(
        std::vector<styled_run>& output);
};

[[nodiscard]] std::optional<parse_error> resolve_styles(
    const std::span<const token> tokens, std::vector<styled_run>& output,
    const style_set& base = {});

} // namespace termslide
