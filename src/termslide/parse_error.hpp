#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include <cstddef>

namespace termslide {

enum class error_kind
{
    unknown_directive,
    nested_verbatim,
    unmatched_end_output,
    unterminated_verbatim,
    mismatched_tag,
    unclosed_tag,
    invalid_color,
    missing_argument,
    invalid_argument
};

[[nodiscard]] std::string_view error_kind_name(const error_kind kind) noexcept;

struct parse_error
{
    error_kind _kind;
    std::size_t _line; // 1-based
    std::string _detail;
};

// Writes `((TERMSLIDE ERROR))(<line>): <kind> (<detail>)`.
std::ostream& operator<<(std::ostream& os, const parse_error& err);

} // namespace termslide
