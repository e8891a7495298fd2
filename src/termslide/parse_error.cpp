#include "parse_error.hpp"

#include <ostream>
#include <string_view>

namespace termslide {

std::string_view error_kind_name(const error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::unknown_directive: return "unknown directive";
        case error_kind::nested_verbatim: return "nested '--beginoutput'";
        case error_kind::unmatched_end_output:
            return "'--endoutput' without '--beginoutput'";
        case error_kind::unterminated_verbatim:
            return "unterminated '--beginoutput'";
        case error_kind::mismatched_tag: return "mismatched closing tag";
        case error_kind::unclosed_tag: return "unclosed tag";
        case error_kind::invalid_color: return "invalid color";
        case error_kind::missing_argument: return "missing argument";
        case error_kind::invalid_argument: return "invalid argument";
    }

    return "unknown error";
}

std::ostream& operator<<(std::ostream& os, const parse_error& err)
{
    os << "((TERMSLIDE ERROR))(" << err._line
       << "): " << error_kind_name(err._kind);

    if (!err._detail.empty())
    {
        os << " (" << err._detail << ')';
    }

    return os;
}

} // namespace termslide
