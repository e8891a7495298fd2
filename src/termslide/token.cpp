#include "token.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include <cstddef>

namespace termslide {

namespace {

using namespace std::string_view_literals;

// Indexed by `directive_kind`.
constexpr std::array<std::pair<std::string_view, directive_kind>, 24>
    directive_names{{
        {"title"sv, directive_kind::title},
        {"author"sv, directive_kind::author},
        {"date"sv, directive_kind::date},
        {"newpage"sv, directive_kind::newpage},
        {"heading"sv, directive_kind::heading},
        {"beginoutput"sv, directive_kind::begin_output},
        {"endoutput"sv, directive_kind::end_output},
        {"center"sv, directive_kind::center},
        {"right"sv, directive_kind::right},
        {"horline"sv, directive_kind::horline},
        {"header"sv, directive_kind::header},
        {"footer"sv, directive_kind::footer},
        {"-"sv, directive_kind::pause},
        {"withborder"sv, directive_kind::withborder},
        {"sleep"sv, directive_kind::sleep},
        {"boldon"sv, directive_kind::bold_on},
        {"boldoff"sv, directive_kind::bold_off},
        {"revon"sv, directive_kind::reverse_on},
        {"revoff"sv, directive_kind::reverse_off},
        {"ulon"sv, directive_kind::underline_on},
        {"uloff"sv, directive_kind::underline_off},
        {"color"sv, directive_kind::color},
        {"fgcolor"sv, directive_kind::fgcolor},
        {"bgcolor"sv, directive_kind::bgcolor} //
    }};

} // namespace

std::optional<directive_kind> directive_from_name(
    const std::string_view name) noexcept
{
    for (const auto& [n, kind] : directive_names)
    {
        if (n == name)
        {
            return kind;
        }
    }

    return std::nullopt;
}

std::string_view directive_name(const directive_kind kind) noexcept
{
    return directive_names[static_cast<std::size_t>(kind)].first;
}

std::string_view tag_name(const tag_kind kind) noexcept
{
    switch (kind)
    {
        case tag_kind::bold: return "b";
        case tag_kind::underline: return "u";
        case tag_kind::reverse: return "rev";
        case tag_kind::color: return "c";
    }

    return "?";
}

} // namespace termslide
