#include "document.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include <cstddef>

namespace termslide {

namespace {

using namespace std::string_view_literals;

constexpr std::array<std::pair<std::string_view, named_color>, 9> color_names{{
    {"white"sv, named_color::white},
    {"yellow"sv, named_color::yellow},
    {"red"sv, named_color::red},
    {"green"sv, named_color::green},
    {"blue"sv, named_color::blue},
    {"cyan"sv, named_color::cyan},
    {"magenta"sv, named_color::magenta},
    {"black"sv, named_color::black},
    {"default"sv, named_color::terminal_default} //
}};

} // namespace

std::optional<named_color> color_from_name(const std::string_view name) noexcept
{
    for (const auto& [n, c] : color_names)
    {
        if (n == name)
        {
            return c;
        }
    }

    return std::nullopt;
}

std::string_view color_name(const named_color c) noexcept
{
    return color_names[static_cast<std::size_t>(c)].first;
}

} // namespace termslide
