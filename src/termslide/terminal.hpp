#pragma once

#include "document.hpp"

#include <string_view>

#include <cstddef>

namespace termslide {

// Output sink driven by the player. Coordinates are 0-based.
class terminal
{
public:
    virtual ~terminal() = default;

    [[nodiscard]] virtual std::size_t width() const noexcept = 0;
    [[nodiscard]] virtual std::size_t height() const noexcept = 0;

    virtual void clear() = 0;
    virtual void move_to(const std::size_t row, const std::size_t col) = 0;
    virtual void write(const std::string_view text) = 0;

    // Sets the attributes to exactly `style`: anything not in `style` is
    // switched off.
    virtual void set_style(const style_set& style) = 0;
    virtual void reset_style() = 0;

    virtual void flush() = 0;
};

} // namespace termslide
