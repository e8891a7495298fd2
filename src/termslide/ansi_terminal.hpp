#pragma once

#include "document.hpp"
#include "terminal.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

#include <cstddef>

namespace termslide {

// Writes SGR and cursor control sequences to a stream.
class ansi_terminal final : public terminal
{
private:
    std::ostream& _os;
    std::size_t _width;
    std::size_t _height;

public:
    [[nodiscard]] explicit ansi_terminal(
        std::ostream& os, const std::size_t width, const std::size_t height);

    ~ansi_terminal() override;

    [[nodiscard]] std::size_t width() const noexcept override;
    [[nodiscard]] std::size_t height() const noexcept override;

    void clear() override;
    void move_to(const std::size_t row, const std::size_t col) override;
    void write(const std::string_view text) override;
    void set_style(const style_set& style) override;
    void reset_style() override;
    void flush() override;
};

// Full SGR sequence for `style`, always starting from a reset.
[[nodiscard]] std::string sgr_sequence(const style_set& style);

} // namespace termslide
