#pragma once

#include "document.hpp"
#include "parse_error.hpp"

#include <iosfwd>
#include <optional>
#include <string_view>

namespace termslide {

class compiler
{
private:
    class pass;

    std::ostream& _err_stream;

public:
    [[nodiscard]] explicit compiler(std::ostream& err_stream) noexcept;

    // Compiles `source` into `output`. On failure a diagnostic is written to
    // the error stream and `output` is left untouched.
    [[nodiscard]] std::optional<parse_error> compile(
        document& output, const std::string_view source) noexcept;
};

} // namespace termslide
