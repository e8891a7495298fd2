#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <termslide/compiler.hpp>
#include <termslide/document.hpp>
#include <termslide/parse_error.hpp>

#include <chrono>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

#include <cstddef>

using namespace std::string_view_literals;
using termslide::style_set;
using termslide::styled_run;

namespace block = termslide::block;

namespace {

constexpr std::string_view inline_formatting_sample =
    R"(--title Inline Formatting
--author Example
--date today
--newpage
--heading Inline formatting
This line has --b bold--/b, --u underlined--/u and --rev reversed--/rev text.
Nesting works too: --b bold --u and underlined --c red and red--/c--/u--/b.

--beginoutput
$ echo \--b is printed as is
--endoutput
To write a tag literally, escape it: \--b or \--c.
--newpage
--heading Combined
--b--u both--/u--/b back to normal
)"sv;

[[nodiscard]] termslide::document compile_ok(const std::string_view source)
{
    termslide::compiler c{std::cerr};
    termslide::document doc;

    const std::optional<termslide::parse_error> err = c.compile(doc, source);

    REQUIRE(!err.has_value());
    return doc;
}

[[nodiscard]] termslide::parse_error compile_error(
    const std::string_view source, std::ostream& err_stream)
{
    termslide::compiler c{err_stream};
    termslide::document doc;

    const std::optional<termslide::parse_error> err = c.compile(doc, source);

    REQUIRE(err.has_value());
    REQUIRE(doc._pages.empty());
    return *err;
}

[[nodiscard]] termslide::parse_error compile_error(
    const std::string_view source)
{
    std::ostringstream oss;
    return compile_error(source, oss);
}

template <typename T>
[[nodiscard]] const T& block_as(const termslide::document& doc,
    const std::size_t page, const std::size_t idx)
{
    REQUIRE(page < doc._pages.size());
    REQUIRE(idx < doc._pages[page]._blocks.size());

    const T* const result = std::get_if<T>(&doc._pages[page]._blocks[idx]);
    REQUIRE(result != nullptr);

    return *result;
}

} // namespace

TEST_CASE("compiler ctor/dtor")
{
    termslide::compiler c{std::cerr};
    (void)c;
}

TEST_CASE("compiler empty source has one empty page")
{
    const termslide::document doc = compile_ok(""sv);

    REQUIRE(doc._pages.size() == 1);
    REQUIRE(doc._pages[0]._blocks.empty());
    REQUIRE(doc._pages[0]._title == "Title");
    REQUIRE(!doc._title.has_value());
}

TEST_CASE("compiler inline formatting sample")
{
    const termslide::document doc = compile_ok(inline_formatting_sample);

    REQUIRE(doc._title == "Inline Formatting");
    REQUIRE(doc._author == "Example");
    REQUIRE(doc._date == "today");
    REQUIRE(doc._pages.size() == 3);

    REQUIRE(doc._pages[0]._blocks.empty());

    //
    // Page 1
    // ----------------------------------------------------------------
    REQUIRE(doc._pages[1]._blocks.size() == 4);
    REQUIRE(block_as<block::heading>(doc, 1, 0)._text == "Inline formatting");

    const auto& p0 = block_as<block::paragraph>(doc, 1, 1);
    REQUIRE(p0._alignment == termslide::alignment::left);
    REQUIRE(p0._runs.size() == 11);

    REQUIRE(p0._runs[0] == styled_run{._text = "This line has ", ._style = {}});
    REQUIRE(p0._runs[1] ==
            styled_run{._text = " bold", ._style = {._bold = true}});
    REQUIRE(p0._runs[2]._text == ", ");
    REQUIRE(p0._runs[3] ==
            styled_run{._text = " underlined", ._style = {._underline = true}});
    REQUIRE(p0._runs[5] ==
            styled_run{._text = " reversed", ._style = {._reverse = true}});

    // The line break belongs to the run that was open at the end of the line.
    REQUIRE(p0._runs[6]._text == " text.\nNesting works too: ");
    REQUIRE(p0._runs[6]._style.is_default());

    REQUIRE(p0._runs[7] ==
            styled_run{._text = " bold ", ._style = {._bold = true}});
    REQUIRE(p0._runs[8] ==
            styled_run{._text = " and underlined ",
                ._style = {._bold = true, ._underline = true}});
    REQUIRE(p0._runs[9] ==
            styled_run{._text = " and red",
                ._style = {._bold = true,
                    ._underline = true,
                    ._color = termslide::named_color::red}});
    REQUIRE(p0._runs[10] == styled_run{._text = ".", ._style = {}});

    const auto& vb = block_as<block::verbatim>(doc, 1, 2);
    REQUIRE(vb._lines.size() == 1);
    REQUIRE(vb._lines[0] == R"($ echo \--b is printed as is)");

    const auto& p1 = block_as<block::paragraph>(doc, 1, 3);
    REQUIRE(p1._runs.size() == 1);
    REQUIRE(p1._runs[0]._text ==
            "To write a tag literally, escape it: --b or --c.");
    REQUIRE(p1._runs[0]._style.is_default());

    //
    // Page 2
    // ----------------------------------------------------------------
    REQUIRE(doc._pages[2]._blocks.size() == 2);
    REQUIRE(block_as<block::heading>(doc, 2, 0)._text == "Combined");

    const auto& p2 = block_as<block::paragraph>(doc, 2, 1);
    REQUIRE(p2._runs.size() == 2);
    REQUIRE(p2._runs[0] ==
            styled_run{._text = " both",
                ._style = {._bold = true, ._underline = true}});
    REQUIRE(p2._runs[1] ==
            styled_run{._text = " back to normal", ._style = {}});
}

TEST_CASE("compiler page count follows newpage directives")
{
    for (std::size_t n = 0; n < 5; ++n)
    {
        std::string source = "intro\n";
        for (std::size_t i = 0; i < n; ++i)
        {
            source += "--newpage\ntext\n";
        }

        REQUIRE(compile_ok(source)._pages.size() == n + 1);
    }
}

TEST_CASE("compiler page titles")
{
    const termslide::document doc =
        compile_ok("--newpage\n--newpage Results\n--newpage\n"sv);

    REQUIRE(doc._pages.size() == 4);
    REQUIRE(doc._pages[0]._title == "Title");
    REQUIRE(doc._pages[1]._title == "slide 2");
    REQUIRE(doc._pages[2]._title == "Results");
    REQUIRE(doc._pages[3]._title == "slide 4");
}

TEST_CASE("compiler metadata may appear anywhere and the last value wins")
{
    const termslide::document doc = compile_ok(R"(--title First
--newpage
--title Second
--footer (c) someone
--header Conference
)"sv);

    REQUIRE(doc._title == "Second");
    REQUIRE(doc._footer == "(c) someone");
    REQUIRE(doc._header == "Conference");
    REQUIRE(!doc._author.has_value());
    REQUIRE(doc._pages[1]._blocks.empty());
}

TEST_CASE("compiler blank lines separate paragraphs")
{
    const termslide::document doc = compile_ok(R"(one
two


three
)"sv);

    REQUIRE(doc._pages[0]._blocks.size() == 2);
    REQUIRE(block_as<block::paragraph>(doc, 0, 0)._runs[0]._text == "one\ntwo");
    REQUIRE(block_as<block::paragraph>(doc, 0, 1)._runs[0]._text == "three");
}

TEST_CASE("compiler directives end the current paragraph")
{
    const termslide::document doc = compile_ok(R"(before
--heading Middle
after
--horline
---
last
)"sv);

    const auto& blocks = doc._pages[0]._blocks;
    REQUIRE(blocks.size() == 6);
    REQUIRE(std::holds_alternative<block::paragraph>(blocks[0]));
    REQUIRE(std::holds_alternative<block::heading>(blocks[1]));
    REQUIRE(std::holds_alternative<block::paragraph>(blocks[2]));
    REQUIRE(std::holds_alternative<block::rule>(blocks[3]));
    REQUIRE(std::holds_alternative<block::pause>(blocks[4]));
    REQUIRE(std::holds_alternative<block::paragraph>(blocks[5]));
}

TEST_CASE("compiler aligned lines")
{
    const termslide::document doc = compile_ok(R"(--center --b Big--/b news
--right signed
plain
)"sv);

    REQUIRE(doc._pages[0]._blocks.size() == 3);

    const auto& centered = block_as<block::paragraph>(doc, 0, 0);
    REQUIRE(centered._alignment == termslide::alignment::center);
    REQUIRE(centered._runs.size() == 2);
    REQUIRE(centered._runs[0] ==
            styled_run{._text = " Big", ._style = {._bold = true}});

    const auto& right = block_as<block::paragraph>(doc, 0, 1);
    REQUIRE(right._alignment == termslide::alignment::right);
    REQUIRE(right._runs[0]._text == "signed");

    const auto& left = block_as<block::paragraph>(doc, 0, 2);
    REQUIRE(left._alignment == termslide::alignment::left);
}

TEST_CASE("compiler styles may span lines of a paragraph")
{
    const termslide::document doc = compile_ok("--u first\nsecond--/u\n"sv);

    const auto& p = block_as<block::paragraph>(doc, 0, 0);
    REQUIRE(p._runs.size() == 1);
    REQUIRE(p._runs[0] ==
            styled_run{
                ._text = " first\nsecond", ._style = {._underline = true}});
}

TEST_CASE("compiler verbatim content is reproduced exactly")
{
    const std::string_view body = "  --b not bold --/c\n"
                                  "--newpage\n"
                                  "\n"
                                  "\\--heading x\t\n"
                                  "--## not a comment here"sv;

    std::string source = "--beginoutput\n";
    source += body;
    source += "\n--endoutput\n";

    const termslide::document doc = compile_ok(source);

    REQUIRE(doc._pages.size() == 1);

    const auto& vb = block_as<block::verbatim>(doc, 0, 0);
    REQUIRE(vb._lines.size() == 5);

    std::string joined;
    for (std::size_t i = 0; i < vb._lines.size(); ++i)
    {
        joined += vb._lines[i];
        if (i + 1 < vb._lines.size())
        {
            joined += '\n';
        }
    }

    REQUIRE(joined == body);
}

TEST_CASE("compiler escaped directives are literal text")
{
    const termslide::document doc =
        compile_ok("\\--newpage \\--title \\--rev \\--/c \\--beginoutput\n"sv);

    REQUIRE(doc._pages.size() == 1);
    REQUIRE(!doc._title.has_value());

    const auto& p = block_as<block::paragraph>(doc, 0, 0);
    REQUIRE(p._runs.size() == 1);
    REQUIRE(p._runs[0]._text == "--newpage --title --rev --/c --beginoutput");
    REQUIRE(p._runs[0]._style.is_default());
}

TEST_CASE("compiler comments are dropped")
{
    const termslide::document doc = compile_ok("--## note\nvisible\n"sv);

    REQUIRE(doc._pages[0]._blocks.size() == 1);
    REQUIRE(block_as<block::paragraph>(doc, 0, 0)._runs[0]._text == "visible");
}

TEST_CASE("compiler error: unknown directive")
{
    std::ostringstream oss;
    const termslide::parse_error err =
        compile_error("text\n\n--bogus arg\n"sv, oss);

    REQUIRE(err._kind == termslide::error_kind::unknown_directive);
    REQUIRE(err._line == 3);
    REQUIRE(oss.str().find("((TERMSLIDE ERROR))(3)") != std::string::npos);
    REQUIRE(oss.str().find("--bogus") != std::string::npos);
}

TEST_CASE("compiler error: nested verbatim")
{
    const termslide::parse_error err =
        compile_error("--beginoutput\nx\n--beginoutput\n--endoutput\n"sv);

    REQUIRE(err._kind == termslide::error_kind::nested_verbatim);
    REQUIRE(err._line == 3);
}

TEST_CASE("compiler error: unmatched endoutput")
{
    const termslide::parse_error err = compile_error("a\n--endoutput\n"sv);

    REQUIRE(err._kind == termslide::error_kind::unmatched_end_output);
    REQUIRE(err._line == 2);
}

TEST_CASE("compiler error: unterminated verbatim")
{
    const termslide::parse_error err =
        compile_error("--newpage\n--beginoutput\nline\nline\n"sv);

    REQUIRE(err._kind == termslide::error_kind::unterminated_verbatim);
    REQUIRE(err._line == 2);
}

TEST_CASE("compiler error: mismatched tag")
{
    const termslide::parse_error err =
        compile_error("ok\n--b --rev x--/b--/rev\n"sv);

    REQUIRE(err._kind == termslide::error_kind::mismatched_tag);
    REQUIRE(err._line == 2);
}

TEST_CASE("compiler error: unclosed tag at blank line")
{
    const termslide::parse_error err =
        compile_error("--c blue open\n\n--/c closed too late\n"sv);

    REQUIRE(err._kind == termslide::error_kind::unclosed_tag);
    REQUIRE(err._line == 1);
}

TEST_CASE("compiler error: unclosed tag at directive")
{
    const termslide::parse_error err =
        compile_error("--u open\n--newpage\n"sv);

    REQUIRE(err._kind == termslide::error_kind::unclosed_tag);
}

TEST_CASE("compiler error: unclosed tag at end of input")
{
    const termslide::parse_error err = compile_error("--rev open"sv);

    REQUIRE(err._kind == termslide::error_kind::unclosed_tag);
}

TEST_CASE("compiler error: aligned line must close its tags")
{
    const termslide::parse_error err =
        compile_error("--center --b big\nmore--/b\n"sv);

    REQUIRE(err._kind == termslide::error_kind::unclosed_tag);
}

TEST_CASE("compiler error: invalid color")
{
    const termslide::parse_error err = compile_error("--c orange x--/c\n"sv);

    REQUIRE(err._kind == termslide::error_kind::invalid_color);
}

TEST_CASE("compiler error: missing argument")
{
    const termslide::parse_error err =
        compile_error("--newpage\n--heading\n"sv);

    REQUIRE(err._kind == termslide::error_kind::missing_argument);
    REQUIRE(err._line == 2);
}

TEST_CASE("compiler whitespace-only line ends a paragraph")
{
    const termslide::document doc = compile_ok("one\n   \t\ntwo\n"sv);

    REQUIRE(doc._pages[0]._blocks.size() == 2);
    REQUIRE(block_as<block::paragraph>(doc, 0, 0)._runs[0]._text == "one");
    REQUIRE(block_as<block::paragraph>(doc, 0, 1)._runs[0]._text == "two");
}

TEST_CASE("compiler line-level toggles")
{
    const termslide::document doc = compile_ok(R"(--boldon
x

--boldoff
y
--ulon
--color red
a --rev b--/rev
--newpage
still
--uloff
--color default
plain
)"sv);

    REQUIRE(block_as<block::paragraph>(doc, 0, 0)._runs[0] ==
            styled_run{._text = "x", ._style = {._bold = true}});
    REQUIRE(block_as<block::paragraph>(doc, 0, 1)._runs[0] ==
            styled_run{._text = "y", ._style = {}});

    constexpr style_set red_underline{
        ._underline = true, ._color = termslide::named_color::red};

    const auto& mixed = block_as<block::paragraph>(doc, 0, 2);
    REQUIRE(mixed._runs.size() == 2);
    REQUIRE(mixed._runs[0] ==
            styled_run{._text = "a ", ._style = red_underline});
    REQUIRE(mixed._runs[1] ==
            styled_run{._text = " b",
                ._style = {._underline = true,
                    ._reverse = true,
                    ._color = termslide::named_color::red}});

    // Toggles carry over to later pages.
    REQUIRE(block_as<block::paragraph>(doc, 1, 0)._runs[0] ==
            styled_run{._text = "still", ._style = red_underline});

    REQUIRE(block_as<block::paragraph>(doc, 1, 1)._runs[0] ==
            styled_run{._text = "plain",
                ._style = {._color = termslide::named_color::terminal_default}});
}

TEST_CASE("compiler screen colors")
{
    const termslide::document doc =
        compile_ok("--fgcolor white\n--bgcolor blue\ntext\n--bgcolor black\n"sv);

    REQUIRE(doc._foreground == termslide::named_color::white);
    REQUIRE(doc._background == termslide::named_color::black);
    REQUIRE(doc._pages[0]._blocks.size() == 1);
}

TEST_CASE("compiler border and sleep blocks")
{
    const termslide::document doc =
        compile_ok("--withborder\nfirst\n--sleep 2\nsecond\n--sleep 0\n"sv);

    const auto& blocks = doc._pages[0]._blocks;
    REQUIRE(blocks.size() == 5);
    REQUIRE(std::holds_alternative<block::border>(blocks[0]));
    REQUIRE(std::holds_alternative<block::paragraph>(blocks[1]));
    REQUIRE(block_as<block::sleep>(doc, 0, 2)._duration ==
            std::chrono::seconds{2});
    REQUIRE(std::holds_alternative<block::paragraph>(blocks[3]));
    REQUIRE(block_as<block::sleep>(doc, 0, 4)._duration ==
            std::chrono::seconds{0});
}

TEST_CASE("compiler error: invalid sleep duration")
{
    std::ostringstream oss;
    const termslide::parse_error err =
        compile_error("text\n--sleep soon\n"sv, oss);

    REQUIRE(err._kind == termslide::error_kind::invalid_argument);
    REQUIRE(err._line == 2);
    REQUIRE(oss.str().find("soon") != std::string::npos);

    REQUIRE(compile_error("--sleep -1\n"sv)._kind ==
            termslide::error_kind::invalid_argument);
    REQUIRE(compile_error("--sleep 1.5\n"sv)._kind ==
            termslide::error_kind::invalid_argument);
    REQUIRE(compile_error("--sleep\n"sv)._kind ==
            termslide::error_kind::missing_argument);
}

TEST_CASE("compiler error: invalid screen color")
{
    const termslide::parse_error err = compile_error("\n--bgcolor mauve\n"sv);

    REQUIRE(err._kind == termslide::error_kind::invalid_color);
    REQUIRE(err._line == 2);

    REQUIRE(compile_error("--color\n"sv)._kind ==
            termslide::error_kind::missing_argument);
}

TEST_CASE("compiler leaves the output untouched on error")
{
    termslide::document doc = compile_ok("--title Kept\n"sv);

    std::ostringstream oss;
    termslide::compiler failing{oss};
    REQUIRE(failing.compile(doc, "--title Lost\n--endoutput\n"sv).has_value());

    REQUIRE(doc._title == "Kept");
}

TEST_CASE("compiler instances can be reused")
{
    std::ostringstream oss;
    termslide::compiler c{oss};

    termslide::document doc;
    REQUIRE(c.compile(doc, "--beginoutput\n"sv).has_value());
    REQUIRE(!c.compile(doc, "--title Fresh\n--newpage\n"sv).has_value());

    REQUIRE(doc._title == "Fresh");
    REQUIRE(doc._pages.size() == 2);
}
