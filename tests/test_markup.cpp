#include <gtest/gtest.h>
#include <core/markup.hpp>
#include <fmt/format.h>

TEST(Markup, StripRemovesKnownTags) {
    EXPECT_EQ(markup::strip("[bold]Title[/bold] and [green dim]x[/green dim]"), "Title and x");
}

TEST(Markup, StripKeepsUnknownBrackets) {
    EXPECT_EQ(markup::strip("array[0] = [not a style]"), "array[0] = [not a style]");
}

TEST(Markup, UnbalancedCloseIsLiteral) {
    EXPECT_EQ(markup::strip("oops[/bold]"), "oops[/bold]");
}

TEST(Markup, GenericClose) {
    EXPECT_EQ(markup::strip("[cyan]a[/] b"), "a b");
}

TEST(Markup, EscapeRoundTripsThroughStrip) {
    std::string text = "see [bold] and [/red] literally";
    EXPECT_EQ(markup::strip(markup::escape(text)), text);
}

TEST(Markup, EscapedBracketNotInterpreted) {
    EXPECT_EQ(markup::to_ansi("\\[bold]x"), "[bold]x");
}

TEST(Markup, ToAnsiEmitsCodes) {
    EXPECT_EQ(markup::to_ansi("[bold]x[/bold]"), "\033[1mx\033[0m");
}

TEST(Markup, ToAnsiReappliesOuterStyle) {
    EXPECT_EQ(markup::to_ansi("[cyan]a[bold]b[/bold]c[/cyan]"),
              "\033[36ma\033[1mb\033[0m\033[36mc\033[0m");
}

TEST(Markup, ToAnsiClosesDanglingTags) {
    EXPECT_EQ(markup::to_ansi("[red]x"), "\033[31mx\033[0m");
}

TEST(Markup, PlainTextUnchanged) {
    EXPECT_EQ(markup::to_ansi("plain text"), "plain text");
    EXPECT_EQ(markup::strip(""), "");
}

TEST(Markup, TrailingBackslashDoesNotSwallowCloseTag) {
    std::string text = fmt::format("[white]{}[/white] done", markup::escape("C:\\proj\\"));
    EXPECT_EQ(markup::strip(text), "C:\\proj\\ done");
    EXPECT_EQ(markup::to_ansi(text), "\033[97mC:\\proj\\\033[0m done");
}

TEST(Markup, LoneBackslashStaysLiteral) {
    EXPECT_EQ(markup::strip("a\\b"), "a\\b");
}
