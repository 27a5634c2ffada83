#include <asciidoc/parser/macro_parameters.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace asciidoc::parser;

// ============================================================================
// Splitting
// ============================================================================

// 1. Plain comma separation keeps whitespace
TEST(MacroParameterSplit, Commas) {
    auto parts = split_macro_parameters("a, b,c");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], " b");
    EXPECT_EQ(parts[2], "c");
}

// 2. Commas inside quotes do not split; quotes are kept
TEST(MacroParameterSplit, QuotedCommas) {
    auto parts = split_macro_parameters(R"(title="One, Two", width=100)");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], R"(title="One, Two")");
    EXPECT_EQ(parts[1], " width=100");
}

// 3. Single quotes work the same way
TEST(MacroParameterSplit, SingleQuotes) {
    auto parts = split_macro_parameters("'a,b',c");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "'a,b'");
}

// 4. Empty input gives no parts
TEST(MacroParameterSplit, Empty) {
    EXPECT_TRUE(split_macro_parameters("").empty());
}

// ============================================================================
// Classification
// ============================================================================

// 5. First positional is alt and title
TEST(MacroParameterParse, FirstPositional) {
    auto attrs = parse_macro_parameters("Architecture diagram");
    EXPECT_EQ(attrs.get_or("alt", ""), "Architecture diagram");
    EXPECT_EQ(attrs.get_or("title", ""), "Architecture diagram");
    EXPECT_EQ(attrs.size(), 2u);
}

// 6. Later positionals are numbered by their index
TEST(MacroParameterParse, LaterPositionals) {
    auto attrs = parse_macro_parameters("quote, Abraham Lincoln, Gettysburg Address");
    EXPECT_EQ(attrs.get_or("alt", ""), "quote");
    EXPECT_EQ(attrs.get_or("param1", ""), "Abraham Lincoln");
    EXPECT_EQ(attrs.get_or("param2", ""), "Gettysburg Address");
}

// 7. Named values are trimmed and unquoted
TEST(MacroParameterParse, NamedValues) {
    auto attrs = parse_macro_parameters(R"(Logo, width = 400, title="Company Logo", role='hero')");
    EXPECT_EQ(attrs.get_or("width", ""), "400");
    EXPECT_EQ(attrs.get_or("title", ""), "Company Logo");
    EXPECT_EQ(attrs.get_or("role", ""), "hero");
    EXPECT_EQ(attrs.get_or("alt", ""), "Logo");
}

// 8. Order of first appearance is preserved
TEST(MacroParameterParse, Order) {
    auto attrs = parse_macro_parameters("lines=1..3, tags=intro, indent=2");
    auto names = attrs.names();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "lines");
    EXPECT_EQ(names[1], "tags");
    EXPECT_EQ(names[2], "indent");
}

// 9. Blank parts are skipped but still count
TEST(MacroParameterParse, BlankPartsCount) {
    auto attrs = parse_macro_parameters(", second");
    EXPECT_FALSE(attrs.has("alt"));
    EXPECT_EQ(attrs.get_or("param1", ""), "second");
}

// 10. A leading '=' is not a named parameter
TEST(MacroParameterParse, LeadingEquals) {
    auto attrs = parse_macro_parameters("=odd");
    EXPECT_EQ(attrs.get_or("alt", ""), "=odd");
}

// 11. Empty input gives empty attributes
TEST(MacroParameterParse, Empty) {
    EXPECT_TRUE(parse_macro_parameters("").empty());
}
