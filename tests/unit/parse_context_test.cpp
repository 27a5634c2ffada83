#include <asciidoc/core/diagnostics.h>
#include <asciidoc/core/parse_error.h>
#include <asciidoc/dom/blocks.h>
#include <asciidoc/parser/parse_context.h>
#include <gtest/gtest.h>
#include <string>

using namespace asciidoc;
using namespace asciidoc::parser;

// ============================================================================
// Cursor
// ============================================================================

// 1. Starts on the first token
TEST(ParseContext, StartsOnFirstToken) {
    ParseContext context("== Title\nBody");
    EXPECT_TRUE(context.at(Token::Header));
    EXPECT_EQ(context.current().value, "== Title");
    EXPECT_EQ(context.consumed(), 0u);
}

// 2. advance() counts consumed tokens and stops at end of input
TEST(ParseContext, AdvanceToEnd) {
    ParseContext context("a\nb");
    context.advance();
    EXPECT_TRUE(context.at(Token::NewLine));
    EXPECT_TRUE(context.at_blank());
    context.advance();
    context.advance();
    EXPECT_TRUE(context.at_end());
    const std::size_t consumed = context.consumed();
    context.advance();
    EXPECT_TRUE(context.at_end());
    EXPECT_EQ(context.consumed(), consumed);
}

// 3. accept() only moves on a match
TEST(ParseContext, Accept) {
    ParseContext context("----\ncode");
    EXPECT_FALSE(context.accept(Token::Text));
    EXPECT_TRUE(context.accept(Token::CodeBlockDelimiter));
    EXPECT_TRUE(context.at(Token::NewLine));
}

// 4. expect() throws with position on mismatch
TEST(ParseContext, ExpectMismatchThrows) {
    ParseContext context("\nplain");
    context.advance();
    try {
        context.expect(Token::Header);
        FAIL() << "expected ParseError";
    } catch (const core::ParseError& error) {
        EXPECT_EQ(error.line(), 2);
        EXPECT_EQ(error.column(), 1);
        EXPECT_NE(error.message().find("Expected Header but found Text"), std::string::npos);
    }
}

// 5. expect() returns the consumed token
TEST(ParseContext, ExpectReturnsToken) {
    ParseContext context("NOTE: hi");
    Token token = context.expect(Token::AdmonitionBlock);
    EXPECT_EQ(token.value, "NOTE: hi");
    EXPECT_TRUE(context.at_end());
}

// ============================================================================
// Shared state
// ============================================================================

// 6. Element stack is LIFO
TEST(ParseContext, ElementStack) {
    ParseContext context("x");
    dom::Sidebar outer;
    dom::Example inner;
    EXPECT_EQ(context.peek_element(), nullptr);
    context.push_element(outer);
    context.push_element(inner);
    EXPECT_EQ(context.element_depth(), 2u);
    EXPECT_EQ(context.peek_element(), &inner);
    EXPECT_EQ(context.pop_element(), &inner);
    EXPECT_EQ(context.pop_element(), &outer);
    EXPECT_EQ(context.pop_element(), nullptr);
}

// 7. Global attributes are writable
TEST(ParseContext, GlobalAttributes) {
    ParseContext context("x");
    context.global_attributes().set("product", "Widget");
    EXPECT_EQ(context.global_attributes().get_or("product", ""), "Widget");
}

// 8. Base path seeds the current file path
TEST(ParseContext, BasePathFromOptions) {
    ParserOptions options;
    options.base_path = "/docs";
    ParseContext context("x", options);
    EXPECT_EQ(context.current_file_path(), "/docs");
    EXPECT_EQ(context.include_base_path(), "/docs");
    EXPECT_TRUE(context.include_stack().empty());
}

// 9. A child context extends the include chain and shares footnotes
TEST(ParseContext, ChildContext) {
    ParseContext parent("x");
    parent.push_include("/docs/main.adoc");
    parent.footnotes().define("");

    ParseContext child("y", parent, "/docs/part.adoc");
    ASSERT_EQ(child.include_stack().size(), 2u);
    EXPECT_EQ(child.include_stack()[0], "/docs/main.adoc");
    EXPECT_EQ(child.include_stack()[1], "/docs/part.adoc");
    EXPECT_EQ(child.current_file_path(), "/docs/part.adoc");
    EXPECT_EQ(parent.include_stack().size(), 1u);

    EXPECT_EQ(child.footnotes().define(""), 2);
    EXPECT_EQ(parent.footnotes().next_label(), 3);
}

// 10. report() tags events with the current position and file
TEST(ParseContext, ReportCarriesLocation) {
    core::DiagnosticEmitter emitter;
    ParseContext context("\n\nText", ParserOptions{}, &emitter);
    context.push_include("/docs/main.adoc");
    context.advance();
    context.advance();
    context.report(core::Severity::Warning, "parser", "block", "odd");

    ASSERT_EQ(emitter.size(), 1u);
    const auto& event = emitter.events()[0];
    EXPECT_EQ(event.location.file, "/docs/main.adoc");
    EXPECT_EQ(event.location.line, 3);
    EXPECT_EQ(event.location.column, 1);
    EXPECT_EQ(event.message, "odd");
}

// 11. report() without an emitter is a no-op
TEST(ParseContext, ReportWithoutEmitter) {
    ParseContext context("x");
    context.report(core::Severity::Error, "parser", "block", "ignored");
    EXPECT_EQ(context.diagnostics(), nullptr);
}

// ============================================================================
// Footnote registry
// ============================================================================

// 12. Definitions count up; references reuse labels
TEST(FootnoteRegistry, DefineAndReference) {
    FootnoteRegistry registry;
    EXPECT_EQ(registry.define("a"), 1);
    EXPECT_EQ(registry.define(""), 2);
    EXPECT_EQ(registry.reference("a"), 1);
    EXPECT_EQ(registry.reference("unknown"), 3);
    EXPECT_EQ(registry.reference("unknown"), 3);
    EXPECT_EQ(registry.next_label(), 4);
}
