#pragma once
#include <asciidoc/core/diagnostics.h>
#include <asciidoc/dom/attributes.h>
#include <asciidoc/dom/document.h>
#include <asciidoc/dom/element.h>
#include <asciidoc/dom/macros.h>
#include <asciidoc/parser/parse_context.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace asciidoc::dom {
class Literal;
class Listing;
class Passthrough;
class Verse;
class CodeBlock;
}

namespace asciidoc::parser {

class IncludeProcessor;

// Recursive-descent AsciiDoc parser.
//
// Every parse routine leaves the context on the first token it did not
// consume. Loops that call parse_element() advance on their own only when
// a dispatch consumed nothing.
//
// A Parser instance is not thread-safe; it owns the diagnostics emitter
// that every parse reports to.
class Parser {
public:
    Parser();
    ~Parser();

    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    // Throws core::ParseError for empty input or malformed constructs.
    std::unique_ptr<dom::Document> parse(std::string_view text);
    std::unique_ptr<dom::Document> parse(std::string_view text, const ParserOptions& options);

    // Includes resolve against the file's directory unless options name a
    // base path.
    std::unique_ptr<dom::Document> parse_file(const std::string& path);
    std::unique_ptr<dom::Document> parse_file(const std::string& path, const ParserOptions& options);

    // Parses the first block of text in isolation; nullptr for empty input.
    std::unique_ptr<dom::Element> parse_element(std::string_view text);
    // Dispatches on the current token. Returns nullptr for tokens that
    // produce no element (blank lines, attribute lines, end of input).
    std::unique_ptr<dom::Element> parse_element(ParseContext& context);

    // Blocks of context up to end of input. Attribute lines update the
    // context's global attributes and produce no element.
    std::vector<std::unique_ptr<dom::Element>> parse_blocks(ParseContext& context);

    // Inline spans of one line of text, left to right.
    std::vector<std::unique_ptr<dom::Element>> parse_inline(std::string_view text,
                                                            FootnoteRegistry& footnotes) const;
    std::vector<std::unique_ptr<dom::Element>> parse_inline(std::string_view text) const;

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }

    IncludeProcessor& include_processor() { return *include_processor_; }

    // image, video and include get their own node types; any other name
    // gives a generic Macro. Include macros are not expanded here.
    static std::unique_ptr<dom::Element> create_macro(const std::string& name,
                                                      const std::string& target,
                                                      dom::Attributes parameters,
                                                      dom::MacroType type);
    // Fills every TableOfContents in document from its sections.
    static void populate_table_of_contents(dom::Document& document);

private:
    core::DiagnosticEmitter diagnostics_;
    std::unique_ptr<IncludeProcessor> include_processor_;

    std::unique_ptr<dom::Document> parse_document(ParseContext& context);

    std::unique_ptr<dom::Element> parse_section_title(ParseContext& context);
    std::unique_ptr<dom::Element> parse_list(ParseContext& context);
    std::unique_ptr<dom::Element> parse_list_item(ParseContext& context);
    std::unique_ptr<dom::Element> parse_description_list(ParseContext& context);
    std::unique_ptr<dom::Element> parse_description_list_item(ParseContext& context);
    std::unique_ptr<dom::Element> parse_paragraph(ParseContext& context);
    std::unique_ptr<dom::Element> parse_table(ParseContext& context, bool header_row);
    std::unique_ptr<dom::Element> parse_block_quote(ParseContext& context,
                                                    std::string attribution = {},
                                                    std::string cite = {});
    std::unique_ptr<dom::Element> parse_sidebar(ParseContext& context);
    std::unique_ptr<dom::Element> parse_example(ParseContext& context);
    std::unique_ptr<dom::Element> parse_open(ParseContext& context,
                                             std::optional<std::string> masquerade_type = std::nullopt);
    std::unique_ptr<dom::Element> parse_admonition(ParseContext& context);
    std::unique_ptr<dom::Element> parse_table_of_contents(ParseContext& context);
    std::unique_ptr<dom::Element> parse_block_macro(ParseContext& context);
    std::unique_ptr<dom::Element> parse_attribute_block(ParseContext& context);
    void parse_attribute_line(ParseContext& context);

    std::unique_ptr<dom::CodeBlock> parse_code_block(ParseContext& context,
                                                     std::optional<std::string> language);
    std::unique_ptr<dom::Verse> parse_verse(ParseContext& context);
    std::unique_ptr<dom::Listing> parse_listing_block(ParseContext& context);
    std::unique_ptr<dom::Verse> parse_verse_body(ParseContext& context, Token::Type closing,
                                                 std::optional<std::string> author,
                                                 std::optional<std::string> citation);
    std::unique_ptr<dom::Literal> parse_literal(ParseContext& context);
    std::unique_ptr<dom::Literal> parse_literal_attribute(ParseContext& context);
    std::unique_ptr<dom::Listing> parse_listing_attribute(ParseContext& context);
    std::unique_ptr<dom::Passthrough> parse_passthrough(ParseContext& context);
    std::unique_ptr<dom::Passthrough> parse_passthrough_attribute(ParseContext& context);

    // Sidebar, example and open blocks: nested blocks up to closing.
    void parse_compound_body(ParseContext& context, dom::Element& block,
                             Token::Type closing, const char* stage);

    std::unique_ptr<dom::Element> expand_include(std::unique_ptr<dom::IncludeMacro> macro,
                                                 ParseContext& context);

    void report_unclosed(ParseContext& context, const char* stage, Token::Type closing) const;
};

} // namespace asciidoc::parser
