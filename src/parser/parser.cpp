#include <asciidoc/parser/parser.h>
#include <asciidoc/core/config.h>
#include <asciidoc/core/parse_error.h>
#include <asciidoc/dom/blocks.h>
#include <asciidoc/dom/inlines.h>
#include <asciidoc/parser/include_processor.h>
#include <asciidoc/parser/macro_parameters.h>
#include "string_utils.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <variant>

#include <re2/re2.h>

namespace asciidoc::parser {

namespace {

namespace fs = std::filesystem;

// Per-construct patterns applied to a token the tokenizer already
// classified. They capture what the line patterns only recognise.
struct BlockPatterns {
    re2::RE2 header{R"(^(=+)\s+(.+)$)"};
    re2::RE2 list_item{R"(^(\*+|\d+\.)\s+(\[[ xX]\]\s+)?(.+)$)"};
    re2::RE2 description_item{R"(^([^:\[\]]+)::\s*(.*)$)"};
    re2::RE2 attribute_line{R"(^:([^:!]+)(!?):\s*(.*)$)"};
    re2::RE2 attribute_block{R"(^\[([^\]]+)\]$)"};
    re2::RE2 code_delimiter{R"(^----(\w+)?$)"};
    re2::RE2 source_style{R"((?i)^source(?:,\s*(\w+))?)"};
    re2::RE2 admonition{R"(^(NOTE|TIP|IMPORTANT|WARNING|CAUTION):\s*(.*)$)"};
    re2::RE2 verse_attribute{R"(^\[verse(?:,\s*([^,\]]+))?(?:,\s*([^\]]+))?\]$)"};
    re2::RE2 table_of_contents{R"(^toc::\s*\[([^\]]*)\]$)"};
    re2::RE2 block_macro{R"(^(\w+)::([^\[]*)\[([^\]]*)\]$)"};
};

const BlockPatterns& block_patterns() {
    static const BlockPatterns patterns;
    return patterns;
}

core::ParseError malformed(const char* construct, const Token& token) {
    return core::ParseError(std::string("Invalid ") + construct + " format at line " +
                                std::to_string(token.line) + ", column " +
                                std::to_string(token.column) + ": " + token.value,
                            token.line, token.column);
}

std::optional<std::string> non_empty(std::string value) {
    if (value.empty()) return std::nullopt;
    return value;
}

// Text of a token inside a verbatim block. An indented line reaches the
// parser without its leading whitespace; put back one space per column.
std::string verbatim_text(const Token& token) {
    if (token.type == Token::Text && token.column > 1) {
        return std::string(static_cast<size_t>(token.column - 1), ' ') + token.value;
    }
    return token.value;
}

// Raw lines up to (not including) closing or end of input.
std::string collect_verbatim(ParseContext& context, Token::Type closing) {
    std::string content;
    while (!context.at_end() && !context.at(closing)) {
        if (context.at_blank()) {
            content += '\n';
        } else {
            content += verbatim_text(context.current());
        }
        context.advance();
    }
    return content;
}

// Consecutive Text lines, ending at a blank line or any other construct.
std::string collect_text_run(ParseContext& context) {
    std::string content;
    bool previous_newline = false;
    while (true) {
        if (context.at(Token::Text)) {
            content += verbatim_text(context.current());
            previous_newline = false;
        } else if (context.at(Token::NewLine)) {
            if (previous_newline) break;
            content += '\n';
            previous_newline = true;
        } else {
            break;
        }
        context.advance();
    }
    return content;
}

std::vector<std::string> split_table_row(std::string_view row) {
    if (!row.empty() && row.front() == '|') {
        row.remove_prefix(1);
    }

    std::vector<std::string> cells;
    size_t start = 0;
    while (start <= row.size()) {
        size_t bar = row.find('|', start);
        if (bar == std::string_view::npos) bar = row.size();
        std::string cell = detail::trim_copy(row.substr(start, bar - start));
        if (!cell.empty()) {
            cells.push_back(std::move(cell));
        }
        start = bar + 1;
    }
    return cells;
}

bool requests_header_row(std::string_view content, const dom::Attributes& parameters) {
    if (content.find("%header") != std::string_view::npos) return true;
    for (const char* key : {"options", "opts"}) {
        auto value = parameters.get(key);
        if (value && value->find("header") != std::string::npos) return true;
    }
    return false;
}

// Carries the bracket attributes of a block line onto the element it
// introduces. The first positional value is the block style; "#name"
// styles name the element's id.
void apply_block_attributes(const dom::Attributes& parameters, dom::Element& element) {
    const std::string style = parameters.get_or("alt", "");
    if (detail::starts_with(style, "#") && style.size() > 1) {
        element.attributes().set("id", style.substr(1));
    } else if (!style.empty()) {
        element.attributes().set("style", style);
    }

    for (const auto& attribute : parameters) {
        if (attribute.name == "alt" || detail::starts_with(attribute.name, "param")) continue;
        if (attribute.name == "title" && attribute.value == style) continue;
        element.attributes().set(attribute.name, attribute.value);
    }
}

void apply_header_attributes(dom::Document& document, const dom::Attributes& attributes) {
    auto& header = document.header();
    for (const auto& attribute : attributes) {
        document.attributes().set(attribute.name, attribute.value);
        header.attributes.set(attribute.name, attribute.value);
    }
    header.author = attributes.get_or("author", header.author);
    header.email = attributes.get_or("email", header.email);
    header.revision = attributes.get_or("revnumber", header.revision);
    header.date = attributes.get_or("revdate", header.date);
}

void collect_sections(const dom::Element& element, int max_depth,
                      std::vector<const dom::Section*>& sections) {
    for (const auto& child : element.children()) {
        if (const auto* section = dom::element_cast<dom::Section>(child.get())) {
            if (!section->is_container() && !section->title().empty() &&
                section->level() <= max_depth) {
                sections.push_back(section);
            }
        }
        collect_sections(*child, max_depth, sections);
    }
}

void collect_tables_of_contents(const dom::Element& element,
                                std::vector<dom::TableOfContents*>& tocs) {
    for (const auto& child : element.children()) {
        if (auto* toc = dom::element_cast<dom::TableOfContents>(child.get())) {
            tocs.push_back(toc);
        }
        collect_tables_of_contents(*child, tocs);
    }
}

// Entries deeper than parent_level, nested by level.
std::vector<dom::TableOfContentsEntry> build_toc_entries(
    const std::vector<const dom::Section*>& sections, size_t& index, int parent_level) {
    std::vector<dom::TableOfContentsEntry> entries;
    while (index < sections.size() && sections[index]->level() > parent_level) {
        const dom::Section& section = *sections[index++];
        dom::TableOfContentsEntry entry;
        entry.title = section.title();
        entry.level = section.level();
        entry.anchor_id = section.anchor_id();
        entry.children = build_toc_entries(sections, index, section.level());
        entries.push_back(std::move(entry));
    }
    return entries;
}

} // namespace

Parser::Parser() : include_processor_(std::make_unique<IncludeProcessor>(*this)) {}

Parser::~Parser() = default;

// ============================================================================
// Entry points
// ============================================================================

std::unique_ptr<dom::Document> Parser::parse(std::string_view text) {
    return parse(text, ParserOptions{});
}

std::unique_ptr<dom::Document> Parser::parse(std::string_view text, const ParserOptions& options) {
    if (text.empty()) {
        throw core::ParseError("Input cannot be empty");
    }
    diagnostics_.clear();
    ParseContext context(std::string(text), options, &diagnostics_);
    return parse_document(context);
}

std::unique_ptr<dom::Document> Parser::parse_file(const std::string& path) {
    return parse_file(path, ParserOptions{});
}

std::unique_ptr<dom::Document> Parser::parse_file(const std::string& path,
                                                  const ParserOptions& options) {
    if (path.empty()) {
        throw core::ParseError("File path cannot be empty");
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw core::ParseError("File not found: " + path);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw core::ParseError("Error reading file '" + path + "'");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();
    if (content.empty()) {
        throw core::ParseError("Input cannot be empty");
    }

    fs::path canonical = fs::weakly_canonical(fs::path(path), ec);
    if (ec) {
        canonical = fs::absolute(fs::path(path), ec);
    }

    ParserOptions effective = options;
    const bool base_from_file = effective.base_path.empty();
    if (base_from_file) {
        effective.base_path = canonical.parent_path().string();
    }

    diagnostics_.clear();
    ParseContext context(std::move(content), effective, &diagnostics_);
    if (base_from_file) {
        context.set_current_file_path(canonical.string());
    }
    context.push_include(canonical.string());
    return parse_document(context);
}

std::unique_ptr<dom::Element> Parser::parse_element(std::string_view text) {
    if (text.empty()) return nullptr;

    diagnostics_.clear();
    ParseContext context(std::string(text), ParserOptions{}, &diagnostics_);
    while (context.at_blank()) {
        context.advance();
    }
    return parse_element(context);
}

std::unique_ptr<dom::Element> Parser::parse_element(ParseContext& context) {
    switch (context.current().type) {
        case Token::Header:               return parse_section_title(context);
        case Token::ListItem:             return parse_list(context);
        case Token::DescriptionListItem:  return parse_description_list(context);
        case Token::TableDelimiter:       return parse_table(context, false);
        case Token::TableRow:
            context.report(core::Severity::Warning, "parser", "block",
                           "Table row outside of a table");
            return nullptr;
        case Token::BlockQuoteDelimiter:  return parse_block_quote(context);
        case Token::SidebarDelimiter:     return parse_sidebar(context);
        case Token::ExampleDelimiter:     return parse_example(context);
        case Token::OpenDelimiter:        return parse_open(context);
        case Token::VerseDelimiter:
            return parse_verse_body(context, Token::VerseDelimiter, std::nullopt, std::nullopt);
        case Token::VerseAttribute:       return parse_verse(context);
        case Token::LiteralDelimiter:     return parse_literal(context);
        case Token::LiteralAttribute:     return parse_literal_attribute(context);
        case Token::ListingAttribute:     return parse_listing_attribute(context);
        case Token::PassthroughDelimiter: return parse_passthrough(context);
        case Token::PassthroughAttribute: return parse_passthrough_attribute(context);
        case Token::CodeBlockDelimiter:   return parse_code_block(context, std::nullopt);
        case Token::AttributeLine:
            parse_attribute_line(context);
            return nullptr;
        case Token::AttributeBlockLine:   return parse_attribute_block(context);
        case Token::AdmonitionBlock:      return parse_admonition(context);
        case Token::TableOfContents:      return parse_table_of_contents(context);
        case Token::BlockMacro:           return parse_block_macro(context);
        case Token::Text:                 return parse_paragraph(context);
        case Token::EmptyLine:
        case Token::NewLine:
        case Token::EndOfFile:
            return nullptr;
    }
    return nullptr;
}

std::vector<std::unique_ptr<dom::Element>> Parser::parse_blocks(ParseContext& context) {
    std::vector<std::unique_ptr<dom::Element>> elements;
    while (!context.at_end()) {
        const std::size_t before = context.consumed();
        if (auto element = parse_element(context)) {
            elements.push_back(std::move(element));
        }
        if (context.consumed() == before) {
            context.advance();
        }
    }
    return elements;
}

std::unique_ptr<dom::Document> Parser::parse_document(ParseContext& context) {
    auto document = std::make_unique<dom::Document>();
    context.push_element(*document);

    while (context.at_blank()) {
        context.advance();
    }

    if (context.at(Token::Header)) {
        std::string markers;
        std::string title;
        if (re2::RE2::PartialMatch(context.current().value, block_patterns().header,
                                   &markers, &title) &&
            markers.size() == 1) {
            document->header().title = detail::trim_copy(title);
            context.advance();
        }
    }

    for (auto& element : parse_blocks(context)) {
        document->append_child(std::move(element));
    }

    context.pop_element();
    apply_header_attributes(*document, context.global_attributes());
    populate_table_of_contents(*document);

    context.report(core::Severity::Info, "parser", "document",
                   "Parsed " + std::to_string(document->child_count()) + " top-level elements");
    return document;
}

void Parser::populate_table_of_contents(dom::Document& document) {
    std::vector<dom::TableOfContents*> tocs;
    collect_tables_of_contents(document, tocs);

    for (auto* toc : tocs) {
        std::vector<const dom::Section*> sections;
        collect_sections(document, toc->max_depth(), sections);
        size_t index = 0;
        toc->set_entries(build_toc_entries(sections, index, 0));
    }
}

// ============================================================================
// Sections, paragraphs and lists
// ============================================================================

std::unique_ptr<dom::Element> Parser::parse_section_title(ParseContext& context) {
    const Token token = context.current();
    std::string markers;
    std::string title;
    if (!re2::RE2::PartialMatch(token.value, block_patterns().header, &markers, &title)) {
        throw malformed("header", token);
    }
    context.advance();
    return std::make_unique<dom::Section>(detail::trim_copy(title),
                                          static_cast<int>(markers.size()));
}

std::unique_ptr<dom::Element> Parser::parse_paragraph(ParseContext& context) {
    const Token token = context.current();
    context.advance();

    auto paragraph = std::make_unique<dom::Paragraph>();
    for (auto& span : parse_inline(detail::trim_view(token.value), context.footnotes())) {
        paragraph->append_child(std::move(span));
    }
    return paragraph;
}

std::unique_ptr<dom::Element> Parser::parse_list(ParseContext& context) {
    const Token first = context.current();
    std::string marker;
    if (!re2::RE2::PartialMatch(first.value, block_patterns().list_item, &marker)) {
        throw malformed("list item", first);
    }

    const bool ordered = std::isdigit(static_cast<unsigned char>(marker.front())) != 0;
    int start_number = 1;
    if (ordered) {
        start_number = detail::parse_int(std::string_view(marker).substr(0, marker.size() - 1))
                           .value_or(1);
    }

    auto list = std::make_unique<dom::List>(
        ordered ? dom::ListType::Ordered : dom::ListType::Unordered, start_number);
    context.push_element(*list);
    while (context.at(Token::ListItem)) {
        list->append_child(parse_list_item(context));
        while (context.at_blank()) {
            context.advance();
        }
    }
    context.pop_element();
    return list;
}

std::unique_ptr<dom::Element> Parser::parse_list_item(ParseContext& context) {
    const Token token = context.current();
    std::string marker;
    std::string checkbox;
    std::string text;
    if (!re2::RE2::PartialMatch(token.value, block_patterns().list_item,
                                &marker, &checkbox, &text)) {
        throw malformed("list item", token);
    }
    context.advance();

    const int level = marker.front() == '*' ? static_cast<int>(marker.size()) : 1;
    const bool is_checkbox = !checkbox.empty();
    const bool is_checked = is_checkbox &&
        (checkbox.find('x') != std::string::npos || checkbox.find('X') != std::string::npos);
    return std::make_unique<dom::ListItem>(detail::trim_copy(text), level, is_checkbox, is_checked);
}

std::unique_ptr<dom::Element> Parser::parse_description_list(ParseContext& context) {
    auto list = std::make_unique<dom::DescriptionList>();
    context.push_element(*list);
    while (context.at(Token::DescriptionListItem)) {
        list->append_child(parse_description_list_item(context));
        while (context.at_blank()) {
            context.advance();
        }
    }
    context.pop_element();
    return list;
}

std::unique_ptr<dom::Element> Parser::parse_description_list_item(ParseContext& context) {
    const Token token = context.current();
    std::string term;
    std::string description;
    if (!re2::RE2::PartialMatch(token.value, block_patterns().description_item,
                                &term, &description)) {
        throw malformed("description list item", token);
    }
    context.advance();
    return std::make_unique<dom::DescriptionListItem>(detail::trim_copy(term),
                                                      detail::trim_copy(description));
}

// ============================================================================
// Tables
// ============================================================================

std::unique_ptr<dom::Element> Parser::parse_table(ParseContext& context, bool header_row) {
    context.advance();

    auto table = std::make_unique<dom::Table>();
    bool header_pending = header_row;
    while (!context.at_end() && !context.at(Token::TableDelimiter)) {
        if (context.at(Token::TableRow)) {
            const std::vector<std::string> cells = split_table_row(context.current().value);
            if (header_pending) {
                auto header = std::make_unique<dom::TableHeader>();
                for (const auto& cell : cells) {
                    header->add_cell(std::make_unique<dom::TableCell>(cell, true));
                }
                table->set_header(std::move(header));
                header_pending = false;
            } else {
                auto row = std::make_unique<dom::TableRow>();
                for (const auto& cell : cells) {
                    row->add_cell(std::make_unique<dom::TableCell>(cell));
                }
                table->add_row(std::move(row));
            }
        }
        context.advance();
    }

    if (!context.accept(Token::TableDelimiter)) {
        report_unclosed(context, "table", Token::TableDelimiter);
    }
    return table;
}

// ============================================================================
// Delimited blocks
// ============================================================================

std::unique_ptr<dom::Element> Parser::parse_block_quote(ParseContext& context,
                                                        std::string attribution,
                                                        std::string cite) {
    context.advance();

    std::vector<std::string> lines;
    bool previous_newline = false;
    while (!context.at_end() && !context.at(Token::BlockQuoteDelimiter)) {
        const Token& token = context.current();
        if (context.at_blank()) {
            if (previous_newline || token.type == Token::EmptyLine) {
                lines.emplace_back();
            }
            previous_newline = true;
        } else {
            previous_newline = false;
            if (detail::starts_with(token.value, "-- ")) {
                attribution = detail::trim_copy(std::string_view(token.value).substr(3));
            } else {
                lines.push_back(token.value);
            }
        }
        context.advance();
    }

    if (!context.accept(Token::BlockQuoteDelimiter)) {
        report_unclosed(context, "block_quote", Token::BlockQuoteDelimiter);
    }

    std::string content;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) content += '\n';
        content += lines[i];
    }
    return std::make_unique<dom::BlockQuote>(detail::trim_copy(content),
                                             std::move(attribution), std::move(cite));
}

void Parser::parse_compound_body(ParseContext& context, dom::Element& block,
                                 Token::Type closing, const char* stage) {
    context.advance();
    context.push_element(block);
    while (!context.at_end() && !context.at(closing)) {
        const std::size_t before = context.consumed();
        if (auto child = parse_element(context)) {
            block.append_child(std::move(child));
        }
        if (context.consumed() == before) {
            context.advance();
        }
    }
    context.pop_element();

    if (!context.accept(closing)) {
        report_unclosed(context, stage, closing);
    }
}

std::unique_ptr<dom::Element> Parser::parse_sidebar(ParseContext& context) {
    auto sidebar = std::make_unique<dom::Sidebar>();
    parse_compound_body(context, *sidebar, Token::SidebarDelimiter, "sidebar");
    return sidebar;
}

std::unique_ptr<dom::Element> Parser::parse_example(ParseContext& context) {
    auto example = std::make_unique<dom::Example>();
    parse_compound_body(context, *example, Token::ExampleDelimiter, "example");
    return example;
}

std::unique_ptr<dom::Element> Parser::parse_open(ParseContext& context,
                                                 std::optional<std::string> masquerade_type) {
    auto open = std::make_unique<dom::Open>(std::nullopt, std::move(masquerade_type));
    parse_compound_body(context, *open, Token::OpenDelimiter, "open");
    return open;
}

std::unique_ptr<dom::CodeBlock> Parser::parse_code_block(ParseContext& context,
                                                         std::optional<std::string> language) {
    std::string delimiter_language;
    if (!language &&
        re2::RE2::PartialMatch(context.current().value, block_patterns().code_delimiter,
                               &delimiter_language)) {
        language = non_empty(delimiter_language);
    }
    context.advance();

    std::string content = collect_verbatim(context, Token::CodeBlockDelimiter);
    if (!context.accept(Token::CodeBlockDelimiter)) {
        report_unclosed(context, "code_block", Token::CodeBlockDelimiter);
    }
    return std::make_unique<dom::CodeBlock>(detail::trim_copy(content), std::move(language));
}

std::unique_ptr<dom::Verse> Parser::parse_verse(ParseContext& context) {
    const Token token = context.current();
    std::string author;
    std::string citation;
    if (!re2::RE2::PartialMatch(token.value, block_patterns().verse_attribute,
                                &author, &citation)) {
        throw malformed("verse attribute", token);
    }
    context.advance();
    while (context.at_blank()) {
        context.advance();
    }

    auto author_value = non_empty(detail::trim_copy(author));
    auto citation_value = non_empty(detail::trim_copy(citation));
    if (context.at(Token::BlockQuoteDelimiter) || context.at(Token::VerseDelimiter)) {
        return parse_verse_body(context, context.current().type,
                                std::move(author_value), std::move(citation_value));
    }
    if (context.at(Token::Text)) {
        return std::make_unique<dom::Verse>(detail::trim_newlines(collect_text_run(context)),
                                            std::nullopt, std::move(author_value),
                                            std::move(citation_value));
    }
    return nullptr;
}

std::unique_ptr<dom::Verse> Parser::parse_verse_body(ParseContext& context, Token::Type closing,
                                                     std::optional<std::string> author,
                                                     std::optional<std::string> citation) {
    context.advance();
    context.accept(Token::NewLine);

    std::string content = collect_verbatim(context, closing);
    if (!context.accept(closing)) {
        report_unclosed(context, "verse", closing);
    }

    if (!content.empty() && content.back() == '\n') content.pop_back();
    if (!content.empty() && content.back() == '\r') content.pop_back();
    return std::make_unique<dom::Verse>(std::move(content), std::nullopt,
                                        std::move(author), std::move(citation));
}

std::unique_ptr<dom::Literal> Parser::parse_literal(ParseContext& context) {
    context.advance();

    std::string content = collect_verbatim(context, Token::LiteralDelimiter);
    if (!context.accept(Token::LiteralDelimiter)) {
        report_unclosed(context, "literal", Token::LiteralDelimiter);
    }
    return std::make_unique<dom::Literal>(detail::trim_newlines(content));
}

std::unique_ptr<dom::Literal> Parser::parse_literal_attribute(ParseContext& context) {
    context.advance();
    while (context.at_blank()) {
        context.advance();
    }

    if (context.at(Token::LiteralDelimiter)) {
        return parse_literal(context);
    }
    if (context.at(Token::Text)) {
        return std::make_unique<dom::Literal>(detail::trim_newlines(collect_text_run(context)));
    }
    return std::make_unique<dom::Literal>("");
}

std::unique_ptr<dom::Listing> Parser::parse_listing_block(ParseContext& context) {
    std::string language;
    std::optional<std::string> language_value;
    if (re2::RE2::PartialMatch(context.current().value, block_patterns().code_delimiter,
                               &language)) {
        language_value = non_empty(language);
    }
    context.advance();

    std::string content = collect_verbatim(context, Token::CodeBlockDelimiter);
    if (!context.accept(Token::CodeBlockDelimiter)) {
        report_unclosed(context, "listing", Token::CodeBlockDelimiter);
    }
    return std::make_unique<dom::Listing>(detail::trim_newlines(content), std::nullopt,
                                          std::move(language_value));
}

std::unique_ptr<dom::Listing> Parser::parse_listing_attribute(ParseContext& context) {
    context.advance();
    while (context.at_blank()) {
        context.advance();
    }

    if (context.at(Token::CodeBlockDelimiter)) {
        return parse_listing_block(context);
    }
    if (context.at(Token::Text)) {
        return std::make_unique<dom::Listing>(detail::trim_newlines(collect_text_run(context)));
    }
    return std::make_unique<dom::Listing>("");
}

std::unique_ptr<dom::Passthrough> Parser::parse_passthrough(ParseContext& context) {
    context.advance();
    context.accept(Token::NewLine);

    std::string content = collect_verbatim(context, Token::PassthroughDelimiter);
    if (!context.accept(Token::PassthroughDelimiter)) {
        report_unclosed(context, "passthrough", Token::PassthroughDelimiter);
    }
    return std::make_unique<dom::Passthrough>(std::move(content));
}

std::unique_ptr<dom::Passthrough> Parser::parse_passthrough_attribute(ParseContext& context) {
    context.advance();
    while (context.at_blank()) {
        context.advance();
    }

    if (context.at(Token::PassthroughDelimiter)) {
        return parse_passthrough(context);
    }
    if (context.at(Token::Text)) {
        return std::make_unique<dom::Passthrough>(collect_text_run(context));
    }
    return std::make_unique<dom::Passthrough>("");
}

// ============================================================================
// Single-line blocks
// ============================================================================

std::unique_ptr<dom::Element> Parser::parse_admonition(ParseContext& context) {
    const Token token = context.current();
    std::string label;
    std::string content;
    if (!re2::RE2::PartialMatch(token.value, block_patterns().admonition, &label, &content)) {
        throw malformed("admonition", token);
    }
    auto type = dom::parse_admonition_type(label);
    if (!type) {
        throw malformed("admonition", token);
    }
    context.advance();
    return std::make_unique<dom::Admonition>(*type, detail::trim_copy(content));
}

std::unique_ptr<dom::Element> Parser::parse_table_of_contents(ParseContext& context) {
    const Token token = context.current();
    std::string raw;
    if (!re2::RE2::PartialMatch(token.value, block_patterns().table_of_contents, &raw)) {
        throw malformed("table of contents", token);
    }
    context.advance();

    const dom::Attributes parameters = parse_macro_parameters(detail::trim_view(raw));
    const std::string title = parameters.get_or("title", core::config::kDefaultTocTitle);
    int levels = core::config::kDefaultTocLevels;
    if (auto value = parameters.get("levels")) {
        levels = detail::parse_int(*value).value_or(core::config::kDefaultTocLevels);
    }
    return std::make_unique<dom::TableOfContents>(title, levels);
}

std::unique_ptr<dom::Element> Parser::parse_block_macro(ParseContext& context) {
    const Token token = context.current();
    std::string name;
    std::string target;
    std::string raw;
    if (!re2::RE2::PartialMatch(token.value, block_patterns().block_macro,
                                &name, &target, &raw)) {
        throw malformed("block macro", token);
    }
    context.advance();

    name = detail::trim_copy(name);
    target = detail::trim_copy(target);
    dom::Attributes parameters = parse_macro_parameters(detail::trim_view(raw));

    if (detail::iequals(name, "include")) {
        return expand_include(std::make_unique<dom::IncludeMacro>(
                                  target, std::move(parameters), dom::MacroType::Block),
                              context);
    }
    return create_macro(name, target, std::move(parameters), dom::MacroType::Block);
}

std::unique_ptr<dom::Element> Parser::create_macro(const std::string& name,
                                                   const std::string& target,
                                                   dom::Attributes parameters,
                                                   dom::MacroType type) {
    const std::string lowered = detail::to_lower_copy(name);
    if (lowered == "image") {
        return std::make_unique<dom::ImageMacro>(target, std::move(parameters), type);
    }
    if (lowered == "video") {
        return std::make_unique<dom::VideoMacro>(target, std::move(parameters), type);
    }
    if (lowered == "include") {
        return std::make_unique<dom::IncludeMacro>(target, std::move(parameters), type);
    }
    return std::make_unique<dom::Macro>(name, target, std::move(parameters), type);
}

std::unique_ptr<dom::Element> Parser::expand_include(std::unique_ptr<dom::IncludeMacro> macro,
                                                     ParseContext& context) {
    IncludeOutcome outcome = include_processor_->resolve(*macro, context);

    if (auto* failure = std::get_if<IncludeFailure>(&outcome)) {
        if (context.options().strict_includes) {
            throw core::ParseError(failure->message);
        }
        context.report(core::Severity::Error, "include", "include", failure->message);
        return macro;
    }

    auto& elements = std::get<IncludeResolved>(outcome).elements;
    if (elements.empty()) {
        return macro;
    }
    if (elements.size() == 1) {
        return std::move(elements.front());
    }

    auto container = std::make_unique<dom::Section>("", 0);
    for (auto& element : elements) {
        container->append_child(std::move(element));
    }
    return container;
}

// ============================================================================
// Attributes
// ============================================================================

void Parser::parse_attribute_line(ParseContext& context) {
    const Token token = context.current();
    context.advance();

    std::string name;
    std::string bang;
    std::string value;
    if (!re2::RE2::PartialMatch(token.value, block_patterns().attribute_line,
                                &name, &bang, &value)) {
        context.report(core::Severity::Warning, "parser", "attribute",
                       "Ignoring malformed attribute line: " + token.value);
        return;
    }

    value = detail::trim_copy(value);
    if (!bang.empty()) {
        value = "false";
    } else if (value.empty()) {
        value = "true";
    }
    context.global_attributes().set(detail::trim_copy(name), value);
}

std::unique_ptr<dom::Element> Parser::parse_attribute_block(ParseContext& context) {
    const Token token = context.current();
    std::string content;
    if (!re2::RE2::PartialMatch(token.value, block_patterns().attribute_block, &content)) {
        throw malformed("attribute block", token);
    }
    context.advance();
    while (context.at_blank()) {
        context.advance();
    }

    const dom::Attributes parameters = parse_macro_parameters(content);
    const std::string style = parameters.get_or("alt", "");

    std::unique_ptr<dom::Element> element;
    std::string language;
    if (context.at(Token::CodeBlockDelimiter) &&
        re2::RE2::PartialMatch(content, block_patterns().source_style, &language)) {
        element = parse_code_block(context, non_empty(language));
    } else if (context.at(Token::TableDelimiter)) {
        element = parse_table(context, requests_header_row(content, parameters));
    } else if (context.at(Token::BlockQuoteDelimiter) && detail::iequals(style, "quote")) {
        element = parse_block_quote(context, parameters.get_or("param1", ""),
                                    parameters.get_or("param2", ""));
    } else if (context.at(Token::OpenDelimiter)) {
        element = parse_open(context, non_empty(style));
    } else if (context.at(Token::Header)) {
        element = parse_section_title(context);
    } else if (context.at(Token::Text)) {
        if (auto type = dom::parse_admonition_type(style)) {
            const std::string text = detail::trim_copy(context.current().value);
            context.advance();
            element = std::make_unique<dom::Admonition>(*type, text);
        } else {
            element = parse_paragraph(context);
        }
    } else {
        auto paragraph = std::make_unique<dom::Paragraph>();
        paragraph->append_child(std::make_unique<dom::Text>(content));
        return paragraph;
    }

    apply_block_attributes(parameters, *element);
    return element;
}

void Parser::report_unclosed(ParseContext& context, const char* stage, Token::Type closing) const {
    context.report(core::Severity::Warning, "parser", stage,
                   std::string("Unclosed block: expected ") + token_type_name(closing) +
                       " before end of input");
}

} // namespace asciidoc::parser
