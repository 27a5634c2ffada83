#include <asciidoc/core/config.h>
#include <asciidoc/core/diagnostics.h>
#include <asciidoc/core/parse_error.h>
#include <asciidoc/dom/blocks.h>
#include <asciidoc/dom/document.h>
#include <asciidoc/dom/inlines.h>
#include <asciidoc/dom/macros.h>
#include <asciidoc/parser/parser.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace asciidoc;
using parser::Parser;

template<typename T>
static const T* child_as(const dom::Element& parent, size_t index) {
    return dom::element_cast<T>(parent.child_at(index));
}

static bool has_warning_containing(const core::DiagnosticEmitter& emitter, const std::string& text) {
    for (const auto& event : emitter.events_by_severity(core::Severity::Warning)) {
        if (event.message.find(text) != std::string::npos) return true;
    }
    return false;
}

// ============================================================================
// Document structure
// ============================================================================

// 1. Title line fills the header; sections and paragraphs follow
TEST(ParserDocument, TitleSectionsAndParagraphs) {
    Parser p;
    auto doc = p.parse("= Doc Title\n\n== Section One\n\nSome text.");
    EXPECT_EQ(doc->header().title, "Doc Title");
    ASSERT_EQ(doc->child_count(), 2u);

    const auto* section = child_as<dom::Section>(*doc, 0);
    ASSERT_NE(section, nullptr);
    EXPECT_EQ(section->title(), "Section One");
    EXPECT_EQ(section->level(), 2);

    const auto* paragraph = child_as<dom::Paragraph>(*doc, 1);
    ASSERT_NE(paragraph, nullptr);
    EXPECT_EQ(paragraph->text(), "Some text.");
}

// 2. Section level equals the number of '='
TEST(ParserDocument, SectionLevels) {
    Parser p;
    auto doc = p.parse("Intro\n\n== Two\n\n=== Three\n\n===== Five");
    ASSERT_EQ(doc->child_count(), 4u);
    EXPECT_EQ(child_as<dom::Section>(*doc, 1)->level(), 2);
    EXPECT_EQ(child_as<dom::Section>(*doc, 2)->level(), 3);
    EXPECT_EQ(child_as<dom::Section>(*doc, 3)->level(), 5);
    EXPECT_TRUE(doc->header().title.empty());
}

// 3. A level-1 heading later in the document is a section, not the title
TEST(ParserDocument, OnlyLeadingTitleIsHeader) {
    Parser p;
    auto doc = p.parse("Text first\n\n= Late Title");
    EXPECT_TRUE(doc->header().title.empty());
    ASSERT_EQ(doc->child_count(), 2u);
    EXPECT_EQ(child_as<dom::Section>(*doc, 1)->level(), 1);
}

// 4. Attribute entries become document attributes
TEST(ParserDocument, AttributeEntries) {
    Parser p;
    auto doc = p.parse("= Guide\n:author: Jane Doe\n:email: jane@example.org\n"
                       ":revnumber: 1.2\n:revdate: 2024-05-01\n:toc!:\n:sectnums:\n\nBody");
    const auto& attrs = doc->attributes();
    EXPECT_EQ(attrs.get_or("author", ""), "Jane Doe");
    EXPECT_EQ(attrs.get_or("toc", ""), "false");
    EXPECT_EQ(attrs.get_or("sectnums", ""), "true");

    const auto& header = doc->header();
    EXPECT_EQ(header.author, "Jane Doe");
    EXPECT_EQ(header.email, "jane@example.org");
    EXPECT_EQ(header.revision, "1.2");
    EXPECT_EQ(header.date, "2024-05-01");
    EXPECT_EQ(header.attributes.get_or("author", ""), "Jane Doe");

    ASSERT_EQ(doc->child_count(), 1u);
    EXPECT_NE(child_as<dom::Paragraph>(*doc, 0), nullptr);
}

// 5. Later entries overwrite earlier ones
TEST(ParserDocument, AttributeOverwrite) {
    Parser p;
    auto doc = p.parse(":product: Alpha\n:product: Beta\n");
    EXPECT_EQ(doc->attributes().get_or("product", ""), "Beta");
    EXPECT_EQ(doc->child_count(), 0u);
}

// 6. Paragraph inline content is parsed into spans
TEST(ParserDocument, ParagraphInlines) {
    Parser p;
    auto doc = p.parse("Hello *world* and _you_");
    const auto* paragraph = child_as<dom::Paragraph>(*doc, 0);
    ASSERT_NE(paragraph, nullptr);
    ASSERT_EQ(paragraph->child_count(), 4u);
    EXPECT_NE(child_as<dom::Strong>(*paragraph, 1), nullptr);
    EXPECT_NE(child_as<dom::Emphasis>(*paragraph, 3), nullptr);
    EXPECT_EQ(paragraph->text(), "Hello world and you");
}

// 7. Footnote labels run across the whole document
TEST(ParserDocument, FootnotesAcrossParagraphs) {
    Parser p;
    auto doc = p.parse("One footnote:[First].\n\nTwo footnote:[Second].");
    ASSERT_EQ(doc->child_count(), 2u);
    const auto* second = child_as<dom::Footnote>(*doc->child_at(1), 1);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->reference_label(), "2");
}

// ============================================================================
// Errors and diagnostics
// ============================================================================

// 8. Empty input is rejected
TEST(ParserErrors, EmptyInputThrows) {
    Parser p;
    EXPECT_THROW(p.parse(""), core::ParseError);
}

// 9. parse_file validates its path
TEST(ParserErrors, ParseFileMissing) {
    Parser p;
    EXPECT_THROW(p.parse_file(""), core::ParseError);
    try {
        p.parse_file("/nonexistent/dir/missing.adoc");
        FAIL() << "expected ParseError";
    } catch (const core::ParseError& error) {
        EXPECT_NE(error.message().find("File not found"), std::string::npos);
    }
}

// 10. A stray table row is reported and skipped
TEST(ParserErrors, StrayTableRow) {
    Parser p;
    auto doc = p.parse("|a |b");
    EXPECT_EQ(doc->child_count(), 0u);
    EXPECT_TRUE(has_warning_containing(p.diagnostics(), "Table row outside of a table"));
}

// 11. A summary info event is emitted per parse
TEST(ParserErrors, ParseSummaryEvent) {
    Parser p;
    p.parse("one\n\ntwo");
    auto infos = p.diagnostics().events_by_severity(core::Severity::Info);
    ASSERT_FALSE(infos.empty());
    EXPECT_EQ(infos.back().message, "Parsed 2 top-level elements");
}

// 12. Diagnostics are reset between parses
TEST(ParserErrors, DiagnosticsResetPerParse) {
    Parser p;
    p.parse("|stray");
    EXPECT_TRUE(has_warning_containing(p.diagnostics(), "Table row"));
    p.parse("clean");
    EXPECT_FALSE(has_warning_containing(p.diagnostics(), "Table row"));
}

// ============================================================================
// parse_element
// ============================================================================

// 13. First block of a fragment
TEST(ParserElement, FirstBlock) {
    Parser p;
    auto element = p.parse_element("\n\n== Title\n\nText");
    ASSERT_NE(element, nullptr);
    const auto* section = dom::element_cast<dom::Section>(element.get());
    ASSERT_NE(section, nullptr);
    EXPECT_EQ(section->title(), "Title");
}

// 14. Nothing to parse gives nullptr
TEST(ParserElement, EmptyGivesNull) {
    Parser p;
    EXPECT_EQ(p.parse_element(""), nullptr);
    EXPECT_EQ(p.parse_element("\n\n"), nullptr);
}

// ============================================================================
// Lists
// ============================================================================

// 15. Unordered list with nesting levels
TEST(ParserLists, Unordered) {
    Parser p;
    auto doc = p.parse("* one\n* two\n** nested");
    ASSERT_EQ(doc->child_count(), 1u);
    const auto* list = child_as<dom::List>(*doc, 0);
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->type(), dom::ListType::Unordered);
    ASSERT_EQ(list->child_count(), 3u);
    EXPECT_EQ(child_as<dom::ListItem>(*list, 0)->text(), "one");
    EXPECT_EQ(child_as<dom::ListItem>(*list, 0)->level(), 1);
    EXPECT_EQ(child_as<dom::ListItem>(*list, 2)->level(), 2);
}

// 16. Ordered list keeps its start number
TEST(ParserLists, OrderedStartNumber) {
    Parser p;
    auto doc = p.parse("3. three\n4. four");
    const auto* list = child_as<dom::List>(*doc, 0);
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->type(), dom::ListType::Ordered);
    EXPECT_EQ(list->start_number(), 3);
    EXPECT_EQ(list->child_count(), 2u);
}

// 17. Checkbox items
TEST(ParserLists, Checkboxes) {
    Parser p;
    auto doc = p.parse("* [x] done\n* [ ] todo\n* plain");
    const auto* list = child_as<dom::List>(*doc, 0);
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->child_count(), 3u);

    const auto* done = child_as<dom::ListItem>(*list, 0);
    EXPECT_TRUE(done->is_checkbox());
    EXPECT_TRUE(done->is_checked());
    EXPECT_EQ(done->text(), "done");

    const auto* todo = child_as<dom::ListItem>(*list, 1);
    EXPECT_TRUE(todo->is_checkbox());
    EXPECT_FALSE(todo->is_checked());

    EXPECT_FALSE(child_as<dom::ListItem>(*list, 2)->is_checkbox());
}

// 18. Blank lines between items do not split the list
TEST(ParserLists, BlankLinesBetweenItems) {
    Parser p;
    auto doc = p.parse("* a\n\n* b\n\nAfter");
    ASSERT_EQ(doc->child_count(), 2u);
    EXPECT_EQ(child_as<dom::List>(*doc, 0)->child_count(), 2u);
    EXPECT_NE(child_as<dom::Paragraph>(*doc, 1), nullptr);
}

// 19. Description list
TEST(ParserLists, DescriptionList) {
    Parser p;
    auto doc = p.parse("CPU:: The processor\nRAM:: Memory");
    const auto* list = child_as<dom::DescriptionList>(*doc, 0);
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->child_count(), 2u);
    const auto* item = child_as<dom::DescriptionListItem>(*list, 0);
    EXPECT_EQ(item->term(), "CPU");
    EXPECT_EQ(item->description(), "The processor");
}

// ============================================================================
// Tables
// ============================================================================

// 20. Rows split on '|' into cells
TEST(ParserTables, BodyRows) {
    Parser p;
    auto doc = p.parse("|===\n|A |B |C\n|1 |2 |3\n|===");
    const auto* table = child_as<dom::Table>(*doc, 0);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->header(), nullptr);
    ASSERT_EQ(table->child_count(), 2u);
    const auto* row = child_as<dom::TableRow>(*table, 0);
    ASSERT_EQ(row->child_count(), 3u);
    EXPECT_EQ(child_as<dom::TableCell>(*row, 0)->content(), "A");
    EXPECT_EQ(child_as<dom::TableCell>(*row, 2)->content(), "C");
}

// 21. options="header" turns the first row into the header
TEST(ParserTables, HeaderOption) {
    Parser p;
    auto doc = p.parse("[options=\"header\"]\n|===\n|Name |Age\n|Ann |30\n|===");
    const auto* table = child_as<dom::Table>(*doc, 0);
    ASSERT_NE(table, nullptr);
    ASSERT_NE(table->header(), nullptr);
    ASSERT_EQ(table->header()->child_count(), 2u);
    EXPECT_TRUE(child_as<dom::TableCell>(*table->header(), 0)->is_header());
    EXPECT_EQ(child_as<dom::TableCell>(*table->header(), 1)->content(), "Age");
    EXPECT_EQ(table->child_count(), 1u);
}

// 22. The %header shorthand works too
TEST(ParserTables, HeaderShorthand) {
    Parser p;
    auto doc = p.parse("[%header]\n|===\n|H1 |H2\n|v1 |v2\n|===");
    const auto* table = child_as<dom::Table>(*doc, 0);
    ASSERT_NE(table, nullptr);
    EXPECT_NE(table->header(), nullptr);
}

// 23. Unclosed table keeps its rows and warns
TEST(ParserTables, Unclosed) {
    Parser p;
    auto doc = p.parse("|===\n|x |y");
    const auto* table = child_as<dom::Table>(*doc, 0);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->child_count(), 1u);
    EXPECT_TRUE(has_warning_containing(p.diagnostics(), "Unclosed block"));
}

// ============================================================================
// Delimited blocks
// ============================================================================

// 24. Block quote with attribution line
TEST(ParserBlocks, BlockQuoteAttribution) {
    Parser p;
    auto doc = p.parse("____\nTo be, or not to be.\n-- Hamlet\n____");
    const auto* quote = child_as<dom::BlockQuote>(*doc, 0);
    ASSERT_NE(quote, nullptr);
    EXPECT_EQ(quote->content(), "To be, or not to be.");
    EXPECT_EQ(quote->attribution(), "Hamlet");
}

// 25. [quote, author, source] fills attribution and cite
TEST(ParserBlocks, QuoteAttributeBlock) {
    Parser p;
    auto doc = p.parse("[quote, Abraham Lincoln, Gettysburg Address]\n____\nFour score\n____");
    const auto* quote = child_as<dom::BlockQuote>(*doc, 0);
    ASSERT_NE(quote, nullptr);
    EXPECT_EQ(quote->content(), "Four score");
    EXPECT_EQ(quote->attribution(), "Abraham Lincoln");
    EXPECT_EQ(quote->cite(), "Gettysburg Address");
    EXPECT_EQ(quote->attributes().get_or("style", ""), "quote");
}

// 26. Unclosed quote keeps its content and warns
TEST(ParserBlocks, UnclosedBlockQuote) {
    Parser p;
    auto doc = p.parse("____\nunterminated");
    ASSERT_EQ(doc->child_count(), 1u);
    const auto* quote = child_as<dom::BlockQuote>(*doc, 0);
    ASSERT_NE(quote, nullptr);
    EXPECT_EQ(quote->content(), "unterminated");
    EXPECT_TRUE(has_warning_containing(p.diagnostics(),
                                       "Unclosed block: expected BlockQuoteDelimiter"));
}

// 27. Sidebar, example and open blocks hold nested blocks
TEST(ParserBlocks, CompoundBlocks) {
    Parser p;
    auto doc = p.parse("****\nIn a sidebar\n****\n\n====\n* item\n====\n\n--\nOpen text\n--");
    ASSERT_EQ(doc->child_count(), 3u);

    const auto* sidebar = child_as<dom::Sidebar>(*doc, 0);
    ASSERT_NE(sidebar, nullptr);
    ASSERT_EQ(sidebar->child_count(), 1u);
    EXPECT_NE(child_as<dom::Paragraph>(*sidebar, 0), nullptr);

    const auto* example = child_as<dom::Example>(*doc, 1);
    ASSERT_NE(example, nullptr);
    EXPECT_NE(child_as<dom::List>(*example, 0), nullptr);

    const auto* open = child_as<dom::Open>(*doc, 2);
    ASSERT_NE(open, nullptr);
    EXPECT_FALSE(open->masquerade_type().has_value());
    EXPECT_EQ(open->child_count(), 1u);
}

// 28. Compound blocks nest
TEST(ParserBlocks, NestedCompound) {
    Parser p;
    auto doc = p.parse("====\n****\nDeep\n****\n====");
    const auto* example = child_as<dom::Example>(*doc, 0);
    ASSERT_NE(example, nullptr);
    const auto* sidebar = child_as<dom::Sidebar>(*example, 0);
    ASSERT_NE(sidebar, nullptr);
    EXPECT_EQ(sidebar->text_content(), "Deep");
}

// 29. A style before an open block becomes its masquerade type
TEST(ParserBlocks, OpenMasquerade) {
    Parser p;
    auto doc = p.parse("[abstract]\n--\nSummary\n--");
    const auto* open = child_as<dom::Open>(*doc, 0);
    ASSERT_NE(open, nullptr);
    ASSERT_TRUE(open->masquerade_type().has_value());
    EXPECT_EQ(*open->masquerade_type(), "abstract");
}

// 30. Unclosed sidebar warns and keeps children
TEST(ParserBlocks, UnclosedSidebar) {
    Parser p;
    auto doc = p.parse("****\ninside");
    const auto* sidebar = child_as<dom::Sidebar>(*doc, 0);
    ASSERT_NE(sidebar, nullptr);
    EXPECT_EQ(sidebar->child_count(), 1u);
    EXPECT_TRUE(has_warning_containing(p.diagnostics(), "SidebarDelimiter"));
}

// ============================================================================
// Verbatim blocks
// ============================================================================

// 31. [source,lang] code block
TEST(ParserVerbatim, SourceCodeBlock) {
    Parser p;
    auto doc = p.parse("[source,python]\n----\nprint('hi')\n----");
    const auto* code = child_as<dom::CodeBlock>(*doc, 0);
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->content(), "print('hi')");
    ASSERT_TRUE(code->language().has_value());
    EXPECT_EQ(*code->language(), "python");
}

// 32. Language on the delimiter
TEST(ParserVerbatim, DelimiterLanguage) {
    Parser p;
    auto doc = p.parse("----ruby\nputs 1\n----");
    const auto* code = child_as<dom::CodeBlock>(*doc, 0);
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->content(), "puts 1");
    EXPECT_EQ(code->language().value_or(""), "ruby");
}

// 33. Block lines inside a code block are kept verbatim
TEST(ParserVerbatim, CodeBlockIsVerbatim) {
    Parser p;
    auto doc = p.parse("----\n== not a section\n* not a list\n----");
    ASSERT_EQ(doc->child_count(), 1u);
    const auto* code = child_as<dom::CodeBlock>(*doc, 0);
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->content(), "== not a section\n* not a list");
    EXPECT_FALSE(code->language().has_value());
}

// 34. Literal block keeps indentation
TEST(ParserVerbatim, LiteralIndentation) {
    Parser p;
    auto doc = p.parse("....\n  indented\nflush\n....");
    const auto* literal = child_as<dom::Literal>(*doc, 0);
    ASSERT_NE(literal, nullptr);
    EXPECT_EQ(literal->content(), "  indented\nflush");
}

// 35. [literal] paragraph
TEST(ParserVerbatim, LiteralAttribute) {
    Parser p;
    auto doc = p.parse("[literal]\nerror: 1 failure");
    const auto* literal = child_as<dom::Literal>(*doc, 0);
    ASSERT_NE(literal, nullptr);
    EXPECT_EQ(literal->content(), "error: 1 failure");
}

// 36. [listing] over a delimited block
TEST(ParserVerbatim, ListingAttribute) {
    Parser p;
    auto doc = p.parse("[listing]\n----\nls -la\n----");
    const auto* listing = child_as<dom::Listing>(*doc, 0);
    ASSERT_NE(listing, nullptr);
    EXPECT_EQ(listing->content(), "ls -la");
}

// 37. Verse with author and citation
TEST(ParserVerbatim, Verse) {
    Parser p;
    auto doc = p.parse("[verse, Carl Sandburg, Fog]\n____\nThe fog comes\non little cat feet.\n____");
    const auto* verse = child_as<dom::Verse>(*doc, 0);
    ASSERT_NE(verse, nullptr);
    EXPECT_EQ(verse->content(), "The fog comes\non little cat feet.");
    EXPECT_EQ(verse->author().value_or(""), "Carl Sandburg");
    EXPECT_EQ(verse->citation().value_or(""), "Fog");
}

// 38. [verse] over a plain paragraph
TEST(ParserVerbatim, VerseParagraph) {
    Parser p;
    auto doc = p.parse("[verse]\nRoses are red\nViolets are blue");
    const auto* verse = child_as<dom::Verse>(*doc, 0);
    ASSERT_NE(verse, nullptr);
    EXPECT_EQ(verse->content(), "Roses are red\nViolets are blue");
    EXPECT_FALSE(verse->author().has_value());
}

// 39. Passthrough content is raw
TEST(ParserVerbatim, Passthrough) {
    Parser p;
    auto doc = p.parse("++++\n<b>raw</b>\n++++");
    const auto* pass = child_as<dom::Passthrough>(*doc, 0);
    ASSERT_NE(pass, nullptr);
    EXPECT_EQ(pass->content(), "<b>raw</b>\n");
}

// 40. [pass] paragraph
TEST(ParserVerbatim, PassthroughAttribute) {
    Parser p;
    auto doc = p.parse("[pass]\n<u>under</u>");
    const auto* pass = child_as<dom::Passthrough>(*doc, 0);
    ASSERT_NE(pass, nullptr);
    EXPECT_EQ(pass->content(), "<u>under</u>");
}

// ============================================================================
// Single-line blocks
// ============================================================================

// 41. Admonition paragraph
TEST(ParserSingleLine, Admonition) {
    Parser p;
    auto doc = p.parse("NOTE: Remember this.");
    const auto* admonition = child_as<dom::Admonition>(*doc, 0);
    ASSERT_NE(admonition, nullptr);
    EXPECT_EQ(admonition->type(), dom::AdmonitionType::Note);
    EXPECT_EQ(admonition->content(), "Remember this.");
}

// 42. [WARNING] style over a paragraph
TEST(ParserSingleLine, AdmonitionStyle) {
    Parser p;
    auto doc = p.parse("[WARNING]\nCareful now");
    const auto* admonition = child_as<dom::Admonition>(*doc, 0);
    ASSERT_NE(admonition, nullptr);
    EXPECT_EQ(admonition->type(), dom::AdmonitionType::Warning);
    EXPECT_EQ(admonition->content(), "Careful now");
}

// 43. Block id from [#name]
TEST(ParserSingleLine, BlockIdAttribute) {
    Parser p;
    auto doc = p.parse("[#setup]\n== Setup Steps");
    const auto* section = child_as<dom::Section>(*doc, 0);
    ASSERT_NE(section, nullptr);
    EXPECT_EQ(section->anchor_id(), "setup");
}

// 44. Table of contents defaults
TEST(ParserSingleLine, TocDefaults) {
    Parser p;
    auto doc = p.parse("toc::[]");
    const auto* toc = child_as<dom::TableOfContents>(*doc, 0);
    ASSERT_NE(toc, nullptr);
    EXPECT_EQ(toc->title(), core::config::kDefaultTocTitle);
    EXPECT_EQ(toc->max_depth(), 3);
    EXPECT_TRUE(toc->entries().empty());
}

// 45. Table of contents parameters
TEST(ParserSingleLine, TocParameters) {
    Parser p;
    auto doc = p.parse("toc::[title=\"Contents\", levels=2]");
    const auto* toc = child_as<dom::TableOfContents>(*doc, 0);
    ASSERT_NE(toc, nullptr);
    EXPECT_EQ(toc->title(), "Contents");
    EXPECT_EQ(toc->max_depth(), 2);
}

// 46. Table of contents is filled from the sections, nested by level
TEST(ParserSingleLine, TocEntries) {
    Parser p;
    auto doc = p.parse("toc::[]\n\n== Intro\n\n=== Detail\n\n==== Too Deep\n\n== Usage");
    const auto* toc = child_as<dom::TableOfContents>(*doc, 0);
    ASSERT_NE(toc, nullptr);
    ASSERT_EQ(toc->entries().size(), 2u);
    const auto& intro = toc->entries()[0];
    EXPECT_EQ(intro.title, "Intro");
    EXPECT_EQ(intro.anchor_id, "intro");
    ASSERT_EQ(intro.children.size(), 1u);
    EXPECT_EQ(intro.children[0].title, "Detail");
    EXPECT_TRUE(intro.children[0].children.empty());
    EXPECT_EQ(toc->entries()[1].title, "Usage");
}

// 47. levels limits the depth of entries
TEST(ParserSingleLine, TocLevelsLimit) {
    Parser p;
    auto doc = p.parse("toc::[levels=2]\n\n== Intro\n\n=== Detail");
    const auto* toc = child_as<dom::TableOfContents>(*doc, 0);
    ASSERT_NE(toc, nullptr);
    ASSERT_EQ(toc->entries().size(), 1u);
    EXPECT_TRUE(toc->entries()[0].children.empty());
}

// ============================================================================
// Block macros
// ============================================================================

// 48. Image block macro with parameters
TEST(ParserMacros, ImageBlock) {
    Parser p;
    auto doc = p.parse("image::diagram.png[Architecture, width=400]");
    const auto* image = child_as<dom::ImageMacro>(*doc, 0);
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->source(), "diagram.png");
    EXPECT_EQ(image->alt(), "Architecture");
    EXPECT_EQ(image->width().value_or(0), 400);
    EXPECT_EQ(image->macro_type(), dom::MacroType::Block);
}

// 49. Video block macro
TEST(ParserMacros, VideoBlock) {
    Parser p;
    auto doc = p.parse("video::intro.webm[autoplay=true]");
    const auto* video = child_as<dom::VideoMacro>(*doc, 0);
    ASSERT_NE(video, nullptr);
    EXPECT_EQ(video->video_format(), "webm");
    EXPECT_TRUE(video->autoplay());
}

// 50. Unknown macro names stay generic
TEST(ParserMacros, GenericBlock) {
    Parser p;
    auto doc = p.parse("chart::data.csv[type=bar]");
    const auto* macro = child_as<dom::Macro>(*doc, 0);
    ASSERT_NE(macro, nullptr);
    EXPECT_EQ(macro->name(), "chart");
    EXPECT_EQ(macro->target(), "data.csv");
    EXPECT_EQ(macro->parameters().get_or("type", ""), "bar");
}
