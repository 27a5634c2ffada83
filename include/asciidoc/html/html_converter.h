#pragma once
#include <asciidoc/core/config.h>
#include <asciidoc/dom/blocks.h>
#include <asciidoc/dom/document.h>
#include <asciidoc/dom/element.h>
#include <asciidoc/dom/inlines.h>
#include <asciidoc/dom/macros.h>
#include <asciidoc/dom/visitor.h>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace asciidoc::html {

struct HtmlOptions {
    // Wrap the body in <!DOCTYPE html><html>...; false gives a fragment.
    bool standalone = true;
    // Multi-line page with an embedded stylesheet; false gives a one-line
    // page shell.
    bool pretty_print = true;
    std::string encoding = core::config::kDefaultHtmlEncoding;
};

// Renders a document tree as HTML. One converter can be reused for several
// documents; convert() resets its state.
class HtmlConverter : public dom::DocumentVisitor {
public:
    HtmlConverter();
    explicit HtmlConverter(HtmlOptions options);

    std::string convert(const dom::Document& document);
    // Markup of one element and its descendants, never wrapped in a page.
    std::string convert_element(const dom::Element& element);

    const HtmlOptions& options() const { return options_; }

    // Escapes & < > " and '.
    static std::string escape_html(std::string_view text);

    void visit(const dom::Document& node) override;

    void visit(const dom::Section& node) override;
    void visit(const dom::Paragraph& node) override;
    void visit(const dom::List& node) override;
    void visit(const dom::ListItem& node) override;
    void visit(const dom::DescriptionList& node) override;
    void visit(const dom::DescriptionListItem& node) override;
    void visit(const dom::Table& node) override;
    void visit(const dom::TableHeader& node) override;
    void visit(const dom::TableRow& node) override;
    void visit(const dom::TableCell& node) override;
    void visit(const dom::CodeBlock& node) override;
    void visit(const dom::Listing& node) override;
    void visit(const dom::Literal& node) override;
    void visit(const dom::Verse& node) override;
    void visit(const dom::Passthrough& node) override;
    void visit(const dom::BlockQuote& node) override;
    void visit(const dom::Sidebar& node) override;
    void visit(const dom::Example& node) override;
    void visit(const dom::Open& node) override;
    void visit(const dom::Admonition& node) override;
    void visit(const dom::TableOfContents& node) override;

    void visit(const dom::Macro& node) override;
    void visit(const dom::ImageMacro& node) override;
    void visit(const dom::VideoMacro& node) override;
    void visit(const dom::IncludeMacro& node) override;

    void visit(const dom::Text& node) override;
    void visit(const dom::Emphasis& node) override;
    void visit(const dom::Strong& node) override;
    void visit(const dom::Highlight& node) override;
    void visit(const dom::Superscript& node) override;
    void visit(const dom::Subscript& node) override;
    void visit(const dom::InlineCode& node) override;
    void visit(const dom::Link& node) override;
    void visit(const dom::Image& node) override;
    void visit(const dom::Anchor& node) override;
    void visit(const dom::CrossReference& node) override;
    void visit(const dom::Footnote& node) override;

private:
    struct FootnoteDefinition {
        std::string label;
        std::string text;
    };

    HtmlOptions options_;
    std::ostringstream out_;
    std::vector<const dom::Element*> element_stack_;
    std::vector<FootnoteDefinition> footnotes_;

    void reset();
    void convert_node(const dom::Element& element);
    void convert_children(const dom::Element& element);
    void write_header(const dom::DocumentHeader& header);
    void write_footnotes();
    void write_toc_entry(const dom::TableOfContentsEntry& entry);
    void write_compound(const dom::CompoundBlock& block, const std::string& css_class);
    void write_title(const std::optional<std::string>& title);
    std::string wrap_document(const std::string& body, const dom::Document& document) const;
};

} // namespace asciidoc::html
