#include <asciidoc/html/html_converter.h>

#include <algorithm>
#include <cctype>

namespace asciidoc::html {

namespace {

constexpr char kStylesheet[] = R"(    <style>
        body { font-family: serif; line-height: 1.6; margin: 2rem; }
        .author, .email, .revision { color: #666; font-style: italic; }
        pre { background: #f4f4f4; padding: 1rem; overflow-x: auto; }
        code { background: #f4f4f4; padding: 0.2rem; }
        table.tableblock { border-collapse: collapse; width: 100%; margin: 1rem 0; }
        table.tableblock th, table.tableblock td { border: 1px solid #ddd; padding: 0.5rem; text-align: left; }
        table.tableblock th { background-color: #f5f5f5; font-weight: bold; }
        .halign-center { text-align: center; }
        .halign-right { text-align: right; }
        blockquote { margin: 1rem 2rem; padding: 0.5rem 1rem; border-left: 4px solid #ddd; background-color: #f9f9f9; }
        blockquote cite { display: block; margin-top: 0.5rem; font-style: italic; text-align: right; }
        .admonitionblock { margin: 1rem 0; }
        .admonitionblock table { border: 0; background: none; width: 100%; }
        .admonitionblock td.icon { width: 80px; vertical-align: top; text-align: center; }
        .admonitionblock td.content { padding-left: 1rem; }
        .admonitionblock.note { background-color: #e7f4fd; border-left: 4px solid #2196f3; }
        .admonitionblock.tip { background-color: #e8f5e8; border-left: 4px solid #4caf50; }
        .admonitionblock.important { background-color: #fff8e1; border-left: 4px solid #ff9800; }
        .admonitionblock.warning { background-color: #fff3e0; border-left: 4px solid #ff5722; }
        .admonitionblock.caution { background-color: #ffebee; border-left: 4px solid #f44336; }
        .admonitionblock .title { font-weight: bold; }
        .sidebarblock, .exampleblock, .openblock { margin: 1rem 0; }
        .sidebarblock { background-color: #f8f8f7; border: 1px solid #e0e0dc; padding: 1rem; }
        .exampleblock > .content { border: 1px solid #e6e6e6; padding: 1rem; }
        .verseblock pre { background: none; font-family: serif; }
        .xref { color: #2196f3; text-decoration: none; }
        .xref:hover { text-decoration: underline; }
        .align-left { text-align: left; }
        .align-center { text-align: center; }
        .align-right { text-align: right; }
        .video-title { font-style: italic; margin-top: 0.5rem; text-align: center; }
        .macro { display: inline-block; background-color: #f0f0f0; padding: 0.2rem 0.4rem; border-radius: 3px; font-family: monospace; font-size: 0.9em; }
        video { max-width: 100%; height: auto; }
        img { max-width: 100%; height: auto; }
    </style>
)";

std::string to_lower_ascii(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lowered;
}

} // namespace

HtmlConverter::HtmlConverter() : HtmlConverter(HtmlOptions{}) {}

HtmlConverter::HtmlConverter(HtmlOptions options) : options_(std::move(options)) {}

std::string HtmlConverter::escape_html(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  escaped += "&amp;"; break;
            case '<':  escaped += "&lt;"; break;
            case '>':  escaped += "&gt;"; break;
            case '"':  escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

void HtmlConverter::reset() {
    out_.str(std::string());
    out_.clear();
    element_stack_.clear();
    footnotes_.clear();
}

std::string HtmlConverter::convert(const dom::Document& document) {
    reset();
    convert_node(document);
    const std::string body = out_.str();
    if (!options_.standalone) {
        return body;
    }
    return wrap_document(body, document);
}

std::string HtmlConverter::convert_element(const dom::Element& element) {
    reset();
    convert_node(element);
    return out_.str();
}

void HtmlConverter::convert_node(const dom::Element& element) {
    element_stack_.push_back(&element);
    element.accept(*this);
    element_stack_.pop_back();
}

void HtmlConverter::convert_children(const dom::Element& element) {
    element.for_each_child([this](const dom::Element& child) { convert_node(child); });
}

std::string HtmlConverter::wrap_document(const std::string& body,
                                         const dom::Document& document) const {
    const std::string& title = document.header().title;
    const std::string page_title =
        escape_html(title.empty() ? std::string(core::config::kDefaultHtmlTitle) : title);

    std::ostringstream page;
    if (options_.pretty_print) {
        page << "<!DOCTYPE html>\n"
             << "<html>\n"
             << "<head>\n"
             << "    <meta charset=\"" << escape_html(options_.encoding) << "\">\n"
             << "    <title>" << page_title << "</title>\n"
             << kStylesheet
             << "</head>\n"
             << "<body>\n"
             << body
             << "</body>\n"
             << "</html>\n";
    } else {
        page << "<!DOCTYPE html><html><head><meta charset=\"" << escape_html(options_.encoding)
             << "\"><title>" << page_title << "</title></head><body>" << body
             << "</body></html>";
    }
    return page.str();
}

// ============================================================================
// Document structure
// ============================================================================

void HtmlConverter::visit(const dom::Document& node) {
    write_header(node.header());
    convert_children(node);
    write_footnotes();
}

void HtmlConverter::write_header(const dom::DocumentHeader& header) {
    if (!header.title.empty()) {
        out_ << "<h1>" << escape_html(header.title) << "</h1>\n";
    }
    if (!header.author.empty()) {
        out_ << "<div class=\"author\">" << escape_html(header.author) << "</div>\n";
    }
    if (!header.email.empty()) {
        out_ << "<div class=\"email\"><a href=\"mailto:" << escape_html(header.email) << "\">"
             << escape_html(header.email) << "</a></div>\n";
    }
    if (!header.revision.empty() || !header.date.empty()) {
        std::string revision = header.revision;
        if (!header.date.empty()) {
            revision += revision.empty() ? header.date : ", " + header.date;
        }
        out_ << "<div class=\"revision\">" << escape_html(revision) << "</div>\n";
    }
}

void HtmlConverter::write_footnotes() {
    if (footnotes_.empty()) return;

    out_ << "<div id=\"footnotes\">\n<hr>\n";
    for (const auto& footnote : footnotes_) {
        out_ << "<div class=\"footnote\" id=\"_footnotedef_" << escape_html(footnote.label) << "\">"
             << "<a href=\"#_footnoteref_" << escape_html(footnote.label) << "\">"
             << escape_html(footnote.label) << "</a>. " << escape_html(footnote.text)
             << "</div>\n";
    }
    out_ << "</div>\n";
}

void HtmlConverter::visit(const dom::Section& node) {
    if (!node.title().empty()) {
        const int level = std::min(node.level() + 1, 6);
        out_ << "<h" << level << " id=\"" << escape_html(node.anchor_id()) << "\">"
             << escape_html(node.title()) << "</h" << level << ">\n";
    }
    convert_children(node);
}

void HtmlConverter::visit(const dom::Paragraph& node) {
    out_ << "<p>";
    if (node.child_count() > 0) {
        convert_children(node);
    } else {
        out_ << escape_html(node.text());
    }
    out_ << "</p>\n";
}

// ============================================================================
// Lists
// ============================================================================

void HtmlConverter::visit(const dom::List& node) {
    const bool ordered = node.type() == dom::ListType::Ordered;
    const char* tag = ordered ? "ol" : "ul";
    out_ << '<' << tag;
    if (ordered && node.start_number() > 1) {
        out_ << " start=\"" << node.start_number() << '"';
    }
    out_ << ">\n";
    convert_children(node);
    out_ << "</" << tag << ">\n";
}

void HtmlConverter::visit(const dom::ListItem& node) {
    out_ << "<li>";
    if (node.is_checkbox()) {
        out_ << "<input type=\"checkbox\" disabled" << (node.is_checked() ? " checked" : "") << "> ";
    }
    out_ << escape_html(node.text());
    convert_children(node);
    out_ << "</li>\n";
}

void HtmlConverter::visit(const dom::DescriptionList& node) {
    out_ << "<dl>\n";
    convert_children(node);
    out_ << "</dl>\n";
}

void HtmlConverter::visit(const dom::DescriptionListItem& node) {
    out_ << "<dt>" << escape_html(node.term()) << "</dt>\n";
    out_ << "<dd>" << escape_html(node.description()) << "</dd>\n";
}

// ============================================================================
// Tables
// ============================================================================

void HtmlConverter::visit(const dom::Table& node) {
    out_ << "<table class=\"tableblock frame-all grid-all\">\n";
    if (const auto* header = node.header()) {
        out_ << "<thead>\n";
        convert_node(*header);
        out_ << "</thead>\n";
    }
    if (node.child_count() > 0) {
        out_ << "<tbody>\n";
        convert_children(node);
        out_ << "</tbody>\n";
    }
    out_ << "</table>\n";
}

void HtmlConverter::visit(const dom::TableHeader& node) {
    out_ << "<tr>";
    convert_children(node);
    out_ << "</tr>\n";
}

void HtmlConverter::visit(const dom::TableRow& node) {
    out_ << "<tr>";
    convert_children(node);
    out_ << "</tr>\n";
}

void HtmlConverter::visit(const dom::TableCell& node) {
    bool header = node.is_header();
    if (element_stack_.size() >= 2) {
        const dom::Element* parent = element_stack_[element_stack_.size() - 2];
        if (parent->kind() == dom::ElementKind::TableHeader) {
            header = true;
        } else if (const auto* row = dom::element_cast<dom::TableRow>(parent)) {
            header = header || row->is_header();
        }
    }

    const char* tag = header ? "th" : "td";
    out_ << '<' << tag;
    if (node.col_span() > 1) out_ << " colspan=\"" << node.col_span() << '"';
    if (node.row_span() > 1) out_ << " rowspan=\"" << node.row_span() << '"';
    if (!node.alignment().empty()) out_ << " class=\"halign-" << escape_html(node.alignment()) << '"';
    out_ << '>' << escape_html(node.content()) << "</" << tag << '>';
}

// ============================================================================
// Verbatim blocks
// ============================================================================

void HtmlConverter::visit(const dom::CodeBlock& node) {
    out_ << "<pre><code";
    if (node.language() && !node.language()->empty()) {
        out_ << " class=\"language-" << escape_html(*node.language()) << '"';
    }
    out_ << '>' << escape_html(node.content()) << "</code></pre>\n";
}

void HtmlConverter::write_title(const std::optional<std::string>& title) {
    if (title && !title->empty()) {
        out_ << "<div class=\"title\">" << escape_html(*title) << "</div>\n";
    }
}

void HtmlConverter::visit(const dom::Listing& node) {
    out_ << "<div class=\"listingblock\">\n";
    write_title(node.title());
    out_ << "<div class=\"content\">\n<pre>";
    if (node.language() && !node.language()->empty()) {
        out_ << "<code class=\"language-" << escape_html(*node.language()) << "\">"
             << escape_html(node.content()) << "</code>";
    } else {
        out_ << escape_html(node.content());
    }
    out_ << "</pre>\n</div>\n</div>\n";
}

void HtmlConverter::visit(const dom::Literal& node) {
    out_ << "<div class=\"literalblock\">\n";
    write_title(node.title());
    out_ << "<div class=\"content\">\n<pre>" << escape_html(node.content()) << "</pre>\n</div>\n</div>\n";
}

void HtmlConverter::visit(const dom::Verse& node) {
    out_ << "<div class=\"verseblock\">\n";
    write_title(node.title());
    out_ << "<pre class=\"content\">" << escape_html(node.content()) << "</pre>\n";
    if (node.author() || node.citation()) {
        out_ << "<div class=\"attribution\">\n";
        if (node.author()) {
            out_ << "&#8212; " << escape_html(*node.author());
        }
        if (node.citation()) {
            if (node.author()) out_ << "<br>\n";
            out_ << "<cite>" << escape_html(*node.citation()) << "</cite>";
        }
        out_ << "\n</div>\n";
    }
    out_ << "</div>\n";
}

void HtmlConverter::visit(const dom::Passthrough& node) {
    out_ << node.content();
    if (!node.content().empty() && node.content().back() != '\n') {
        out_ << '\n';
    }
}

void HtmlConverter::visit(const dom::BlockQuote& node) {
    out_ << "<blockquote>\n";
    const std::string& content = node.content();
    if (content.find('\n') == std::string::npos) {
        out_ << "<p>" << escape_html(content) << "</p>\n";
    } else {
        size_t start = 0;
        while (start <= content.size()) {
            size_t end = content.find('\n', start);
            if (end == std::string::npos) end = content.size();
            std::string_view line = std::string_view(content).substr(start, end - start);
            while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) line.remove_prefix(1);
            while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.remove_suffix(1);
            if (!line.empty()) {
                out_ << "<p>" << escape_html(line) << "</p>\n";
            }
            start = end + 1;
        }
    }
    if (!node.attribution().empty()) {
        out_ << "<cite>" << escape_html(node.attribution());
        if (!node.cite().empty()) {
            out_ << ", <em>" << escape_html(node.cite()) << "</em>";
        }
        out_ << "</cite>\n";
    }
    out_ << "</blockquote>\n";
}

// ============================================================================
// Compound blocks
// ============================================================================

void HtmlConverter::write_compound(const dom::CompoundBlock& block, const std::string& css_class) {
    out_ << "<div class=\"" << css_class << "\">\n";
    write_title(block.title());
    out_ << "<div class=\"content\">\n";
    convert_children(block);
    out_ << "</div>\n</div>\n";
}

void HtmlConverter::visit(const dom::Sidebar& node) {
    write_compound(node, "sidebarblock");
}

void HtmlConverter::visit(const dom::Example& node) {
    write_compound(node, "exampleblock");
}

void HtmlConverter::visit(const dom::Open& node) {
    std::string css_class = "openblock";
    if (node.masquerade_type() && !node.masquerade_type()->empty()) {
        css_class += " " + escape_html(*node.masquerade_type());
    }
    write_compound(node, css_class);
}

void HtmlConverter::visit(const dom::Admonition& node) {
    const std::string label = dom::admonition_type_name(node.type());
    out_ << "<div class=\"admonitionblock " << to_lower_ascii(label) << "\">\n"
         << "<table>\n"
         << "<tr>\n"
         << "<td class=\"icon\"><div class=\"title\">" << label << "</div></td>\n"
         << "<td class=\"content\">\n";
    write_title(node.title());
    out_ << "<div class=\"paragraph\"><p>" << escape_html(node.content()) << "</p></div>\n"
         << "</td>\n"
         << "</tr>\n"
         << "</table>\n"
         << "</div>\n";
}

void HtmlConverter::visit(const dom::TableOfContents& node) {
    out_ << "<div class=\"toc\">\n";
    if (!node.title().empty()) {
        out_ << "<div class=\"toc-title\">" << escape_html(node.title()) << "</div>\n";
    }
    if (!node.entries().empty()) {
        out_ << "<ul>\n";
        for (const auto& entry : node.entries()) {
            write_toc_entry(entry);
        }
        out_ << "</ul>\n";
    }
    out_ << "</div>\n";
}

void HtmlConverter::write_toc_entry(const dom::TableOfContentsEntry& entry) {
    out_ << "<li><a href=\"#" << escape_html(entry.anchor_id) << "\">"
         << escape_html(entry.title) << "</a>";
    if (!entry.children.empty()) {
        out_ << "\n<ul>\n";
        for (const auto& child : entry.children) {
            write_toc_entry(child);
        }
        out_ << "</ul>\n";
    }
    out_ << "</li>\n";
}

// ============================================================================
// Macros
// ============================================================================

void HtmlConverter::visit(const dom::Macro& node) {
    out_ << "<span class=\"macro " << escape_html(node.name()) << "\""
         << " data-macro=\"" << escape_html(node.name()) << "\""
         << " data-target=\"" << escape_html(node.target()) << "\"";
    for (const auto& parameter : node.parameters()) {
        out_ << " data-" << escape_html(parameter.name) << "=\"" << escape_html(parameter.value) << "\"";
    }
    out_ << '>' << escape_html(node.name()) << "::" << escape_html(node.target()) << '[';

    std::string joined;
    for (const auto& parameter : node.parameters()) {
        if (!joined.empty()) joined += ',';
        joined += parameter.name + "=" + parameter.value;
    }
    out_ << escape_html(joined) << "]</span>";
}

void HtmlConverter::visit(const dom::ImageMacro& node) {
    const std::string link = node.link();
    if (!link.empty()) {
        out_ << "<a href=\"" << escape_html(link) << "\">";
    }
    out_ << "<img src=\"" << escape_html(node.source()) << "\" alt=\"" << escape_html(node.alt()) << '"';
    if (!node.title().empty()) out_ << " title=\"" << escape_html(node.title()) << '"';
    if (auto width = node.width()) out_ << " width=\"" << *width << '"';
    if (auto height = node.height()) out_ << " height=\"" << *height << '"';
    if (!node.align().empty()) out_ << " class=\"align-" << escape_html(node.align()) << '"';
    out_ << "/>";
    if (!link.empty()) {
        out_ << "</a>";
    }
    if (node.macro_type() == dom::MacroType::Block) {
        out_ << '\n';
    }
}

void HtmlConverter::visit(const dom::VideoMacro& node) {
    out_ << "<video";
    if (auto width = node.width()) out_ << " width=\"" << *width << '"';
    if (auto height = node.height()) out_ << " height=\"" << *height << '"';
    if (node.controls()) out_ << " controls";
    if (node.autoplay()) out_ << " autoplay";
    if (node.loop()) out_ << " loop";
    if (node.muted()) out_ << " muted";
    if (!node.poster().empty()) out_ << " poster=\"" << escape_html(node.poster()) << '"';
    out_ << "><source src=\"" << escape_html(node.source()) << "\" type=\"video/"
         << escape_html(node.video_format()) << "\">"
         << "Your browser does not support the video tag.</video>";
    if (!node.title().empty()) {
        out_ << "\n<div class=\"video-title\">" << escape_html(node.title()) << "</div>";
    }
    if (node.macro_type() == dom::MacroType::Block) {
        out_ << '\n';
    }
}

void HtmlConverter::visit(const dom::IncludeMacro& node) {
    out_ << "<!-- Include: " << escape_html(node.file_path());
    if (!node.lines().empty()) out_ << " (lines: " << escape_html(node.lines()) << ')';
    if (!node.tags().empty()) out_ << " (tags: " << escape_html(node.tags()) << ')';
    out_ << " -->";
    if (node.macro_type() == dom::MacroType::Block) {
        out_ << '\n';
    }
}

// ============================================================================
// Inline
// ============================================================================

void HtmlConverter::visit(const dom::Text& node) {
    out_ << escape_html(node.content());
}

void HtmlConverter::visit(const dom::Emphasis& node) {
    out_ << "<em>" << escape_html(node.text()) << "</em>";
}

void HtmlConverter::visit(const dom::Strong& node) {
    out_ << "<strong>" << escape_html(node.text()) << "</strong>";
}

void HtmlConverter::visit(const dom::Highlight& node) {
    out_ << "<mark>" << escape_html(node.text()) << "</mark>";
}

void HtmlConverter::visit(const dom::Superscript& node) {
    out_ << "<sup>" << escape_html(node.text()) << "</sup>";
}

void HtmlConverter::visit(const dom::Subscript& node) {
    out_ << "<sub>" << escape_html(node.text()) << "</sub>";
}

void HtmlConverter::visit(const dom::InlineCode& node) {
    out_ << "<code>" << escape_html(node.content()) << "</code>";
}

void HtmlConverter::visit(const dom::Link& node) {
    out_ << "<a href=\"" << escape_html(node.url()) << '"';
    if (node.title()) out_ << " title=\"" << escape_html(*node.title()) << '"';
    out_ << '>' << escape_html(node.text()) << "</a>";
}

void HtmlConverter::visit(const dom::Image& node) {
    out_ << "<img src=\"" << escape_html(node.src()) << "\" alt=\"" << escape_html(node.alt()) << '"';
    if (node.title()) out_ << " title=\"" << escape_html(*node.title()) << '"';
    out_ << "/>";
}

void HtmlConverter::visit(const dom::Anchor& node) {
    out_ << "<a id=\"" << escape_html(node.id()) << "\">";
    if (!node.label().empty()) {
        out_ << escape_html(node.label());
    }
    out_ << "</a>";
}

void HtmlConverter::visit(const dom::CrossReference& node) {
    out_ << "<a href=\"#" << escape_html(node.target_id()) << "\" class=\"xref\">"
         << escape_html(node.text_content()) << "</a>";
}

// Definitions are listed again at the end of the document; references link
// to the definition with the same label.
void HtmlConverter::visit(const dom::Footnote& node) {
    const std::string label = escape_html(node.reference_label());
    if (node.is_reference()) {
        out_ << "<sup class=\"footnoteref\">[<a class=\"footnote\" href=\"#_footnotedef_" << label
             << "\" title=\"View footnote.\">" << label << "</a>]</sup>";
        return;
    }
    footnotes_.push_back({node.reference_label(), node.text()});
    out_ << "<sup class=\"footnote\">[<a id=\"_footnoteref_" << label
         << "\" class=\"footnote\" href=\"#_footnotedef_" << label
         << "\" title=\"View footnote.\">" << label << "</a>]</sup>";
}

} // namespace asciidoc::html
