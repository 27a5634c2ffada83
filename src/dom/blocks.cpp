#include <asciidoc/dom/blocks.h>
#include <asciidoc/dom/visitor.h>
#include <cctype>

namespace asciidoc::dom {

// ============================================================================
// Section / Paragraph
// ============================================================================

std::string generate_anchor_id(std::string_view title) {
    std::string id;
    id.reserve(title.size());
    for (char c : title) {
        switch (c) {
            case ' ':
                id += '-';
                break;
            case '\'': case '"': case '(': case ')':
            case '[': case ']': case '{': case '}':
                break;
            default:
                id += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                break;
        }
    }
    return id;
}

Section::Section(std::string title, int level)
    : Element(ElementKind::Section), title_(std::move(title)), level_(level) {}

std::string Section::anchor_id() const {
    auto id = attributes().get("id");
    if (id && !id->empty()) return *id;
    return generate_anchor_id(title_);
}

void Section::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Paragraph::Paragraph(std::optional<std::string> plain_text)
    : Element(ElementKind::Paragraph), plain_text_(std::move(plain_text)) {}

std::string Paragraph::text() const {
    if (plain_text_) return *plain_text_;
    return Element::text_content();
}

void Paragraph::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

// ============================================================================
// Lists
// ============================================================================

const char* list_type_name(ListType type) {
    switch (type) {
        case ListType::Ordered:    return "ordered";
        case ListType::Unordered:  return "unordered";
        case ListType::Definition: return "definition";
    }
    return "unknown";
}

List::List(ListType type, int start_number)
    : Element(ElementKind::List), type_(type), start_number_(start_number) {}

void List::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

ListItem::ListItem(std::string text, int level, bool is_checkbox, bool is_checked)
    : Element(ElementKind::ListItem), text_(std::move(text)), level_(level),
      is_checkbox_(is_checkbox), is_checked_(is_checked) {}

std::string ListItem::text_content() const {
    return text_ + Element::text_content();
}

void ListItem::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

DescriptionList::DescriptionList() : Element(ElementKind::DescriptionList) {}

void DescriptionList::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

DescriptionListItem::DescriptionListItem(std::string term, std::string description)
    : Element(ElementKind::DescriptionListItem), term_(std::move(term)),
      description_(std::move(description)) {}

std::string DescriptionListItem::text_content() const {
    if (description_.empty()) return term_;
    return term_ + " " + description_;
}

void DescriptionListItem::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

// ============================================================================
// Tables
// ============================================================================

TableCell::TableCell(std::string content, bool is_header)
    : Element(ElementKind::TableCell), content_(std::move(content)), is_header_(is_header) {}

void TableCell::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

TableRow::TableRow(bool is_header) : Element(ElementKind::TableRow), is_header_(is_header) {}

void TableRow::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

TableHeader::TableHeader() : Element(ElementKind::TableHeader) {}

void TableHeader::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Table::Table() : Element(ElementKind::Table) {}

Table::~Table() = default;

void Table::set_header(std::unique_ptr<TableHeader> header) {
    header_ = std::move(header);
    if (header_) adopt(*header_);
}

void Table::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

// ============================================================================
// Verbatim blocks
// ============================================================================

CodeBlock::CodeBlock(std::string content, std::optional<std::string> language)
    : Element(ElementKind::CodeBlock), content_(std::move(content)), language_(std::move(language)) {}

void CodeBlock::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Listing::Listing(std::string content, std::optional<std::string> title,
                 std::optional<std::string> language)
    : Element(ElementKind::Listing), content_(std::move(content)),
      title_(std::move(title)), language_(std::move(language)) {}

void Listing::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Literal::Literal(std::string content, std::optional<std::string> title)
    : Element(ElementKind::Literal), content_(std::move(content)), title_(std::move(title)) {}

void Literal::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Verse::Verse(std::string content, std::optional<std::string> title,
             std::optional<std::string> author, std::optional<std::string> citation)
    : Element(ElementKind::Verse), content_(std::move(content)), title_(std::move(title)),
      author_(std::move(author)), citation_(std::move(citation)) {}

void Verse::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Passthrough::Passthrough(std::string content, std::optional<std::string> title,
                         std::optional<std::string> substitutions)
    : Element(ElementKind::Passthrough), content_(std::move(content)),
      title_(std::move(title)), substitutions_(std::move(substitutions)) {}

void Passthrough::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

BlockQuote::BlockQuote(std::string content, std::string attribution, std::string cite)
    : Element(ElementKind::BlockQuote), content_(std::move(content)),
      attribution_(std::move(attribution)), cite_(std::move(cite)) {}

void BlockQuote::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

// ============================================================================
// Compound blocks
// ============================================================================

CompoundBlock::CompoundBlock(ElementKind kind, std::optional<std::string> title)
    : Element(kind), title_(std::move(title)) {}

Sidebar::Sidebar(std::optional<std::string> title)
    : CompoundBlock(ElementKind::Sidebar, std::move(title)) {}

void Sidebar::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Example::Example(std::optional<std::string> title)
    : CompoundBlock(ElementKind::Example, std::move(title)) {}

void Example::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Open::Open(std::optional<std::string> title, std::optional<std::string> masquerade_type)
    : CompoundBlock(ElementKind::Open, std::move(title)),
      masquerade_type_(std::move(masquerade_type)) {}

void Open::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

// ============================================================================
// Admonition / TOC
// ============================================================================

const char* admonition_type_name(AdmonitionType type) {
    switch (type) {
        case AdmonitionType::Note:      return "NOTE";
        case AdmonitionType::Tip:       return "TIP";
        case AdmonitionType::Important: return "IMPORTANT";
        case AdmonitionType::Warning:   return "WARNING";
        case AdmonitionType::Caution:   return "CAUTION";
    }
    return "NOTE";
}

std::optional<AdmonitionType> parse_admonition_type(std::string_view label) {
    std::string upper;
    upper.reserve(label.size());
    for (char c : label) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "NOTE") return AdmonitionType::Note;
    if (upper == "TIP") return AdmonitionType::Tip;
    if (upper == "IMPORTANT") return AdmonitionType::Important;
    if (upper == "WARNING") return AdmonitionType::Warning;
    if (upper == "CAUTION") return AdmonitionType::Caution;
    return std::nullopt;
}

Admonition::Admonition(AdmonitionType type, std::string content, std::optional<std::string> title)
    : Element(ElementKind::Admonition), type_(type), content_(std::move(content)),
      title_(std::move(title)) {}

void Admonition::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

TableOfContents::TableOfContents(std::string title, int max_depth,
                                 std::vector<TableOfContentsEntry> entries)
    : Element(ElementKind::TableOfContents), title_(std::move(title)),
      max_depth_(max_depth), entries_(std::move(entries)) {}

void TableOfContents::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

} // namespace asciidoc::dom
