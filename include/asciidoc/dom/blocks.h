#pragma once
#include <asciidoc/dom/element.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace asciidoc::dom {

// Lowercase, spaces to '-', quotes, brackets, braces and parens removed.
std::string generate_anchor_id(std::string_view title);

class Section : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Section;

    // Level 0 marks a headless container (several elements from one include).
    Section(std::string title, int level);

    const std::string& title() const { return title_; }
    int level() const { return level_; }
    bool is_container() const { return level_ == 0; }
    // The "id" attribute when set, otherwise derived from the title
    std::string anchor_id() const;

    void accept(DocumentVisitor& visitor) const override;

private:
    std::string title_;
    int level_;
};

class Paragraph : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Paragraph;

    explicit Paragraph(std::optional<std::string> plain_text = std::nullopt);

    // Plain-text fallback when set, otherwise the concatenated inline text
    std::string text() const;
    bool has_plain_text() const { return plain_text_.has_value(); }

    std::string text_content() const override { return text(); }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::optional<std::string> plain_text_;
};

enum class ListType { Ordered, Unordered, Definition };

const char* list_type_name(ListType type);

class List : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::List;

    explicit List(ListType type, int start_number = 1);

    ListType type() const { return type_; }
    int start_number() const { return start_number_; }

    void accept(DocumentVisitor& visitor) const override;

private:
    ListType type_;
    int start_number_;
};

class ListItem : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::ListItem;

    ListItem(std::string text, int level, bool is_checkbox = false, bool is_checked = false);

    const std::string& text() const { return text_; }
    int level() const { return level_; }
    bool is_checkbox() const { return is_checkbox_; }
    bool is_checked() const { return is_checked_; }

    std::string text_content() const override;
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string text_;
    int level_;
    bool is_checkbox_;
    bool is_checked_;
};

class DescriptionList : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::DescriptionList;

    DescriptionList();

    ListType type() const { return ListType::Definition; }

    void accept(DocumentVisitor& visitor) const override;
};

class DescriptionListItem : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::DescriptionListItem;

    DescriptionListItem(std::string term, std::string description);

    const std::string& term() const { return term_; }
    const std::string& description() const { return description_; }

    std::string text_content() const override;
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string term_;
    std::string description_;
};

class TableCell : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::TableCell;

    explicit TableCell(std::string content, bool is_header = false);

    const std::string& content() const { return content_; }
    int col_span() const { return col_span_; }
    int row_span() const { return row_span_; }
    const std::string& alignment() const { return alignment_; }
    bool is_header() const { return is_header_; }

    void set_col_span(int span) { col_span_ = span; }
    void set_row_span(int span) { row_span_ = span; }
    void set_alignment(std::string alignment) { alignment_ = std::move(alignment); }

    std::string text_content() const override { return content_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string content_;
    int col_span_ = 1;
    int row_span_ = 1;
    std::string alignment_;
    bool is_header_;
};

// Rows and headers own their cells as children.
class TableRow : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::TableRow;

    explicit TableRow(bool is_header = false);

    bool is_header() const { return is_header_; }
    void add_cell(std::unique_ptr<TableCell> cell) { append_child(std::move(cell)); }

    void accept(DocumentVisitor& visitor) const override;

private:
    bool is_header_;
};

class TableHeader : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::TableHeader;

    TableHeader();

    void add_cell(std::unique_ptr<TableCell> cell) { append_child(std::move(cell)); }

    void accept(DocumentVisitor& visitor) const override;
};

class Table : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Table;

    Table();
    ~Table() override;

    // Body rows are the children; the header is held separately.
    void add_row(std::unique_ptr<TableRow> row) { append_child(std::move(row)); }
    void set_header(std::unique_ptr<TableHeader> header);
    const TableHeader* header() const { return header_.get(); }

    void accept(DocumentVisitor& visitor) const override;

private:
    std::unique_ptr<TableHeader> header_;
};

class CodeBlock : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::CodeBlock;

    explicit CodeBlock(std::string content, std::optional<std::string> language = std::nullopt);

    const std::string& content() const { return content_; }
    const std::optional<std::string>& language() const { return language_; }

    std::string text_content() const override { return content_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string content_;
    std::optional<std::string> language_;
};

class Listing : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Listing;

    explicit Listing(std::string content,
                     std::optional<std::string> title = std::nullopt,
                     std::optional<std::string> language = std::nullopt);

    const std::string& content() const { return content_; }
    const std::optional<std::string>& title() const { return title_; }
    const std::optional<std::string>& language() const { return language_; }

    std::string text_content() const override { return content_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string content_;
    std::optional<std::string> title_;
    std::optional<std::string> language_;
};

class Literal : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Literal;

    explicit Literal(std::string content, std::optional<std::string> title = std::nullopt);

    const std::string& content() const { return content_; }
    const std::optional<std::string>& title() const { return title_; }

    std::string text_content() const override { return content_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string content_;
    std::optional<std::string> title_;
};

class Verse : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Verse;

    explicit Verse(std::string content,
                   std::optional<std::string> title = std::nullopt,
                   std::optional<std::string> author = std::nullopt,
                   std::optional<std::string> citation = std::nullopt);

    const std::string& content() const { return content_; }
    const std::optional<std::string>& title() const { return title_; }
    const std::optional<std::string>& author() const { return author_; }
    const std::optional<std::string>& citation() const { return citation_; }

    std::string text_content() const override { return content_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string content_;
    std::optional<std::string> title_;
    std::optional<std::string> author_;
    std::optional<std::string> citation_;
};

class Passthrough : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Passthrough;

    explicit Passthrough(std::string content,
                         std::optional<std::string> title = std::nullopt,
                         std::optional<std::string> substitutions = std::nullopt);

    const std::string& content() const { return content_; }
    const std::optional<std::string>& title() const { return title_; }
    const std::optional<std::string>& substitutions() const { return substitutions_; }

    std::string text_content() const override { return content_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string content_;
    std::optional<std::string> title_;
    std::optional<std::string> substitutions_;
};

class BlockQuote : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::BlockQuote;

    BlockQuote(std::string content, std::string attribution = {}, std::string cite = {});

    const std::string& content() const { return content_; }
    const std::string& attribution() const { return attribution_; }
    const std::string& cite() const { return cite_; }

    std::string text_content() const override { return content_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string content_;
    std::string attribution_;
    std::string cite_;
};

// Delimited block holding nested blocks as children.
class CompoundBlock : public Element {
public:
    const std::optional<std::string>& title() const { return title_; }

protected:
    CompoundBlock(ElementKind kind, std::optional<std::string> title);

private:
    std::optional<std::string> title_;
};

class Sidebar : public CompoundBlock {
public:
    static constexpr ElementKind kKind = ElementKind::Sidebar;

    explicit Sidebar(std::optional<std::string> title = std::nullopt);

    void accept(DocumentVisitor& visitor) const override;
};

class Example : public CompoundBlock {
public:
    static constexpr ElementKind kKind = ElementKind::Example;

    explicit Example(std::optional<std::string> title = std::nullopt);

    void accept(DocumentVisitor& visitor) const override;
};

class Open : public CompoundBlock {
public:
    static constexpr ElementKind kKind = ElementKind::Open;

    explicit Open(std::optional<std::string> title = std::nullopt,
                  std::optional<std::string> masquerade_type = std::nullopt);

    const std::optional<std::string>& masquerade_type() const { return masquerade_type_; }

    void accept(DocumentVisitor& visitor) const override;

private:
    std::optional<std::string> masquerade_type_;
};

enum class AdmonitionType { Note, Tip, Important, Warning, Caution };

const char* admonition_type_name(AdmonitionType type);
std::optional<AdmonitionType> parse_admonition_type(std::string_view label);

class Admonition : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Admonition;

    Admonition(AdmonitionType type, std::string content,
               std::optional<std::string> title = std::nullopt);

    AdmonitionType type() const { return type_; }
    const std::string& content() const { return content_; }
    const std::optional<std::string>& title() const { return title_; }

    std::string text_content() const override { return content_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    AdmonitionType type_;
    std::string content_;
    std::optional<std::string> title_;
};

struct TableOfContentsEntry {
    std::string title;
    int level = 1;
    std::string anchor_id;
    std::vector<TableOfContentsEntry> children;
};

class TableOfContents : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::TableOfContents;

    TableOfContents(std::string title, int max_depth,
                    std::vector<TableOfContentsEntry> entries = {});

    const std::string& title() const { return title_; }
    int max_depth() const { return max_depth_; }
    const std::vector<TableOfContentsEntry>& entries() const { return entries_; }
    void set_entries(std::vector<TableOfContentsEntry> entries) { entries_ = std::move(entries); }

    void accept(DocumentVisitor& visitor) const override;

private:
    std::string title_;
    int max_depth_;
    std::vector<TableOfContentsEntry> entries_;
};

} // namespace asciidoc::dom
