#pragma once
#include <asciidoc/dom/element.h>
#include <optional>
#include <string>

namespace asciidoc::dom {

class Text : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Text;

    explicit Text(std::string content);

    const std::string& content() const { return content_; }

    std::string text_content() const override { return content_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string content_;
};

// Formatted span with unparsed text: *strong*, _emphasis_, #highlight#,
// ^superscript^ and ~subscript~.
class FormattedSpan : public Element {
public:
    const std::string& text() const { return text_; }

    std::string text_content() const override { return text_; }

protected:
    FormattedSpan(ElementKind kind, std::string text);

private:
    std::string text_;
};

class Emphasis : public FormattedSpan {
public:
    static constexpr ElementKind kKind = ElementKind::Emphasis;
    explicit Emphasis(std::string text);
    void accept(DocumentVisitor& visitor) const override;
};

class Strong : public FormattedSpan {
public:
    static constexpr ElementKind kKind = ElementKind::Strong;
    explicit Strong(std::string text);
    void accept(DocumentVisitor& visitor) const override;
};

class Highlight : public FormattedSpan {
public:
    static constexpr ElementKind kKind = ElementKind::Highlight;
    explicit Highlight(std::string text);
    void accept(DocumentVisitor& visitor) const override;
};

class Superscript : public FormattedSpan {
public:
    static constexpr ElementKind kKind = ElementKind::Superscript;
    explicit Superscript(std::string text);
    void accept(DocumentVisitor& visitor) const override;
};

class Subscript : public FormattedSpan {
public:
    static constexpr ElementKind kKind = ElementKind::Subscript;
    explicit Subscript(std::string text);
    void accept(DocumentVisitor& visitor) const override;
};

class InlineCode : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::InlineCode;

    explicit InlineCode(std::string content);

    const std::string& content() const { return content_; }

    std::string text_content() const override { return content_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string content_;
};

class Link : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Link;

    Link(std::string url, std::string text, std::optional<std::string> title = std::nullopt);

    const std::string& url() const { return url_; }
    const std::string& text() const { return text_; }
    const std::optional<std::string>& title() const { return title_; }

    std::string text_content() const override { return text_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string url_;
    std::string text_;
    std::optional<std::string> title_;
};

class Image : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Image;

    Image(std::string src, std::string alt, std::optional<std::string> title = std::nullopt);

    const std::string& src() const { return src_; }
    const std::string& alt() const { return alt_; }
    const std::optional<std::string>& title() const { return title_; }

    std::string text_content() const override { return alt_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string src_;
    std::string alt_;
    std::optional<std::string> title_;
};

class Anchor : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Anchor;

    Anchor(std::string id, std::string label = {});

    const std::string& id() const { return id_; }
    const std::string& label() const { return label_; }

    std::string text_content() const override { return label_; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string id_;
    std::string label_;
};

class CrossReference : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::CrossReference;

    CrossReference(std::string target_id, std::string link_text = {});

    const std::string& target_id() const { return target_id_; }
    const std::string& link_text() const { return link_text_; }

    std::string text_content() const override;
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string target_id_;
    std::string link_text_;
};

class Footnote : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Footnote;

    Footnote(std::string id, std::string text, std::string reference_label, bool is_reference);

    const std::string& id() const { return id_; }
    const std::string& text() const { return text_; }
    const std::string& reference_label() const { return reference_label_; }
    bool is_reference() const { return is_reference_; }

    // Footnote bodies are not part of the running text.
    std::string text_content() const override { return {}; }
    void accept(DocumentVisitor& visitor) const override;

private:
    std::string id_;
    std::string text_;
    std::string reference_label_;
    bool is_reference_;
};

} // namespace asciidoc::dom
