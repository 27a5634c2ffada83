#include <asciidoc/dom/inlines.h>
#include <asciidoc/dom/visitor.h>

namespace asciidoc::dom {

Text::Text(std::string content) : Element(ElementKind::Text), content_(std::move(content)) {}

void Text::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

FormattedSpan::FormattedSpan(ElementKind kind, std::string text)
    : Element(kind), text_(std::move(text)) {}

Emphasis::Emphasis(std::string text) : FormattedSpan(ElementKind::Emphasis, std::move(text)) {}
void Emphasis::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Strong::Strong(std::string text) : FormattedSpan(ElementKind::Strong, std::move(text)) {}
void Strong::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Highlight::Highlight(std::string text) : FormattedSpan(ElementKind::Highlight, std::move(text)) {}
void Highlight::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Superscript::Superscript(std::string text) : FormattedSpan(ElementKind::Superscript, std::move(text)) {}
void Superscript::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Subscript::Subscript(std::string text) : FormattedSpan(ElementKind::Subscript, std::move(text)) {}
void Subscript::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

InlineCode::InlineCode(std::string content)
    : Element(ElementKind::InlineCode), content_(std::move(content)) {}

void InlineCode::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Link::Link(std::string url, std::string text, std::optional<std::string> title)
    : Element(ElementKind::Link), url_(std::move(url)), text_(std::move(text)),
      title_(std::move(title)) {}

void Link::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Image::Image(std::string src, std::string alt, std::optional<std::string> title)
    : Element(ElementKind::Image), src_(std::move(src)), alt_(std::move(alt)),
      title_(std::move(title)) {}

void Image::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Anchor::Anchor(std::string id, std::string label)
    : Element(ElementKind::Anchor), id_(std::move(id)), label_(std::move(label)) {}

void Anchor::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

CrossReference::CrossReference(std::string target_id, std::string link_text)
    : Element(ElementKind::CrossReference), target_id_(std::move(target_id)),
      link_text_(std::move(link_text)) {}

std::string CrossReference::text_content() const {
    return link_text_.empty() ? target_id_ : link_text_;
}

void CrossReference::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

Footnote::Footnote(std::string id, std::string text, std::string reference_label, bool is_reference)
    : Element(ElementKind::Footnote), id_(std::move(id)), text_(std::move(text)),
      reference_label_(std::move(reference_label)), is_reference_(is_reference) {}

void Footnote::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

} // namespace asciidoc::dom
