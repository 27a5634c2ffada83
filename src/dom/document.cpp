#include <asciidoc/dom/document.h>
#include <asciidoc/dom/visitor.h>

namespace asciidoc::dom {

Document::Document() : Element(ElementKind::Document) {}

Document::Document(DocumentHeader header)
    : Element(ElementKind::Document), header_(std::move(header)) {}

void Document::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

} // namespace asciidoc::dom
