#pragma once
#include <asciidoc/dom/element.h>
#include <memory>
#include <string>
#include <vector>

namespace asciidoc::dom {

struct DocumentHeader {
    std::string title;
    std::string author;
    std::string email;
    std::string revision;
    std::string date;
    Attributes attributes;
};

class Document : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Document;

    Document();
    explicit Document(DocumentHeader header);

    DocumentHeader& header() { return header_; }
    const DocumentHeader& header() const { return header_; }

    // Top-level blocks, in source order
    const std::vector<std::unique_ptr<Element>>& elements() const { return children(); }

    void accept(DocumentVisitor& visitor) const override;

private:
    DocumentHeader header_;
};

} // namespace asciidoc::dom
