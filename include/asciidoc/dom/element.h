#pragma once
#include <asciidoc/dom/attributes.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace asciidoc::dom {

class DocumentVisitor;

enum class ElementKind {
    // Root
    Document,
    // Blocks
    Section, Paragraph, List, ListItem, DescriptionList, DescriptionListItem,
    Table, TableHeader, TableRow, TableCell,
    CodeBlock, Listing, Literal, Verse, Passthrough, BlockQuote,
    Sidebar, Example, Open, Admonition, TableOfContents,
    // Macros
    Macro, ImageMacro, VideoMacro, IncludeMacro,
    // Inline
    Text, Emphasis, Strong, Highlight, Superscript, Subscript, InlineCode,
    Link, Image, Anchor, CrossReference, Footnote
};

const char* element_kind_name(ElementKind kind);

class Element {
public:
    explicit Element(ElementKind kind);
    virtual ~Element();

    // Non-copyable
    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    ElementKind kind() const { return kind_; }
    std::string_view element_type() const { return element_kind_name(kind_); }
    Element* parent() const { return parent_; }

    Attributes& attributes() { return attributes_; }
    const Attributes& attributes() const { return attributes_; }

    // Tree manipulation
    Element& append_child(std::unique_ptr<Element> child);
    std::unique_ptr<Element> remove_child(Element& child);
    std::vector<std::unique_ptr<Element>> take_children();

    const std::vector<std::unique_ptr<Element>>& children() const { return children_; }
    size_t child_count() const { return children_.size(); }
    Element* child_at(size_t index) const;

    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

    // Plain text of this element and its descendants
    virtual std::string text_content() const;

    virtual void accept(DocumentVisitor& visitor) const = 0;

protected:
    // Links an element this node owns outside children_ (e.g. a table header)
    void adopt(Element& owned) { owned.parent_ = this; }

private:
    ElementKind kind_;
    Element* parent_ = nullptr;
    Attributes attributes_;
    std::vector<std::unique_ptr<Element>> children_;
};

// Downcast helper: returns nullptr when the kind does not match.
template<typename T>
const T* element_cast(const Element* element) {
    if (element && element->kind() == T::kKind) {
        return static_cast<const T*>(element);
    }
    return nullptr;
}

template<typename T>
T* element_cast(Element* element) {
    if (element && element->kind() == T::kKind) {
        return static_cast<T*>(element);
    }
    return nullptr;
}

} // namespace asciidoc::dom
