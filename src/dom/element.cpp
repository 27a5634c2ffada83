#include <asciidoc/dom/element.h>
#include <algorithm>
#include <stdexcept>

namespace asciidoc::dom {

const char* element_kind_name(ElementKind kind) {
    switch (kind) {
        case ElementKind::Document:            return "document";
        case ElementKind::Section:             return "section";
        case ElementKind::Paragraph:           return "paragraph";
        case ElementKind::List:                return "list";
        case ElementKind::ListItem:            return "list_item";
        case ElementKind::DescriptionList:     return "description_list";
        case ElementKind::DescriptionListItem: return "description_list_item";
        case ElementKind::Table:               return "table";
        case ElementKind::TableHeader:         return "table_header";
        case ElementKind::TableRow:            return "table_row";
        case ElementKind::TableCell:           return "table_cell";
        case ElementKind::CodeBlock:           return "code_block";
        case ElementKind::Listing:             return "listing";
        case ElementKind::Literal:             return "literal";
        case ElementKind::Verse:               return "verse";
        case ElementKind::Passthrough:         return "passthrough";
        case ElementKind::BlockQuote:          return "block_quote";
        case ElementKind::Sidebar:             return "sidebar";
        case ElementKind::Example:             return "example";
        case ElementKind::Open:                return "open";
        case ElementKind::Admonition:          return "admonition";
        case ElementKind::TableOfContents:     return "table_of_contents";
        case ElementKind::Macro:               return "macro";
        case ElementKind::ImageMacro:          return "image_macro";
        case ElementKind::VideoMacro:          return "video_macro";
        case ElementKind::IncludeMacro:        return "include_macro";
        case ElementKind::Text:                return "text";
        case ElementKind::Emphasis:            return "emphasis";
        case ElementKind::Strong:              return "strong";
        case ElementKind::Highlight:           return "highlight";
        case ElementKind::Superscript:         return "superscript";
        case ElementKind::Subscript:           return "subscript";
        case ElementKind::InlineCode:          return "inline_code";
        case ElementKind::Link:                return "link";
        case ElementKind::Image:               return "image";
        case ElementKind::Anchor:              return "anchor";
        case ElementKind::CrossReference:      return "cross_reference";
        case ElementKind::Footnote:            return "footnote";
    }
    return "unknown";
}

Element::Element(ElementKind kind) : kind_(kind) {}

Element::~Element() = default;

Element& Element::append_child(std::unique_ptr<Element> child) {
    if (!child) {
        throw std::invalid_argument("append_child: null element");
    }
    Element* new_child = child.get();
    new_child->parent_ = this;
    children_.push_back(std::move(child));
    return *new_child;
}

std::unique_ptr<Element> Element::remove_child(Element& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [&child](const std::unique_ptr<Element>& c) {
            return c.get() == &child;
        });
    if (it == children_.end()) return nullptr;

    std::unique_ptr<Element> removed = std::move(*it);
    children_.erase(it);
    removed->parent_ = nullptr;
    return removed;
}

std::vector<std::unique_ptr<Element>> Element::take_children() {
    std::vector<std::unique_ptr<Element>> taken = std::move(children_);
    children_.clear();
    for (auto& child : taken) {
        child->parent_ = nullptr;
    }
    return taken;
}

Element* Element::child_at(size_t index) const {
    if (index >= children_.size()) return nullptr;
    return children_[index].get();
}

std::string Element::text_content() const {
    std::string result;
    for (auto& child : children_) {
        result += child->text_content();
    }
    return result;
}

} // namespace asciidoc::dom
