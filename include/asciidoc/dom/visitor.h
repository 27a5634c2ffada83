#pragma once

namespace asciidoc::dom {

class Document;
class Section;
class Paragraph;
class List;
class ListItem;
class DescriptionList;
class DescriptionListItem;
class Table;
class TableHeader;
class TableRow;
class TableCell;
class CodeBlock;
class Listing;
class Literal;
class Verse;
class Passthrough;
class BlockQuote;
class Sidebar;
class Example;
class Open;
class Admonition;
class TableOfContents;
class Macro;
class ImageMacro;
class VideoMacro;
class IncludeMacro;
class Text;
class Emphasis;
class Strong;
class Highlight;
class Superscript;
class Subscript;
class InlineCode;
class Link;
class Image;
class Anchor;
class CrossReference;
class Footnote;

// One overload per concrete element kind. Every visitor must handle them
// all, so a new kind is a compile error at each dispatch site.
class DocumentVisitor {
public:
    virtual ~DocumentVisitor() = default;

    virtual void visit(const Document& node) = 0;

    virtual void visit(const Section& node) = 0;
    virtual void visit(const Paragraph& node) = 0;
    virtual void visit(const List& node) = 0;
    virtual void visit(const ListItem& node) = 0;
    virtual void visit(const DescriptionList& node) = 0;
    virtual void visit(const DescriptionListItem& node) = 0;
    virtual void visit(const Table& node) = 0;
    virtual void visit(const TableHeader& node) = 0;
    virtual void visit(const TableRow& node) = 0;
    virtual void visit(const TableCell& node) = 0;
    virtual void visit(const CodeBlock& node) = 0;
    virtual void visit(const Listing& node) = 0;
    virtual void visit(const Literal& node) = 0;
    virtual void visit(const Verse& node) = 0;
    virtual void visit(const Passthrough& node) = 0;
    virtual void visit(const BlockQuote& node) = 0;
    virtual void visit(const Sidebar& node) = 0;
    virtual void visit(const Example& node) = 0;
    virtual void visit(const Open& node) = 0;
    virtual void visit(const Admonition& node) = 0;
    virtual void visit(const TableOfContents& node) = 0;

    virtual void visit(const Macro& node) = 0;
    virtual void visit(const ImageMacro& node) = 0;
    virtual void visit(const VideoMacro& node) = 0;
    virtual void visit(const IncludeMacro& node) = 0;

    virtual void visit(const Text& node) = 0;
    virtual void visit(const Emphasis& node) = 0;
    virtual void visit(const Strong& node) = 0;
    virtual void visit(const Highlight& node) = 0;
    virtual void visit(const Superscript& node) = 0;
    virtual void visit(const Subscript& node) = 0;
    virtual void visit(const InlineCode& node) = 0;
    virtual void visit(const Link& node) = 0;
    virtual void visit(const Image& node) = 0;
    virtual void visit(const Anchor& node) = 0;
    virtual void visit(const CrossReference& node) = 0;
    virtual void visit(const Footnote& node) = 0;
};

} // namespace asciidoc::dom
