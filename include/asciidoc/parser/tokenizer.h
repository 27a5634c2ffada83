#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace asciidoc::parser {

struct Token {
    enum Type {
        Header, ListItem, DescriptionListItem,
        TableDelimiter, TableRow,
        BlockQuoteDelimiter, SidebarDelimiter, ExampleDelimiter, OpenDelimiter,
        VerseDelimiter, LiteralDelimiter, PassthroughDelimiter, CodeBlockDelimiter,
        AttributeLine, AttributeBlockLine,
        VerseAttribute, LiteralAttribute, ListingAttribute, PassthroughAttribute,
        AdmonitionBlock, TableOfContents, BlockMacro,
        Text, EmptyLine, NewLine, EndOfFile
    };
    Type type = EndOfFile;
    std::string value;     // Trimmed line text; "\n" for NewLine
    int line = 1;          // 1-based
    int column = 1;        // 1-based column of the first character of value
    size_t position = 0;   // Byte offset of the first character of value
};

const char* token_type_name(Token::Type type);

// Splits AsciiDoc source into line tokens. Each line is classified by an
// ordered list of patterns; the first pattern that matches wins.
//
// Whitespace at the start of a line is skipped; an indented line is never
// classified and comes back as Text.
class Tokenizer {
public:
    Tokenizer() = default;
    explicit Tokenizer(std::string_view input);

    // The input view must outlive the tokenizer.
    void reset(std::string_view input);

    Token next_token();
    bool has_more_tokens() const { return pos_ < input_.size(); }

    // All tokens of input, terminated by exactly one EndOfFile.
    static std::vector<Token> tokenize(std::string_view input);

    // Classification of an already-trimmed, non-empty line.
    static Token::Type classify_line(std::string_view line);

private:
    std::string_view input_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;

    bool at_line_start() const;
    void skip_whitespace();
    std::string_view read_line();
    Token read_newline();
    Token make_token(Token::Type type, std::string value, int column, size_t position) const;
};

} // namespace asciidoc::parser
