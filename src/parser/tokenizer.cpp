#include <asciidoc/parser/tokenizer.h>
#include "string_utils.h"
#include <memory>
#include <re2/re2.h>

namespace asciidoc::parser {

namespace {

struct LinePattern {
    const char* regex;
    Token::Type type;
};

// Tried top to bottom; the first match classifies the line. Several of
// these overlap (a block macro also looks like a description list item),
// so the order is significant.
constexpr LinePattern kLinePatterns[] = {
    {R"(^=+\s+.+)",                                   Token::Header},
    {R"(^(\*+|\d+\.)\s+(\[[ xX]\]\s+)?.+)",           Token::ListItem},
    {R"(^\|===+$)",                                   Token::TableDelimiter},
    {R"(^\|.*$)",                                     Token::TableRow},
    {R"(^_{4,}$)",                                    Token::BlockQuoteDelimiter},
    {R"(^\*{4,}$)",                                   Token::SidebarDelimiter},
    {R"(^={4,}$)",                                    Token::ExampleDelimiter},
    {R"(^--$)",                                       Token::OpenDelimiter},
    {R"(^\.{4,}$)",                                   Token::LiteralDelimiter},
    {R"(^\+{4,}$)",                                   Token::PassthroughDelimiter},
    {R"(^:[^:!]+!?:\s*.*$)",                          Token::AttributeLine},
    {R"(^\[[^\]]+\]$)",                               Token::AttributeBlockLine},
    {R"(^----\w*$)",                                  Token::CodeBlockDelimiter},
    {R"(^(NOTE|TIP|IMPORTANT|WARNING|CAUTION):\s*.*$)", Token::AdmonitionBlock},
    {R"(^toc::\s*\[.*\]$)",                           Token::TableOfContents},
    {R"(^\w+::[^\[]*\[[^\]]*\]$)",                    Token::BlockMacro},
    {R"(^[^:\[\]]+::\s*.*$)",                         Token::DescriptionListItem},
};

struct CompiledPattern {
    std::unique_ptr<re2::RE2> regex;
    Token::Type type;
};

const std::vector<CompiledPattern>& line_patterns() {
    static const std::vector<CompiledPattern> patterns = [] {
        std::vector<CompiledPattern> out;
        for (const auto& p : kLinePatterns) {
            out.push_back({std::make_unique<re2::RE2>(p.regex), p.type});
        }
        return out;
    }();
    return patterns;
}

const re2::RE2& verse_attribute_pattern() {
    static const re2::RE2 pattern(R"(^\[verse(?:,\s*[^,\]]+)?(?:,\s*[^\]]+)?\]$)");
    return pattern;
}

// [literal], [listing], [pass] and [verse, ...] get their own token types.
Token::Type refine_attribute_block(std::string_view line) {
    if (line == "[literal]") return Token::LiteralAttribute;
    if (line == "[listing]") return Token::ListingAttribute;
    if (line == "[pass]") return Token::PassthroughAttribute;
    if (re2::RE2::PartialMatch(line, verse_attribute_pattern())) return Token::VerseAttribute;
    return Token::AttributeBlockLine;
}

} // namespace

const char* token_type_name(Token::Type type) {
    switch (type) {
        case Token::Header:               return "Header";
        case Token::ListItem:             return "ListItem";
        case Token::DescriptionListItem:  return "DescriptionListItem";
        case Token::TableDelimiter:       return "TableDelimiter";
        case Token::TableRow:             return "TableRow";
        case Token::BlockQuoteDelimiter:  return "BlockQuoteDelimiter";
        case Token::SidebarDelimiter:     return "SidebarDelimiter";
        case Token::ExampleDelimiter:     return "ExampleDelimiter";
        case Token::OpenDelimiter:        return "OpenDelimiter";
        case Token::VerseDelimiter:       return "VerseDelimiter";
        case Token::LiteralDelimiter:     return "LiteralDelimiter";
        case Token::PassthroughDelimiter: return "PassthroughDelimiter";
        case Token::CodeBlockDelimiter:   return "CodeBlockDelimiter";
        case Token::AttributeLine:        return "AttributeLine";
        case Token::AttributeBlockLine:   return "AttributeBlockLine";
        case Token::VerseAttribute:       return "VerseAttribute";
        case Token::LiteralAttribute:     return "LiteralAttribute";
        case Token::ListingAttribute:     return "ListingAttribute";
        case Token::PassthroughAttribute: return "PassthroughAttribute";
        case Token::AdmonitionBlock:      return "AdmonitionBlock";
        case Token::TableOfContents:      return "TableOfContents";
        case Token::BlockMacro:           return "BlockMacro";
        case Token::Text:                 return "Text";
        case Token::EmptyLine:            return "EmptyLine";
        case Token::NewLine:              return "NewLine";
        case Token::EndOfFile:            return "EndOfFile";
    }
    return "Unknown";
}

Tokenizer::Tokenizer(std::string_view input) {
    reset(input);
}

void Tokenizer::reset(std::string_view input) {
    input_ = input;
    pos_ = 0;
    line_ = 1;
    column_ = 1;
}

std::vector<Token> Tokenizer::tokenize(std::string_view input) {
    Tokenizer tokenizer(input);
    std::vector<Token> tokens;
    while (true) {
        Token token = tokenizer.next_token();
        const bool done = token.type == Token::EndOfFile;
        tokens.push_back(std::move(token));
        if (done) break;
    }
    return tokens;
}

Token::Type Tokenizer::classify_line(std::string_view line) {
    if (line.empty()) return Token::EmptyLine;

    for (const auto& pattern : line_patterns()) {
        if (re2::RE2::PartialMatch(line, *pattern.regex)) {
            if (pattern.type == Token::AttributeBlockLine) {
                return refine_attribute_block(line);
            }
            return pattern.type;
        }
    }
    return Token::Text;
}

Token Tokenizer::next_token() {
    if (!has_more_tokens()) {
        return make_token(Token::EndOfFile, {}, column_, pos_);
    }

    skip_whitespace();

    if (!has_more_tokens()) {
        return make_token(Token::EndOfFile, {}, column_, pos_);
    }

    if (input_[pos_] == '\n') {
        return read_newline();
    }

    const bool line_start = at_line_start();
    const int start_column = column_;
    const size_t start = pos_;
    std::string_view rest = read_line();

    if (line_start) {
        std::string_view trimmed = detail::trim_view(rest);
        return make_token(classify_line(trimmed), std::string(trimmed), start_column, start);
    }

    // Indented remainder of a line: kept verbatim apart from a CR before LF
    if (!rest.empty() && rest.back() == '\r') {
        rest.remove_suffix(1);
    }
    return make_token(Token::Text, std::string(rest), start_column, start);
}

bool Tokenizer::at_line_start() const {
    return column_ == 1 || (pos_ > 0 && input_[pos_ - 1] == '\n');
}

void Tokenizer::skip_whitespace() {
    while (has_more_tokens() && input_[pos_] != '\n' && detail::is_space(input_[pos_])) {
        ++pos_;
        ++column_;
    }
}

std::string_view Tokenizer::read_line() {
    const size_t start = pos_;
    while (has_more_tokens() && input_[pos_] != '\n') {
        ++pos_;
        ++column_;
    }
    return input_.substr(start, pos_ - start);
}

Token Tokenizer::read_newline() {
    Token token = make_token(Token::NewLine, "\n", column_, pos_);
    ++pos_;
    ++line_;
    column_ = 1;
    return token;
}

Token Tokenizer::make_token(Token::Type type, std::string value, int column, size_t position) const {
    Token token;
    token.type = type;
    token.value = std::move(value);
    token.line = line_;
    token.column = column;
    token.position = position;
    return token;
}

} // namespace asciidoc::parser
