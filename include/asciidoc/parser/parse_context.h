#pragma once
#include <asciidoc/core/config.h>
#include <asciidoc/core/diagnostics.h>
#include <asciidoc/dom/attributes.h>
#include <asciidoc/parser/tokenizer.h>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace asciidoc::dom {
class Element;
}

namespace asciidoc::parser {

struct ParserOptions {
    // Directory (or file) that relative include paths resolve against.
    // Empty means the current working directory.
    std::string base_path;
    // Propagate missing/unreadable include errors instead of leaving the
    // include::[] macro in the tree.
    bool strict_includes = false;
    std::size_t max_include_depth = core::config::kMaxIncludeDepth;
};

// Footnote numbering for one top-level parse. Included files share the
// registry of the document that includes them.
class FootnoteRegistry {
public:
    // Registers a new footnote definition and returns its label.
    int define(const std::string& id);
    // Label of an earlier definition of id, or a fresh label.
    int reference(const std::string& id);
    // Label the next define() will hand out.
    int next_label() const { return counter_ + 1; }

private:
    int counter_ = 0;
    std::unordered_map<std::string, int> labels_;
};

// Cursor over the token stream plus the state one parse shares between
// routines: document attributes, open elements and the include chain.
class ParseContext {
public:
    ParseContext(std::string input, const ParserOptions& options,
                 core::DiagnosticEmitter* diagnostics = nullptr);
    explicit ParseContext(std::string input);

    // Context for an included file. Shares options, diagnostics and
    // footnotes with parent; file_path is appended to the include stack.
    ParseContext(std::string input, ParseContext& parent, const std::string& file_path);

    // Non-copyable: the tokenizer views source_
    ParseContext(const ParseContext&) = delete;
    ParseContext& operator=(const ParseContext&) = delete;

    const Token& current() const { return current_; }
    const Token& advance();
    bool at(Token::Type type) const { return current_.type == type; }
    bool at_end() const { return current_.type == Token::EndOfFile; }
    bool at_blank() const { return at(Token::NewLine) || at(Token::EmptyLine); }

    // Advances when the current token has the given type.
    bool accept(Token::Type type);
    // Consumes and returns the current token; throws core::ParseError when
    // its type differs.
    Token expect(Token::Type type);
    // Number of tokens consumed so far.
    std::size_t consumed() const { return consumed_; }

    dom::Attributes& global_attributes() { return global_attributes_; }
    const dom::Attributes& global_attributes() const { return global_attributes_; }

    void push_element(dom::Element& element);
    dom::Element* pop_element();
    dom::Element* peek_element() const;
    std::size_t element_depth() const { return element_stack_.size(); }

    const std::string& current_file_path() const { return current_file_path_; }
    void set_current_file_path(std::string path) { current_file_path_ = std::move(path); }
    const std::vector<std::string>& include_stack() const { return include_stack_; }
    void push_include(const std::string& path) { include_stack_.push_back(path); }

    // Directory-or-file that includes in this context resolve against
    std::string include_base_path() const;

    FootnoteRegistry& footnotes() { return *footnotes_; }
    const ParserOptions& options() const { return options_; }

    // Reports through the attached emitter, tagged with the current token's
    // position. No-op without an emitter.
    void report(core::Severity severity, const std::string& module,
                const std::string& stage, const std::string& message) const;
    core::DiagnosticEmitter* diagnostics() const { return diagnostics_; }

private:
    std::string source_;
    Tokenizer tokenizer_;
    Token current_;
    std::size_t consumed_ = 0;

    ParserOptions options_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    FootnoteRegistry own_footnotes_;
    FootnoteRegistry* footnotes_ = &own_footnotes_;

    dom::Attributes global_attributes_;
    std::vector<dom::Element*> element_stack_;
    std::string current_file_path_;
    std::vector<std::string> include_stack_;
};

} // namespace asciidoc::parser
