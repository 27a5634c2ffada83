#include <asciidoc/parser/parse_context.h>
#include <asciidoc/core/parse_error.h>

namespace asciidoc::parser {

int FootnoteRegistry::define(const std::string& id) {
    const int label = ++counter_;
    if (!id.empty()) {
        labels_[id] = label;
    }
    return label;
}

int FootnoteRegistry::reference(const std::string& id) {
    auto it = labels_.find(id);
    if (it != labels_.end()) {
        return it->second;
    }
    return define(id);
}

ParseContext::ParseContext(std::string input, const ParserOptions& options,
                           core::DiagnosticEmitter* diagnostics)
    : source_(std::move(input)), options_(options), diagnostics_(diagnostics) {
    tokenizer_.reset(source_);
    current_file_path_ = options_.base_path;
    current_ = tokenizer_.next_token();
}

ParseContext::ParseContext(std::string input)
    : ParseContext(std::move(input), ParserOptions{}) {}

ParseContext::ParseContext(std::string input, ParseContext& parent, const std::string& file_path)
    : source_(std::move(input)),
      options_(parent.options_),
      diagnostics_(parent.diagnostics_),
      footnotes_(parent.footnotes_),
      current_file_path_(file_path),
      include_stack_(parent.include_stack_) {
    tokenizer_.reset(source_);
    include_stack_.push_back(file_path);
    current_ = tokenizer_.next_token();
}

const Token& ParseContext::advance() {
    if (current_.type != Token::EndOfFile) {
        current_ = tokenizer_.next_token();
        ++consumed_;
    }
    return current_;
}

bool ParseContext::accept(Token::Type type) {
    if (current_.type != type) return false;
    advance();
    return true;
}

Token ParseContext::expect(Token::Type type) {
    if (current_.type != type) {
        throw core::ParseError(std::string("Expected ") + token_type_name(type) +
                                   " but found " + token_type_name(current_.type) +
                                   " at line " + std::to_string(current_.line) +
                                   ", column " + std::to_string(current_.column),
                               current_.line, current_.column);
    }
    Token token = current_;
    advance();
    return token;
}

void ParseContext::push_element(dom::Element& element) {
    element_stack_.push_back(&element);
}

dom::Element* ParseContext::pop_element() {
    if (element_stack_.empty()) return nullptr;
    dom::Element* top = element_stack_.back();
    element_stack_.pop_back();
    return top;
}

dom::Element* ParseContext::peek_element() const {
    if (element_stack_.empty()) return nullptr;
    return element_stack_.back();
}

std::string ParseContext::include_base_path() const {
    if (!current_file_path_.empty()) return current_file_path_;
    return options_.base_path;
}

void ParseContext::report(core::Severity severity, const std::string& module,
                          const std::string& stage, const std::string& message) const {
    if (!diagnostics_) return;
    core::SourceLocation location;
    location.file = include_stack_.empty() ? std::string() : include_stack_.back();
    location.line = current_.line;
    location.column = current_.column;
    diagnostics_->emit(severity, module, stage, message, location);
}

} // namespace asciidoc::parser
