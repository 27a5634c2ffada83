#pragma once
#include <asciidoc/dom/element.h>
#include <asciidoc/dom/macros.h>
#include <asciidoc/parser/parse_context.h>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace asciidoc::parser {

class Parser;

struct IncludeResolved {
    std::vector<std::unique_ptr<dom::Element>> elements;
};

// A missing or unreadable file that is not marked optional.
struct IncludeFailure {
    std::string message;
    std::string path;
};

using IncludeOutcome = std::variant<IncludeResolved, IncludeFailure>;

// Expands include::path[...] directives: resolves the path, filters the
// file's lines and parses the result with the owning Parser.
class IncludeProcessor {
public:
    explicit IncludeProcessor(Parser& parser);

    // Elements of the included file; empty when an optional file is missing.
    // Throws core::ParseError for missing or unreadable files, cycles and
    // nesting beyond the configured depth.
    std::vector<std::unique_ptr<dom::Element>> process_include(
        const dom::IncludeMacro& macro, const std::string& base_path,
        const std::vector<std::string>& include_stack);

    // Same expansion inside a running parse. Missing or unreadable files come
    // back as IncludeFailure; cycles and depth overflow still throw.
    IncludeOutcome resolve(const dom::IncludeMacro& macro, ParseContext& parent);

    // Absolute canonical path of path. Relative paths resolve against
    // base_path (its directory when it names a file; the working directory
    // when empty).
    static std::string resolve_include_path(const std::string& path, const std::string& base_path);
    // Case-insensitive comparison against every canonical stack entry.
    static bool would_create_circular_reference(const std::string& resolved_path,
                                                const std::vector<std::string>& include_stack);

    // "N", "A..B" (1-based, inclusive) or "-1" for the last line. Lines are
    // split on CR/LF with empty lines dropped.
    static std::string apply_line_filter(const std::string& content, const std::string& lines);
    // Keeps lines between "// tag::name[]" and "// end::name[]" for each
    // comma-separated name; the marker lines themselves are dropped.
    static std::string apply_tag_filter(const std::string& content, const std::string& tags);
    static std::string apply_indent(const std::string& content, const std::string& indent);
    // Shifts section levels by "+N" / "-N", never below 1.
    static std::vector<std::unique_ptr<dom::Element>> apply_level_offset(
        std::vector<std::unique_ptr<dom::Element>> elements, const std::string& offset);

private:
    Parser& parser_;
};

} // namespace asciidoc::parser
