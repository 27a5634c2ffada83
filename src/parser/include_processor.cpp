#include <asciidoc/parser/include_processor.h>
#include <asciidoc/core/parse_error.h>
#include <asciidoc/dom/blocks.h>
#include <asciidoc/parser/parser.h>
#include "string_utils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unordered_set>

namespace asciidoc::parser {

namespace {

namespace fs = std::filesystem;

// Non-empty lines of content; CR and LF both end a line.
std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : content) {
        if (c == '\r' || c == '\n') {
            if (!current.empty()) {
                lines.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

// Comma- or semicolon-separated list, entries trimmed, blanks dropped.
std::vector<std::string> split_list(std::string_view value) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find_first_of(",;", start);
        if (end == std::string_view::npos) end = value.size();
        std::string part = detail::trim_copy(value.substr(start, end - start));
        if (!part.empty()) {
            parts.push_back(std::move(part));
        }
        start = end + 1;
    }
    return parts;
}

// 1-based line number; "-1" means the last line, 0 means invalid.
int parse_line_number(std::string_view value, int total_lines) {
    value = detail::trim_view(value);
    if (value == "-1") return total_lines;
    return detail::parse_int(value).value_or(0);
}

std::string file_name(const std::string& path) {
    return fs::path(path).filename().string();
}

// File names of the stack followed by next, joined with " -> ".
std::string include_chain(const std::vector<std::string>& stack, const std::string& next) {
    std::string chain;
    for (const auto& entry : stack) {
        chain += file_name(entry) + " -> ";
    }
    return chain + file_name(next);
}

std::string normalize_path(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        return path.lexically_normal().string();
    }
    return canonical.string();
}

std::vector<std::unique_ptr<dom::Element>> shift_sections(
    std::vector<std::unique_ptr<dom::Element>> elements, int offset) {
    for (auto& element : elements) {
        auto* section = dom::element_cast<dom::Section>(element.get());
        if (!section) continue;

        if (section->is_container()) {
            for (auto& child : shift_sections(section->take_children(), offset)) {
                section->append_child(std::move(child));
            }
            continue;
        }

        auto shifted = std::make_unique<dom::Section>(section->title(),
                                                      std::max(1, section->level() + offset));
        for (const auto& attribute : section->attributes()) {
            shifted->attributes().set(attribute.name, attribute.value);
        }
        for (auto& child : section->take_children()) {
            shifted->append_child(std::move(child));
        }
        element = std::move(shifted);
    }
    return elements;
}

} // namespace

IncludeProcessor::IncludeProcessor(Parser& parser) : parser_(parser) {}

std::vector<std::unique_ptr<dom::Element>> IncludeProcessor::process_include(
    const dom::IncludeMacro& macro, const std::string& base_path,
    const std::vector<std::string>& include_stack) {
    ParserOptions options;
    options.base_path = base_path;
    ParseContext root(std::string(), options, &parser_.diagnostics());
    for (const auto& entry : include_stack) {
        root.push_include(normalize_path(entry));
    }

    IncludeOutcome outcome = resolve(macro, root);
    if (auto* failure = std::get_if<IncludeFailure>(&outcome)) {
        throw core::ParseError(failure->message);
    }
    return std::move(std::get<IncludeResolved>(outcome).elements);
}

IncludeOutcome IncludeProcessor::resolve(const dom::IncludeMacro& macro, ParseContext& parent) {
    const std::string& target = macro.file_path();
    if (target.empty()) {
        return IncludeFailure{"Include path cannot be empty", target};
    }

    const std::string resolved = resolve_include_path(target, parent.include_base_path());
    const std::vector<std::string>& stack = parent.include_stack();

    if (would_create_circular_reference(resolved, stack)) {
        const std::string name = file_name(resolved);
        throw core::ParseError("Circular include detected: " + include_chain(stack, resolved) +
                               ". File '" + name +
                               "' is already being processed in the include chain.");
    }

    if (stack.size() >= parent.options().max_include_depth) {
        throw core::ParseError("Include depth limit of " +
                               std::to_string(parent.options().max_include_depth) +
                               " exceeded while including '" + file_name(resolved) + "'");
    }

    std::error_code ec;
    if (!fs::is_regular_file(resolved, ec)) {
        if (macro.optional()) {
            parent.report(core::Severity::Info, "include", "resolve",
                          "Skipping missing optional include: " + resolved);
            return IncludeResolved{};
        }
        return IncludeFailure{"Include file not found: " + resolved + " (include chain: " +
                                  include_chain(stack, resolved) + ")",
                              resolved};
    }

    std::ifstream in(resolved, std::ios::binary);
    std::string content;
    if (in) {
        content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    if (!in.is_open() || in.bad()) {
        if (macro.optional()) {
            parent.report(core::Severity::Info, "include", "resolve",
                          "Skipping unreadable optional include: " + resolved);
            return IncludeResolved{};
        }
        return IncludeFailure{"Error reading include file '" + resolved +
                                  "': unable to read file (include chain: " +
                                  include_chain(stack, resolved) + ")",
                              resolved};
    }

    content = apply_line_filter(content, macro.lines());
    content = apply_tag_filter(content, macro.tags());
    content = apply_indent(content, macro.indent());

    ParseContext child(std::move(content), parent, resolved);
    std::vector<std::unique_ptr<dom::Element>> elements = parser_.parse_blocks(child);
    for (const auto& attribute : child.global_attributes()) {
        parent.global_attributes().set(attribute.name, attribute.value);
    }
    elements = apply_level_offset(std::move(elements), macro.level_offset());

    parent.report(core::Severity::Info, "include", "resolve",
                  "Included " + std::to_string(elements.size()) + " elements from " + resolved);
    return IncludeResolved{std::move(elements)};
}

std::string IncludeProcessor::resolve_include_path(const std::string& path,
                                                   const std::string& base_path) {
    if (path.empty()) {
        throw core::ParseError("Include path cannot be empty");
    }

    fs::path target(path);
    if (target.is_relative()) {
        std::error_code ec;
        fs::path base;
        if (base_path.empty()) {
            base = fs::current_path(ec);
        } else {
            base = fs::path(base_path);
            if (fs::is_regular_file(base, ec)) {
                base = base.parent_path();
            }
        }
        target = base / target;
    }
    return normalize_path(target);
}

bool IncludeProcessor::would_create_circular_reference(const std::string& resolved_path,
                                                       const std::vector<std::string>& include_stack) {
    const std::string candidate = normalize_path(resolved_path);
    return std::any_of(include_stack.begin(), include_stack.end(),
                       [&](const std::string& entry) {
                           return detail::iequals(normalize_path(entry), candidate);
                       });
}

std::string IncludeProcessor::apply_line_filter(const std::string& content, const std::string& lines) {
    if (lines.empty()) return content;

    const std::vector<std::string> source = split_lines(content);
    const int total = static_cast<int>(source.size());
    std::vector<std::string> selected;

    for (const auto& range : split_list(lines)) {
        const size_t dots = range.find("..");
        if (dots != std::string::npos) {
            const int start = parse_line_number(std::string_view(range).substr(0, dots), total);
            const int end = parse_line_number(std::string_view(range).substr(dots + 2), total);
            if (start > 0 && end > 0 && start <= end) {
                for (int i = start - 1; i < end && i < total; ++i) {
                    selected.push_back(source[static_cast<size_t>(i)]);
                }
            }
        } else {
            const int number = parse_line_number(range, total);
            if (number > 0 && number <= total) {
                selected.push_back(source[static_cast<size_t>(number - 1)]);
            }
        }
    }
    return join_lines(selected);
}

std::string IncludeProcessor::apply_tag_filter(const std::string& content, const std::string& tags) {
    if (tags.empty()) return content;

    const std::vector<std::string> wanted_list = split_list(tags);
    const std::unordered_set<std::string> wanted(wanted_list.begin(), wanted_list.end());
    std::unordered_set<std::string> open_tags;
    bool including = false;
    std::vector<std::string> selected;

    for (const auto& line : split_lines(content)) {
        const std::string_view trimmed = detail::trim_view(line);
        const bool is_start = detail::starts_with(trimmed, "// tag::");
        const bool is_end = detail::starts_with(trimmed, "// end::");
        if ((is_start || is_end) && detail::ends_with(trimmed, "[]") && trimmed.size() >= 10) {
            const std::string name(trimmed.substr(8, trimmed.size() - 10));
            if (is_start) {
                open_tags.insert(name);
                if (wanted.count(name)) including = true;
            } else {
                open_tags.erase(name);
                if (wanted.count(name)) {
                    including = std::any_of(open_tags.begin(), open_tags.end(),
                                            [&](const std::string& tag) { return wanted.count(tag) > 0; });
                }
            }
            continue;
        }
        if (including) {
            selected.push_back(line);
        }
    }
    return join_lines(selected);
}

std::string IncludeProcessor::apply_indent(const std::string& content, const std::string& indent) {
    if (indent.empty()) return content;

    const auto width = detail::parse_int(indent);
    if (!width || *width <= 0) return content;

    std::vector<std::string> lines = split_lines(content);
    const std::string padding(static_cast<size_t>(*width), ' ');
    for (auto& line : lines) {
        line = padding + line;
    }
    return join_lines(lines);
}

std::vector<std::unique_ptr<dom::Element>> IncludeProcessor::apply_level_offset(
    std::vector<std::unique_ptr<dom::Element>> elements, const std::string& offset) {
    if (offset.empty()) return elements;

    const auto delta = detail::parse_int(offset);
    if (!delta) return elements;
    return shift_sections(std::move(elements), *delta);
}

} // namespace asciidoc::parser
