#include <asciidoc/parser/parser.h>
#include <asciidoc/core/config.h>
#include <asciidoc/dom/inlines.h>
#include <asciidoc/parser/macro_parameters.h>
#include "string_utils.h"

#include <re2/re2.h>

namespace asciidoc::parser {

namespace {

enum class InlineKind {
    Strong, Emphasis, Highlight, Superscript, Subscript, Code,
    Link, Image, Anchor, CrossReference, Footnote, Macro
};

struct InlinePattern {
    const char* regex;
    InlineKind kind;
};

// Scan order. When two patterns match at the same offset the earlier one
// wins, so footnote:[] and image::[] must precede the generic macro.
constexpr InlinePattern kInlinePatterns[] = {
    {R"(\*([^*]+)\*)",                          InlineKind::Strong},
    {R"(_([^_]+)_)",                            InlineKind::Emphasis},
    {R"(#([^#]+)#)",                            InlineKind::Highlight},
    {R"(\^([^\^]+)\^)",                         InlineKind::Superscript},
    {R"(~([^~]+)~)",                            InlineKind::Subscript},
    {R"(`([^`]+)`)",                            InlineKind::Code},
    {R"((https?://[^\s\[\]]+)(\[([^\]]*)\])?)", InlineKind::Link},
    {R"(image::([^\[]+)\[([^\]]*)\])",          InlineKind::Image},
    {R"(\[\[([^\]]+)\]\])",                     InlineKind::Anchor},
    {R"(<<([^,>]+?)(?:,(.+?))?>>)",             InlineKind::CrossReference},
    {R"(footnote:([^:\[\]]*?)\[([^\]]*)\])",    InlineKind::Footnote},
    {R"((\w+):([^\[]*)\[([^\]]*)\])",           InlineKind::Macro},
};

struct CompiledInlinePattern {
    std::unique_ptr<re2::RE2> regex;
    InlineKind kind;
};

const std::vector<CompiledInlinePattern>& inline_patterns() {
    static const std::vector<CompiledInlinePattern> patterns = [] {
        std::vector<CompiledInlinePattern> out;
        for (const auto& p : kInlinePatterns) {
            out.push_back({std::make_unique<re2::RE2>(p.regex), p.kind});
        }
        return out;
    }();
    return patterns;
}

struct InlineMatch {
    InlineKind kind = InlineKind::Strong;
    size_t start = 0;
    size_t end = 0;
    std::vector<re2::StringPiece> groups;
};

std::string group_text(const InlineMatch& match, size_t index) {
    if (index >= match.groups.size()) return {};
    const re2::StringPiece& piece = match.groups[index];
    if (piece.data() == nullptr || piece.empty()) return {};
    return std::string(piece.data(), piece.size());
}

// Earliest match at or after pos over all patterns.
std::optional<InlineMatch> find_next_match(std::string_view text, size_t pos) {
    const re2::StringPiece input(text.data(), text.size());
    std::optional<InlineMatch> best;

    for (const auto& pattern : inline_patterns()) {
        const int group_count = 1 + pattern.regex->NumberOfCapturingGroups();
        std::vector<re2::StringPiece> groups(static_cast<size_t>(group_count));
        if (!pattern.regex->Match(input, pos, input.size(), re2::RE2::UNANCHORED,
                                  groups.data(), group_count)) {
            continue;
        }

        const size_t start = static_cast<size_t>(groups[0].data() - input.data());
        if (best && start >= best->start) continue;

        InlineMatch match;
        match.kind = pattern.kind;
        match.start = start;
        match.end = start + groups[0].size();
        match.groups = std::move(groups);
        best = std::move(match);
    }
    return best;
}

std::unique_ptr<dom::Element> make_footnote(const InlineMatch& match, FootnoteRegistry& footnotes) {
    const std::string id = detail::trim_copy(group_text(match, 1));
    const std::string text = detail::trim_copy(group_text(match, 2));

    if (id.empty()) {
        const int label = footnotes.define("");
        return std::make_unique<dom::Footnote>(
            core::config::kFootnoteIdPrefix + std::to_string(label), text,
            std::to_string(label), false);
    }
    if (text.empty()) {
        const int label = footnotes.reference(id);
        return std::make_unique<dom::Footnote>(id, "", std::to_string(label), true);
    }
    const int label = footnotes.define(id);
    return std::make_unique<dom::Footnote>(id, text, std::to_string(label), false);
}

std::unique_ptr<dom::Element> make_inline(const InlineMatch& match, FootnoteRegistry& footnotes) {
    switch (match.kind) {
        case InlineKind::Strong:
            return std::make_unique<dom::Strong>(group_text(match, 1));
        case InlineKind::Emphasis:
            return std::make_unique<dom::Emphasis>(group_text(match, 1));
        case InlineKind::Highlight:
            return std::make_unique<dom::Highlight>(group_text(match, 1));
        case InlineKind::Superscript:
            return std::make_unique<dom::Superscript>(group_text(match, 1));
        case InlineKind::Subscript:
            return std::make_unique<dom::Subscript>(group_text(match, 1));
        case InlineKind::Code:
            return std::make_unique<dom::InlineCode>(group_text(match, 1));
        case InlineKind::Link: {
            std::string url = group_text(match, 1);
            std::string text = group_text(match, 3);
            if (text.empty()) text = url;
            return std::make_unique<dom::Link>(std::move(url), std::move(text));
        }
        case InlineKind::Image:
            return std::make_unique<dom::Image>(group_text(match, 1), group_text(match, 2));
        case InlineKind::Anchor: {
            const std::string content = group_text(match, 1);
            const size_t comma = content.find(',');
            if (comma == std::string::npos) {
                return std::make_unique<dom::Anchor>(detail::trim_copy(content));
            }
            return std::make_unique<dom::Anchor>(
                detail::trim_copy(std::string_view(content).substr(0, comma)),
                detail::trim_copy(std::string_view(content).substr(comma + 1)));
        }
        case InlineKind::CrossReference:
            return std::make_unique<dom::CrossReference>(detail::trim_copy(group_text(match, 1)),
                                                         detail::trim_copy(group_text(match, 2)));
        case InlineKind::Footnote:
            return make_footnote(match, footnotes);
        case InlineKind::Macro:
            return Parser::create_macro(detail::trim_copy(group_text(match, 1)),
                                        detail::trim_copy(group_text(match, 2)),
                                        parse_macro_parameters(
                                            detail::trim_view(group_text(match, 3))),
                                        dom::MacroType::Inline);
    }
    return nullptr;
}

} // namespace

std::vector<std::unique_ptr<dom::Element>> Parser::parse_inline(std::string_view text,
                                                                FootnoteRegistry& footnotes) const {
    std::vector<std::unique_ptr<dom::Element>> spans;
    size_t pos = 0;

    while (pos < text.size()) {
        auto match = find_next_match(text, pos);
        if (!match) {
            spans.push_back(std::make_unique<dom::Text>(std::string(text.substr(pos))));
            break;
        }

        if (match->start > pos) {
            spans.push_back(std::make_unique<dom::Text>(
                std::string(text.substr(pos, match->start - pos))));
        }
        if (auto span = make_inline(*match, footnotes)) {
            spans.push_back(std::move(span));
        }

        pos = match->end > match->start ? match->end : match->start + 1;
    }
    return spans;
}

std::vector<std::unique_ptr<dom::Element>> Parser::parse_inline(std::string_view text) const {
    FootnoteRegistry footnotes;
    return parse_inline(text, footnotes);
}

} // namespace asciidoc::parser
