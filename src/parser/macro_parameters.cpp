#include <asciidoc/parser/macro_parameters.h>
#include "string_utils.h"

namespace asciidoc::parser {

std::vector<std::string> split_macro_parameters(std::string_view parameters) {
    std::vector<std::string> parts;
    std::string current;
    bool in_quotes = false;
    char quote_char = '\0';

    for (char ch : parameters) {
        if (!in_quotes && (ch == '"' || ch == '\'')) {
            in_quotes = true;
            quote_char = ch;
            current += ch;
        } else if (in_quotes && ch == quote_char) {
            in_quotes = false;
            current += ch;
        } else if (!in_quotes && ch == ',') {
            parts.push_back(current);
            current.clear();
        } else {
            current += ch;
        }
    }

    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

static std::string strip_quotes(std::string value) {
    if (value.size() >= 2) {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

dom::Attributes parse_macro_parameters(std::string_view parameters) {
    dom::Attributes result;
    if (parameters.empty()) return result;

    const std::vector<std::string> parts = split_macro_parameters(parameters);
    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string part = detail::trim_copy(parts[i]);
        if (part.empty()) continue;

        const size_t equals = part.find('=');
        if (equals != std::string::npos && equals > 0) {
            const std::string key = detail::trim_copy(std::string_view(part).substr(0, equals));
            const std::string value = detail::trim_copy(std::string_view(part).substr(equals + 1));
            result.set(key, strip_quotes(value));
        } else if (i == 0) {
            result.set("alt", part);
            result.set("title", part);
        } else {
            result.set("param" + std::to_string(i), part);
        }
    }
    return result;
}

} // namespace asciidoc::parser
