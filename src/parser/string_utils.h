#pragma once
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>

// Small ASCII helpers shared by the parser sources.
namespace asciidoc::parser::detail {

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string_view trim_view(std::string_view value) {
    size_t start = 0;
    while (start < value.size() && is_space(value[start])) ++start;
    size_t end = value.size();
    while (end > start && is_space(value[end - 1])) --end;
    return value.substr(start, end - start);
}

inline std::string trim_copy(std::string_view value) {
    return std::string(trim_view(value));
}

// Strips leading and trailing '\n' / '\r' only.
inline std::string trim_newlines(std::string_view value) {
    size_t start = 0;
    while (start < value.size() && (value[start] == '\n' || value[start] == '\r')) ++start;
    size_t end = value.size();
    while (end > start && (value[end - 1] == '\n' || value[end - 1] == '\r')) --end;
    return std::string(value.substr(start, end - start));
}

inline bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline std::string to_lower_copy(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Whole-string decimal integer with an optional leading '+'.
inline std::optional<int> parse_int(std::string_view value) {
    value = trim_view(value);
    if (!value.empty() && value.front() == '+') value.remove_prefix(1);
    if (value.empty()) return std::nullopt;
    int result = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, result);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return result;
}

} // namespace asciidoc::parser::detail
