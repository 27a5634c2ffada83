#pragma once
#include <asciidoc/dom/attributes.h>
#include <string>
#include <string_view>
#include <vector>

namespace asciidoc::parser {

// Splits the text between a macro's brackets on commas that are not inside
// '...' or "..." quotes. Quote characters are kept in the parts.
std::vector<std::string> split_macro_parameters(std::string_view parameters);

// Classifies each part of split_macro_parameters():
//   key=value        named parameter (surrounding quotes stripped)
//   first part       positional, stored as both "alt" and "title"
//   part i (i > 0)   positional, stored as "param<i>"
// Blank parts are skipped but still count towards i.
dom::Attributes parse_macro_parameters(std::string_view parameters);

} // namespace asciidoc::parser
