#ifndef ASCIIDOC_CORE_CONFIG_H
#define ASCIIDOC_CORE_CONFIG_H

#include <cstddef>

namespace asciidoc::core::config {

inline constexpr const char kVersionString[] = "asciidoc2html 0.1.0";

inline constexpr const char kDefaultTocTitle[] = "Table of Contents";
inline constexpr int kDefaultTocLevels = 3;

// Nested include::[] expansions beyond this depth fail the parse.
inline constexpr std::size_t kMaxIncludeDepth = 64;

inline constexpr const char kFootnoteIdPrefix[] = "_footnotedef_";

inline constexpr const char kDefaultHtmlEncoding[] = "UTF-8";
inline constexpr const char kDefaultHtmlTitle[] = "AsciiDoc Document";

}  // namespace asciidoc::core::config

#endif  // ASCIIDOC_CORE_CONFIG_H
