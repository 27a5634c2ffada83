#include <asciidoc/dom/macros.h>
#include <asciidoc/dom/visitor.h>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <system_error>

namespace asciidoc::dom {

namespace {

std::string to_lower(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

Macro::Macro(std::string name, std::string target, Attributes parameters, MacroType type)
    : Macro(ElementKind::Macro, std::move(name), std::move(target), std::move(parameters), type) {}

Macro::Macro(ElementKind kind, std::string name, std::string target,
             Attributes parameters, MacroType type)
    : Element(kind), name_(std::move(name)), target_(std::move(target)),
      parameters_(std::move(parameters)), macro_type_(type) {}

void Macro::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

std::optional<int> Macro::int_parameter(std::string_view key) const {
    auto value = parameters_.get(key);
    if (!value || value->empty()) return std::nullopt;

    int parsed = 0;
    const char* begin = value->data();
    const char* end = begin + value->size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end) return std::nullopt;
    return parsed;
}

bool Macro::bool_parameter(std::string_view key, bool fallback) const {
    auto value = parameters_.get(key);
    if (!value) return fallback;
    std::string lowered = to_lower(*value);
    return lowered == "true" || lowered == "1" || lowered == "yes";
}

std::string Macro::string_parameter(std::string_view key) const {
    return parameters_.get_or(key, std::string());
}

// ============================================================================
// ImageMacro
// ============================================================================

ImageMacro::ImageMacro(std::string target, Attributes parameters, MacroType type)
    : Macro(ElementKind::ImageMacro, "image", std::move(target), std::move(parameters), type) {}

std::string ImageMacro::alt() const {
    auto value = parameter("alt");
    if (value && !value->empty()) return *value;
    return std::filesystem::path(source()).stem().string();
}

void ImageMacro::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

// ============================================================================
// VideoMacro
// ============================================================================

VideoMacro::VideoMacro(std::string target, Attributes parameters, MacroType type)
    : Macro(ElementKind::VideoMacro, "video", std::move(target), std::move(parameters), type) {}

std::string VideoMacro::video_format() const {
    auto format = parameter("format");
    if (format && !format->empty()) return *format;

    std::string extension = to_lower(std::filesystem::path(source()).extension().string());
    if (extension == ".webm") return "webm";
    if (extension == ".ogg") return "ogg";
    if (extension == ".avi") return "avi";
    if (extension == ".mov") return "mov";
    return "mp4";
}

void VideoMacro::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

// ============================================================================
// IncludeMacro
// ============================================================================

IncludeMacro::IncludeMacro(std::string target, Attributes parameters, MacroType type)
    : Macro(ElementKind::IncludeMacro, "include", std::move(target), std::move(parameters), type) {}

void IncludeMacro::accept(DocumentVisitor& visitor) const { visitor.visit(*this); }

} // namespace asciidoc::dom
