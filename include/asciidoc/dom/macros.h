#pragma once
#include <asciidoc/dom/element.h>
#include <optional>
#include <string>

namespace asciidoc::dom {

enum class MacroType { Block, Inline };

// name:target[parameters] or name::target[parameters]. Parameters keep
// the order they were written in.
class Macro : public Element {
public:
    static constexpr ElementKind kKind = ElementKind::Macro;

    Macro(std::string name, std::string target, Attributes parameters, MacroType type);

    const std::string& name() const { return name_; }
    const std::string& target() const { return target_; }
    const Attributes& parameters() const { return parameters_; }
    MacroType macro_type() const { return macro_type_; }

    std::optional<std::string> parameter(std::string_view key) const { return parameters_.get(key); }

    void accept(DocumentVisitor& visitor) const override;

protected:
    Macro(ElementKind kind, std::string name, std::string target,
          Attributes parameters, MacroType type);

    // Parameter parsed as a decimal int; nullopt when missing or malformed
    std::optional<int> int_parameter(std::string_view key) const;
    // "true", "1" or "yes" (case-insensitive); fallback when missing
    bool bool_parameter(std::string_view key, bool fallback) const;
    std::string string_parameter(std::string_view key) const;

private:
    std::string name_;
    std::string target_;
    Attributes parameters_;
    MacroType macro_type_;
};

class ImageMacro : public Macro {
public:
    static constexpr ElementKind kKind = ElementKind::ImageMacro;

    ImageMacro(std::string target, Attributes parameters, MacroType type);

    const std::string& source() const { return target(); }
    // Defaults to the file name without its extension
    std::string alt() const;
    std::string title() const { return string_parameter("title"); }
    std::optional<int> width() const { return int_parameter("width"); }
    std::optional<int> height() const { return int_parameter("height"); }
    std::string link() const { return string_parameter("link"); }
    std::string align() const { return string_parameter("align"); }
    std::string float_position() const { return string_parameter("float"); }

    std::string text_content() const override { return alt(); }
    void accept(DocumentVisitor& visitor) const override;
};

class VideoMacro : public Macro {
public:
    static constexpr ElementKind kKind = ElementKind::VideoMacro;

    VideoMacro(std::string target, Attributes parameters, MacroType type);

    const std::string& source() const { return target(); }
    std::string title() const { return string_parameter("title"); }
    std::optional<int> width() const { return int_parameter("width"); }
    std::optional<int> height() const { return int_parameter("height"); }
    std::string poster() const { return string_parameter("poster"); }
    bool autoplay() const { return bool_parameter("autoplay", false); }
    bool controls() const { return bool_parameter("controls", true); }
    bool loop() const { return bool_parameter("loop", false); }
    bool muted() const { return bool_parameter("muted", false); }
    // The "format" parameter, else guessed from the source extension
    std::string video_format() const;

    void accept(DocumentVisitor& visitor) const override;
};

class IncludeMacro : public Macro {
public:
    static constexpr ElementKind kKind = ElementKind::IncludeMacro;

    IncludeMacro(std::string target, Attributes parameters, MacroType type = MacroType::Block);

    const std::string& file_path() const { return target(); }
    std::string level_offset() const { return string_parameter("leveloffset"); }
    std::string lines() const { return string_parameter("lines"); }
    std::string tags() const { return string_parameter("tags"); }
    std::string indent() const { return string_parameter("indent"); }
    bool optional() const { return bool_parameter("optional", false); }

    void accept(DocumentVisitor& visitor) const override;
};

} // namespace asciidoc::dom
