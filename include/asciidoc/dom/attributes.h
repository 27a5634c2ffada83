#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace asciidoc::dom {

struct Attribute {
    std::string name;
    std::string value;
};

// Insertion-ordered string map. Used for document attributes, element
// attributes and macro parameters.
class Attributes {
public:
    std::optional<std::string> get(std::string_view name) const;
    std::string get_or(std::string_view name, const std::string& fallback) const;
    void set(const std::string& name, const std::string& value);
    bool remove(std::string_view name);
    bool has(std::string_view name) const;

    std::vector<std::string> names() const;
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const std::vector<Attribute>& items() const { return items_; }
    std::vector<Attribute>::const_iterator begin() const { return items_.begin(); }
    std::vector<Attribute>::const_iterator end() const { return items_.end(); }

private:
    std::vector<Attribute> items_;
};

} // namespace asciidoc::dom
