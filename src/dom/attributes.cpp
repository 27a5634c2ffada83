#include <asciidoc/dom/attributes.h>
#include <algorithm>

namespace asciidoc::dom {

std::optional<std::string> Attributes::get(std::string_view name) const {
    for (auto& attr : items_) {
        if (attr.name == name) return attr.value;
    }
    return std::nullopt;
}

std::string Attributes::get_or(std::string_view name, const std::string& fallback) const {
    auto value = get(name);
    return value ? *value : fallback;
}

void Attributes::set(const std::string& name, const std::string& value) {
    for (auto& attr : items_) {
        if (attr.name == name) {
            attr.value = value;
            return;
        }
    }
    items_.push_back({name, value});
}

bool Attributes::remove(std::string_view name) {
    auto it = std::find_if(items_.begin(), items_.end(),
        [name](const Attribute& a) { return a.name == name; });
    if (it == items_.end()) return false;
    items_.erase(it);
    return true;
}

bool Attributes::has(std::string_view name) const {
    return std::any_of(items_.begin(), items_.end(),
        [name](const Attribute& a) { return a.name == name; });
}

std::vector<std::string> Attributes::names() const {
    std::vector<std::string> result;
    result.reserve(items_.size());
    for (auto& attr : items_) {
        result.push_back(attr.name);
    }
    return result;
}

} // namespace asciidoc::dom
