#include <diagram_render/style_attributes.hpp>

namespace diagram_render {

StyleAttributes StyleAttributes::parse(std::string_view descriptor) {
    StyleAttributes out;
    std::size_t pos = 0;
    while (pos < descriptor.size()) {
        std::size_t end = descriptor.find(';', pos);
        if (end == std::string_view::npos) end = descriptor.size();
        const std::string_view token = descriptor.substr(pos, end - pos);
        pos = end + 1;
        if (token.empty()) continue;

        const std::size_t eq = token.find('=');
        if (eq == std::string_view::npos)
            out.set(std::string(token), std::string());
        else
            out.set(std::string(token.substr(0, eq)), std::string(token.substr(eq + 1)));
    }
    return out;
}

StyleAttributes& StyleAttributes::set(const std::string& key, const std::string& value) {
    for (auto& kv : entries_) {
        if (kv.first == key) {
            kv.second = value;
            return *this;
        }
    }
    entries_.emplace_back(key, value);
    return *this;
}

StyleAttributes& StyleAttributes::append(const StyleAttributes& other) {
    for (const auto& kv : other.entries_) set(kv.first, kv.second);
    return *this;
}

bool StyleAttributes::has(const std::string& key) const {
    return get(key) != nullptr;
}

const std::string* StyleAttributes::get(const std::string& key) const {
    for (const auto& kv : entries_)
        if (kv.first == key) return &kv.second;
    return nullptr;
}

std::string StyleAttributes::str() const {
    std::string out;
    for (const auto& kv : entries_) {
        out += kv.first;
        if (!kv.second.empty()) {
            out += '=';
            out += kv.second;
        }
        out += ';';
    }
    return out;
}

} // namespace diagram_render
