#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace diagram_render {

// Ordered draw.io style descriptor ("key=value;key=value;"). A bare token
// such as "ellipse" or "text" is kept as a key with an empty value and
// written without "=".
class StyleAttributes {
public:
    StyleAttributes() = default;

    static StyleAttributes parse(std::string_view descriptor);

    // Replaces the value in place when the key exists, else appends.
    StyleAttributes& set(const std::string& key, const std::string& value);
    StyleAttributes& append(const StyleAttributes& other);

    bool has(const std::string& key) const;
    const std::string* get(const std::string& key) const;
    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }

    std::string str() const;

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace diagram_render
