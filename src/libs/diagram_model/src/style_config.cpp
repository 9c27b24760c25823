#include <diagram_model/style_config.hpp>
#include <diagram_model/errors.hpp>

namespace diagram_model {

NodeSize StyleConfig::node_size(const Node& node) const {
    const std::string key(to_string(node.type));
    auto it = dimensions.find(key);
    if (it == dimensions.end())
        throw DiagramError(ErrorKind::Style, "dimensions." + key,
            "no dimensions configured for node type '" + key + "'");
    NodeSize size = it->second;
    if (!node.detail.empty()) size.height += detail_extra_height;
    return size;
}

} // namespace diagram_model
