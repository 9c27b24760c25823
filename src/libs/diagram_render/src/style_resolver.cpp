#include <diagram_render/style_resolver.hpp>
#include <diagram_render/number_format.hpp>
#include <diagram_model/errors.hpp>
#include <algorithm>
#include <cctype>

namespace diagram_render {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

[[noreturn]] void missing(const std::string& key, const std::string& what) {
    throw diagram_model::DiagramError(diagram_model::ErrorKind::Style, key,
        "palette has no " + what + " '" + key + "'");
}

} // namespace

bool parse_hex_color(const std::string& hex, int& r, int& g, int& b) {
    if (hex.size() != 7 || hex[0] != '#') return false;
    int channel[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = hex_digit(hex[1 + 2 * i]);
        const int lo = hex_digit(hex[2 + 2 * i]);
        if (hi < 0 || lo < 0) return false;
        channel[i] = hi * 16 + lo;
    }
    r = channel[0];
    g = channel[1];
    b = channel[2];
    return true;
}

std::string palette_key(const diagram_model::Node& node) {
    std::string key(diagram_model::to_string(node.type));
    if (node.variant)
        key += "/" + std::string(diagram_model::to_string(*node.variant));
    else if (node.type == diagram_model::NodeType::Process)
        key += "/primary";
    return key;
}

StyleResolver::StyleResolver(const diagram_model::StyleConfig& config, diagram_model::Theme theme)
    : config_(config)
    , palette_(config.palette(theme))
    , theme_(theme)
{
}

const diagram_model::NodePalette& StyleResolver::node_palette(const diagram_model::Node& node) const {
    const std::string key = palette_key(node);
    auto it = palette_.nodes.find(key);
    if (it == palette_.nodes.end()) missing(key, "node style");

    if (theme_ == diagram_model::Theme::Dark) {
        int r = 0, g = 0, b = 0;
        if (!parse_hex_color(it->second.fill, r, g, b))
            throw diagram_model::DiagramError(diagram_model::ErrorKind::Style, key,
                "dark fill '" + it->second.fill + "' is not a #RRGGBB color");
        if (std::max({ r, g, b }) < min_dark_fill_channel)
            throw diagram_model::DiagramError(diagram_model::ErrorKind::Style, key,
                "dark fill '" + it->second.fill + "' is too close to black to read");
    }
    return it->second;
}

StyleAttributes StyleResolver::node_style(const diagram_model::Node& node,
    const std::string& label_background) const
{
    const auto& p = node_palette(node);
    StyleAttributes style = StyleAttributes::parse(p.shape);
    style.set("fillColor", p.fill);
    style.set("strokeColor", p.stroke);
    style.set("fontColor", p.font);
    if (node.type == diagram_model::NodeType::Icon) {
        style.set("image", node.icon);
        style.set("labelBackgroundColor", label_background);
    }
    return style;
}

StyleAttributes StyleResolver::edge_style(const diagram_model::Edge& edge,
    const diagram_placement::ConnectionLine& line) const
{
    const std::string key(diagram_model::to_string(edge.style));
    auto base = palette_.edges.find(key);
    if (base == palette_.edges.end()) missing(key, "edge style");

    StyleAttributes style = StyleAttributes::parse(base->second);
    switch (line.mode) {
    case diagram_placement::RoutingMode::Orthogonal:
        style.set("edgeStyle", "orthogonalEdgeStyle");
        style.set("rounded", "0");
        break;
    case diagram_placement::RoutingMode::Curved:
        style.set("curved", "1");
        break;
    case diagram_placement::RoutingMode::Straight:
        style.set("edgeStyle", "none");
        break;
    }
    style.set("exitX", format_number(line.exit.x));
    style.set("exitY", format_number(line.exit.y));
    style.set("entryX", format_number(line.entry.x));
    style.set("entryY", format_number(line.entry.y));

    std::string stroke = palette_.edge_stroke;
    if (edge.color) {
        const std::string color_key(diagram_model::to_string(*edge.color));
        auto c = palette_.edge_colors.find(color_key);
        if (c == palette_.edge_colors.end()) missing(color_key, "edge color");
        stroke = c->second;
    }
    style.set("strokeColor", stroke);
    style.set("fontColor", palette_.label_font);
    style.set("labelBackgroundColor", line.label_background);
    return style;
}

StyleAttributes StyleResolver::group_style(const diagram_placement::PlacedGroup& group) const {
    StyleAttributes style = container("group");
    style.set("fillColor", palette_.group_fill);
    if (!group.color.empty()) style.set("strokeColor", group.color);
    return style;
}

StyleAttributes StyleResolver::lane_style(const diagram_placement::PlacedLane& lane) const {
    StyleAttributes style = container("swimlane");
    style.set("startSize", format_number(config_.spacing.swimlane_header));
    style.set("fillColor", palette_.lane_fill);
    style.set("swimlaneFillColor", palette_.lane_fill);
    if (!lane.color.empty()) style.set("strokeColor", lane.color);
    return style;
}

StyleAttributes StyleResolver::title_style() const {
    return container("title");
}

StyleAttributes StyleResolver::subtitle_style() const {
    return container("subtitle");
}

StyleAttributes StyleResolver::container(const std::string& name) const {
    auto it = palette_.containers.find(name);
    if (it == palette_.containers.end()) missing(name, "container style");
    return StyleAttributes::parse(it->second);
}

} // namespace diagram_render
