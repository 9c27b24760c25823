#pragma once

#include <diagram_model/style_config.hpp>
#include <diagram_model/types.hpp>
#include <diagram_placement/connection_lines.hpp>
#include <diagram_placement/types.hpp>
#include <diagram_render/style_attributes.hpp>
#include <string>

namespace diagram_render {

// Dark-theme fills must keep one channel at or above this value.
constexpr int min_dark_fill_channel = 70;

// Parses "#RRGGBB" (case-insensitive). Returns false on anything else.
bool parse_hex_color(const std::string& hex, int& r, int& g, int& b);

// Palette key of a node: "<type>/<variant>" when a variant is given, else the
// bare type name. A process node without a variant is "process/primary".
std::string palette_key(const diagram_model::Node& node);

// Turns (type, variant, theme) and (edge style, color, theme) into draw.io
// style descriptors. Never substitutes a default for a missing palette
// entry: every lookup failure is a DiagramError(Style) naming the key.
class StyleResolver {
public:
    StyleResolver(const diagram_model::StyleConfig& config, diagram_model::Theme theme);

    // Throws on a missing key, and on an illegible fill under the dark theme.
    const diagram_model::NodePalette& node_palette(const diagram_model::Node& node) const;

    // label_background is only used for icon nodes, whose label sits outside
    // the node on whatever surface lies behind it.
    StyleAttributes node_style(const diagram_model::Node& node,
        const std::string& label_background) const;
    StyleAttributes edge_style(const diagram_model::Edge& edge,
        const diagram_placement::ConnectionLine& line) const;
    StyleAttributes group_style(const diagram_placement::PlacedGroup& group) const;
    StyleAttributes lane_style(const diagram_placement::PlacedLane& lane) const;
    StyleAttributes title_style() const;
    StyleAttributes subtitle_style() const;

    const diagram_model::StyleConfig& config() const { return config_; }
    const diagram_model::ThemePalette& palette() const { return palette_; }
    diagram_model::Theme theme() const { return theme_; }

private:
    StyleAttributes container(const std::string& name) const;

    const diagram_model::StyleConfig& config_;
    const diagram_model::ThemePalette& palette_;
    diagram_model::Theme theme_;
};

} // namespace diagram_render
