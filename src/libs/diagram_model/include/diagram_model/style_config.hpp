#pragma once

#include <diagram_model/types.hpp>
#include <map>
#include <string>

namespace diagram_model {

// Palette and dimension resource. Loaded once, shared read-only by every run.

struct PageConfig {
    double width = 1200;
    double content_left = 60;
    double content_right = 1140;
    double min_height = 800;
    double margin = 200; // added below/right of the content to size the page
    double content_width() const { return content_right - content_left; }
};

struct SpacingConfig {
    double h_gap = 60;  // minimum horizontal gap between sibling boxes
    double v_gap = 50;  // gap between levels, rows and stacked boxes
    double group_padding = 30;
    double title_bottom_margin = 30;
    double swimlane_header = 44;
    double swimlane_padding = 32;
};

struct NodeSize {
    double width = 0;
    double height = 0;
};

struct NodePalette {
    std::string fill;
    std::string stroke;
    std::string font;
    std::string shape; // ordered "key=value;" descriptor without colors
};

struct ThemePalette {
    std::string background;
    std::string detail_text;
    std::string group_fill;
    std::string lane_fill;
    std::string edge_stroke;
    std::string label_font;
    std::map<std::string, NodePalette> nodes;       // "type" or "type/variant"
    std::map<std::string, std::string> edges;       // edge style tag -> descriptor
    std::map<std::string, std::string> edge_colors; // edge color tag -> "#RRGGBB"
    std::map<std::string, std::string> containers;  // title, subtitle, group, swimlane
};

struct StyleConfig {
    PageConfig page;
    SpacingConfig spacing;
    std::map<std::string, NodeSize> dimensions; // node type tag -> size
    double detail_extra_height = 20;
    ThemePalette light;
    ThemePalette dark;

    const ThemePalette& palette(Theme theme) const {
        return theme == Theme::Dark ? dark : light;
    }

    // Throws DiagramError(Style) when the type has no configured size.
    NodeSize node_size(const Node& node) const;
};

} // namespace diagram_model
