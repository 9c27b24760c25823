#pragma once

#include <diagram_model/style_config.hpp>
#include <diagram_model/types.hpp>
#include <diagram_placement/types.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace diagram_placement {

enum class RoutingMode {
    Orthogonal, // right-angle segments, the default box-to-box route
    Curved,     // edge style "curved", or a curved fan-out edge
    Straight    // fan-out edge: one direct segment per target, no shared bus
};

// Connection point as a fraction of the box: (0.5, 1) is bottom-center.
struct Anchor {
    double x = 0.5;
    double y = 0.5;
};

struct ConnectionLine {
    std::size_t edge_index = 0;     // position in diagram.edges
    std::string source_node_id;
    std::string target_node_id;
    RoutingMode mode = RoutingMode::Orthogonal;
    Anchor exit;                    // on the source box
    Anchor entry;                   // on the target box
    std::vector<std::pair<double, double>> points; // full route in page coords, endpoints included
    std::string label_background;   // fill behind the edge label
};

// Route every edge of a placed diagram, in edge order.
std::vector<ConnectionLine> compute_connection_lines(
    const diagram_model::Diagram& diagram,
    const PlacedDiagram& placed,
    const diagram_model::ThemePalette& palette);

// Fill directly behind a node: its group fill, else its lane fill, else
// the page background.
std::string node_surface(const diagram_model::Diagram& diagram,
    const PlacedDiagram& placed,
    const diagram_model::ThemePalette& palette,
    const std::string& node_id);

} // namespace diagram_placement
