#pragma once

#include <diagram_model/style_config.hpp>
#include <diagram_model/types.hpp>
#include <diagram_placement/connection_lines.hpp>
#include <diagram_placement/types.hpp>
#include <diagram_render/style_resolver.hpp>
#include <string>
#include <vector>

namespace diagram_render {

// Serializes a placed, routed diagram as draw.io XML (mxfile). Cells are
// written title, subtitle, lanes, groups, edges, nodes; edges come before
// nodes so that connectors never paint over node labels.
std::string write_drawio(const diagram_model::Diagram& diagram,
    const diagram_placement::PlacedDiagram& placed,
    const std::vector<diagram_placement::ConnectionLine>& lines,
    const StyleResolver& styles);

// Validate, place, route, style and serialize in one pass. Any DiagramError
// propagates before a document is produced.
std::string generate_drawio(const diagram_model::Diagram& diagram,
    const diagram_model::StyleConfig& config);

// HTML cell value of a node: escaped label, then the detail line in a
// smaller font and the theme's detail color.
std::string node_value(const diagram_model::Node& node, const std::string& detail_color);

} // namespace diagram_render
