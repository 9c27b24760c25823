#pragma once

#include <diagram_placement/types.hpp>
#include <diagram_model/style_config.hpp>
#include <diagram_model/types.hpp>

namespace diagram_placement {

// Computes boxes for every node, group and lane of a validated diagram,
// dispatching on diagram.layout. Pure: equal input gives equal output.
// Throws DiagramError(Layout) when a tree layout meets a cycle.
PlacedDiagram place_diagram(const diagram_model::Diagram& diagram,
    const diagram_model::StyleConfig& config);

} // namespace diagram_placement
