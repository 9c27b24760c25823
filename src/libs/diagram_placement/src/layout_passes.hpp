#pragma once

#include <diagram_placement/types.hpp>
#include <diagram_model/style_config.hpp>
#include <diagram_model/types.hpp>
#include <cstddef>
#include <vector>

namespace diagram_placement {
namespace detail {

// Everything a layout pass reads. nodes[i] is pre-sized and pre-named for
// diagram.nodes[i]; a pass only writes rect.x, rect.y and tier.
struct LayoutPass {
    const diagram_model::Diagram& diagram;
    const diagram_model::StyleConfig& config;
    double top = 0;
    std::vector<PlacedNode>& nodes;

    double h_gap() const { return config.spacing.h_gap; }
    double v_gap() const { return config.spacing.v_gap; }
    std::size_t index_of(const std::string& node_id) const;
};

// Lays members out left-to-right, centered on the page (never left of the
// content area), each vertically centered in the row. Returns row height.
double place_centered_row(LayoutPass& pass, const std::vector<std::size_t>& members, double y, int tier);

void place_linear(LayoutPass& pass);
void place_horizontal(LayoutPass& pass);
void place_grid(LayoutPass& pass);
void place_rows(LayoutPass& pass);
void place_flow(LayoutPass& pass);
void place_pipeline(LayoutPass& pass);
void place_tree(LayoutPass& pass);
std::vector<PlacedLane> place_swimlanes(LayoutPass& pass);

} // namespace detail
} // namespace diagram_placement
