#pragma once

#include <string>
#include <vector>

namespace diagram_placement {

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

struct PlacedNode {
    std::string node_id;
    Rect rect;
    // Level (tree), row (grid, rows, flow), lane (swimlane), step (pipeline),
    // position (linear). 0 for every node of a horizontal layout.
    int tier = 0;
};

struct PlacedGroup {
    std::string group_id;
    std::string label;
    std::string color;
    std::vector<std::string> member_ids;
    Rect rect;
};

struct PlacedLane {
    std::string lane_id;
    std::string label;
    std::string color;
    std::vector<std::string> member_ids;
    Rect rect;
};

struct PlacedDiagram {
    std::vector<PlacedNode> placed_nodes; // same order as the input nodes
    std::vector<PlacedGroup> placed_groups;
    std::vector<PlacedLane> placed_lanes;
    double content_top = 0;
    double page_width = 0;
    double page_height = 0;
};

const PlacedNode* find_placed_node(const PlacedDiagram& placed, const std::string& node_id);

} // namespace diagram_placement
