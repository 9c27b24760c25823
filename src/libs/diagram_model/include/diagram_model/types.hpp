#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diagram_model {

enum class NodeType {
    Start,
    End,
    Process,
    Decision,
    Note,
    Success,
    DarkPanel,
    Cylinder,
    Cloud,
    Actor,
    Icon
};

enum class Variant { Primary, Secondary, Accent, Warning, Danger, Neutral };

enum class EdgeStyle { Solid, Curved, Dashed, Dotted, Bidirectional };

enum class EdgeColor { Green, Orange, Blue, Red, Purple, Grey };

enum class Theme { Light, Dark };

enum class LayoutKind {
    Linear,       // single column
    Horizontal,   // single row
    Branching,
    Hierarchical, // same engine as Branching
    Grid,
    Swimlane,
    Rows,
    Pipeline,
    Flow
};

struct Node {
    std::string id;
    std::string label;
    NodeType type = NodeType::Process;
    std::optional<Variant> variant;
    std::string detail;
    std::string icon;
    std::optional<std::string> row;
    std::optional<std::string> lane;
};

struct Edge {
    std::string source_node_id;
    std::string target_node_id;
    EdgeStyle style = EdgeStyle::Solid;
    std::optional<EdgeColor> color;
    std::string label;
};

struct Group {
    std::string id;
    std::string label;
    std::string color; // stroke override, empty = palette default
    std::vector<std::string> member_ids;
};

struct Lane {
    std::string id;
    std::string label;
    std::string color;
    std::vector<std::string> member_ids;
};

// One horizontal position of a pipeline: a single node or a vertical stack.
using PipelineStep = std::vector<std::string>;

struct Diagram {
    std::string title = "Diagram";
    std::string subtitle;
    Theme theme = Theme::Light;
    LayoutKind layout = LayoutKind::Linear;
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    std::vector<Group> groups;
    std::vector<Lane> lanes;
    std::vector<PipelineStep> pipeline;
    std::optional<int> grid_columns;
    std::optional<int> flow_columns;
};

// Tag <-> enum conversions. from_* return nullopt for unknown tags.
std::string_view to_string(NodeType type);
std::string_view to_string(Variant variant);
std::string_view to_string(EdgeStyle style);
std::string_view to_string(EdgeColor color);
std::string_view to_string(Theme theme);
std::string_view to_string(LayoutKind layout);

std::optional<NodeType> node_type_from_string(std::string_view s);
std::optional<Variant> variant_from_string(std::string_view s);
std::optional<EdgeStyle> edge_style_from_string(std::string_view s);
std::optional<EdgeColor> edge_color_from_string(std::string_view s);
std::optional<Theme> theme_from_string(std::string_view s);
std::optional<LayoutKind> layout_kind_from_string(std::string_view s);

bool is_tree_layout(LayoutKind layout);

const Node* find_node(const Diagram& diagram, const std::string& id);

// Member ids per lane, in lane order: explicit members first, then nodes whose
// lane field names the lane (input order). Nodes in no lane join the first lane.
std::vector<std::vector<std::string>> resolve_lane_members(const Diagram& diagram);

} // namespace diagram_model
