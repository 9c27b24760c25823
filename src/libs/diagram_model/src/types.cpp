#include <diagram_model/types.hpp>
#include <array>
#include <unordered_set>
#include <utility>

namespace diagram_model {

namespace {

template <typename Enum, std::size_t N>
using TagTable = std::array<std::pair<Enum, std::string_view>, N>;

constexpr TagTable<NodeType, 11> node_type_tags = {{
    { NodeType::Start, "start" },
    { NodeType::End, "end" },
    { NodeType::Process, "process" },
    { NodeType::Decision, "decision" },
    { NodeType::Note, "note" },
    { NodeType::Success, "success" },
    { NodeType::DarkPanel, "dark_panel" },
    { NodeType::Cylinder, "cylinder" },
    { NodeType::Cloud, "cloud" },
    { NodeType::Actor, "actor" },
    { NodeType::Icon, "icon" },
}};

constexpr TagTable<Variant, 6> variant_tags = {{
    { Variant::Primary, "primary" },
    { Variant::Secondary, "secondary" },
    { Variant::Accent, "accent" },
    { Variant::Warning, "warning" },
    { Variant::Danger, "danger" },
    { Variant::Neutral, "neutral" },
}};

constexpr TagTable<EdgeStyle, 5> edge_style_tags = {{
    { EdgeStyle::Solid, "solid" },
    { EdgeStyle::Curved, "curved" },
    { EdgeStyle::Dashed, "dashed" },
    { EdgeStyle::Dotted, "dotted" },
    { EdgeStyle::Bidirectional, "bidirectional" },
}};

constexpr TagTable<EdgeColor, 6> edge_color_tags = {{
    { EdgeColor::Green, "green" },
    { EdgeColor::Orange, "orange" },
    { EdgeColor::Blue, "blue" },
    { EdgeColor::Red, "red" },
    { EdgeColor::Purple, "purple" },
    { EdgeColor::Grey, "grey" },
}};

constexpr TagTable<Theme, 2> theme_tags = {{
    { Theme::Light, "light" },
    { Theme::Dark, "dark" },
}};

constexpr TagTable<LayoutKind, 9> layout_tags = {{
    { LayoutKind::Linear, "linear" },
    { LayoutKind::Horizontal, "horizontal" },
    { LayoutKind::Branching, "branching" },
    { LayoutKind::Hierarchical, "hierarchical" },
    { LayoutKind::Grid, "grid" },
    { LayoutKind::Swimlane, "swimlane" },
    { LayoutKind::Rows, "rows" },
    { LayoutKind::Pipeline, "pipeline" },
    { LayoutKind::Flow, "flow" },
}};

template <typename Enum, std::size_t N>
std::string_view tag_of(const TagTable<Enum, N>& table, Enum value) {
    for (const auto& entry : table)
        if (entry.first == value) return entry.second;
    return {};
}

template <typename Enum, std::size_t N>
std::optional<Enum> enum_of(const TagTable<Enum, N>& table, std::string_view tag) {
    for (const auto& entry : table)
        if (entry.second == tag) return entry.first;
    return std::nullopt;
}

} // namespace

std::string_view to_string(NodeType type) { return tag_of(node_type_tags, type); }
std::string_view to_string(Variant variant) { return tag_of(variant_tags, variant); }
std::string_view to_string(EdgeStyle style) { return tag_of(edge_style_tags, style); }
std::string_view to_string(EdgeColor color) { return tag_of(edge_color_tags, color); }
std::string_view to_string(Theme theme) { return tag_of(theme_tags, theme); }
std::string_view to_string(LayoutKind layout) { return tag_of(layout_tags, layout); }

std::optional<NodeType> node_type_from_string(std::string_view s) { return enum_of(node_type_tags, s); }
std::optional<Variant> variant_from_string(std::string_view s) { return enum_of(variant_tags, s); }
std::optional<EdgeStyle> edge_style_from_string(std::string_view s) { return enum_of(edge_style_tags, s); }
std::optional<EdgeColor> edge_color_from_string(std::string_view s) { return enum_of(edge_color_tags, s); }
std::optional<Theme> theme_from_string(std::string_view s) { return enum_of(theme_tags, s); }
std::optional<LayoutKind> layout_kind_from_string(std::string_view s) { return enum_of(layout_tags, s); }

bool is_tree_layout(LayoutKind layout) {
    return layout == LayoutKind::Branching || layout == LayoutKind::Hierarchical;
}

const Node* find_node(const Diagram& diagram, const std::string& id) {
    for (const auto& n : diagram.nodes)
        if (n.id == id) return &n;
    return nullptr;
}

std::vector<std::vector<std::string>> resolve_lane_members(const Diagram& diagram) {
    std::vector<std::vector<std::string>> out(diagram.lanes.size());
    if (diagram.lanes.empty()) return out;

    std::unordered_set<std::string> placed;
    for (std::size_t li = 0; li < diagram.lanes.size(); ++li) {
        for (const auto& id : diagram.lanes[li].member_ids)
            if (placed.insert(id).second) out[li].push_back(id);
    }
    for (const auto& n : diagram.nodes) {
        if (placed.count(n.id)) continue;
        std::size_t target = 0;
        if (n.lane) {
            for (std::size_t li = 0; li < diagram.lanes.size(); ++li)
                if (diagram.lanes[li].id == *n.lane) target = li;
        }
        out[target].push_back(n.id);
        placed.insert(n.id);
    }
    return out;
}

} // namespace diagram_model
