#include <diagram_placement/connection_lines.hpp>
#include <diagram_placement/layout_constants.hpp>
#include <diagram_model/errors.hpp>
#include <diagram_model/log.hpp>
#include <algorithm>
#include <cmath>

namespace diagram_placement {

namespace {

struct BlockRect {
    double x, y, w, h;
    double cx() const { return x + w * 0.5; }
    double cy() const { return y + h * 0.5; }
};

BlockRect block_rect(const PlacedNode& n) {
    return { n.rect.x, n.rect.y, n.rect.width, n.rect.height };
}

struct AnchorPair {
    Anchor exit, entry;
    bool vertical; // exit on top/bottom rather than left/right
};

// Anchors on the facing sides: bottom->top when the target lies mostly
// below, right->left when mostly to the right, and the mirrors.
AnchorPair facing_anchors(const BlockRect& from, const BlockRect& to) {
    const double dx = to.cx() - from.cx();
    const double dy = to.cy() - from.cy();
    AnchorPair a;
    a.vertical = std::abs(dy) >= std::abs(dx);
    if (a.vertical) {
        a.exit = dy >= 0 ? Anchor{ 0.5, 1.0 } : Anchor{ 0.5, 0.0 };
        a.entry = dy >= 0 ? Anchor{ 0.5, 0.0 } : Anchor{ 0.5, 1.0 };
    } else {
        a.exit = dx >= 0 ? Anchor{ 1.0, 0.5 } : Anchor{ 0.0, 0.5 };
        a.entry = dx >= 0 ? Anchor{ 0.0, 0.5 } : Anchor{ 1.0, 0.5 };
    }
    return a;
}

std::pair<double, double> anchor_point(const BlockRect& r, const Anchor& a) {
    return { r.x + r.w * a.x, r.y + r.h * a.y };
}

const PlacedNode& placed_node(const PlacedDiagram& placed, const std::string& id) {
    const PlacedNode* pn = find_placed_node(placed, id);
    if (!pn)
        throw diagram_model::DiagramError(diagram_model::ErrorKind::Schema, id,
            "edge references unplaced node '" + id + "'");
    return *pn;
}

bool in_group(const diagram_model::Group& g, const std::string& id) {
    return std::find(g.member_ids.begin(), g.member_ids.end(), id) != g.member_ids.end();
}

bool in_lane(const PlacedLane& l, const std::string& id) {
    return std::find(l.member_ids.begin(), l.member_ids.end(), id) != l.member_ids.end();
}

// Edges whose source fans out to two or more distinct targets on one row.
std::vector<bool> find_fan_out(const diagram_model::Diagram& diagram, const PlacedDiagram& placed) {
    std::vector<bool> fan_out(diagram.edges.size(), false);
    for (std::size_t i = 0; i < diagram.edges.size(); ++i) {
        const auto& e = diagram.edges[i];
        const double row_y = block_rect(placed_node(placed, e.target_node_id)).cy();
        std::vector<std::string> siblings;
        std::vector<std::size_t> members;
        for (std::size_t j = 0; j < diagram.edges.size(); ++j) {
            const auto& other = diagram.edges[j];
            if (other.source_node_id != e.source_node_id) continue;
            const double y = block_rect(placed_node(placed, other.target_node_id)).cy();
            if (std::abs(y - row_y) >= layout::same_row_tolerance) continue;
            members.push_back(j);
            if (std::find(siblings.begin(), siblings.end(), other.target_node_id) == siblings.end())
                siblings.push_back(other.target_node_id);
        }
        if (siblings.size() >= 2)
            for (auto j : members) fan_out[j] = true;
    }
    return fan_out;
}

} // namespace

std::string node_surface(const diagram_model::Diagram& diagram,
    const PlacedDiagram& placed,
    const diagram_model::ThemePalette& palette,
    const std::string& node_id)
{
    // Groups paint above lanes.
    for (const auto& g : diagram.groups)
        if (in_group(g, node_id)) return palette.group_fill;
    for (const auto& l : placed.placed_lanes)
        if (in_lane(l, node_id)) return palette.lane_fill;
    return palette.background;
}

std::vector<ConnectionLine> compute_connection_lines(
    const diagram_model::Diagram& diagram,
    const PlacedDiagram& placed,
    const diagram_model::ThemePalette& palette)
{
    std::vector<ConnectionLine> lines;
    const std::vector<bool> fan_out = find_fan_out(diagram, placed);

    for (std::size_t i = 0; i < diagram.edges.size(); ++i) {
        const auto& e = diagram.edges[i];
        const BlockRect from = block_rect(placed_node(placed, e.source_node_id));
        const BlockRect to = block_rect(placed_node(placed, e.target_node_id));

        ConnectionLine line;
        line.edge_index = i;
        line.source_node_id = e.source_node_id;
        line.target_node_id = e.target_node_id;

        const bool curved = e.style == diagram_model::EdgeStyle::Curved;
        if (fan_out[i]) line.mode = curved ? RoutingMode::Curved : RoutingMode::Straight;
        else line.mode = curved ? RoutingMode::Curved : RoutingMode::Orthogonal;

        const AnchorPair a = facing_anchors(from, to);
        line.exit = a.exit;
        line.entry = a.entry;
        const auto start = anchor_point(from, a.exit);
        const auto end = anchor_point(to, a.entry);
        line.points.push_back(start);

        // Orthogonal routes bend at the midpoint unless already aligned.
        if (line.mode == RoutingMode::Orthogonal) {
            if (a.vertical && std::abs(end.first - start.first) > layout::bend_threshold) {
                const double mid_y = (start.second + end.second) * 0.5;
                line.points.push_back({ start.first, mid_y });
                line.points.push_back({ end.first, mid_y });
            } else if (!a.vertical && std::abs(end.second - start.second) > layout::bend_threshold) {
                const double mid_x = (start.first + end.first) * 0.5;
                line.points.push_back({ mid_x, start.second });
                line.points.push_back({ mid_x, end.second });
            }
        }
        line.points.push_back(end);

        // Label sits between the endpoints: use the container both share.
        line.label_background = palette.background;
        bool shared = false;
        for (const auto& g : diagram.groups) {
            if (in_group(g, e.source_node_id) && in_group(g, e.target_node_id)) {
                line.label_background = palette.group_fill;
                shared = true;
                break;
            }
        }
        if (!shared) {
            for (const auto& l : placed.placed_lanes) {
                if (in_lane(l, e.source_node_id) && in_lane(l, e.target_node_id)) {
                    line.label_background = palette.lane_fill;
                    break;
                }
            }
        }
        lines.push_back(std::move(line));
    }

    diagram_model::engine_logger()->debug("routed {} edges ({} fan-out)", lines.size(),
        std::count(fan_out.begin(), fan_out.end(), true));
    return lines;
}

} // namespace diagram_placement
