#include <diagram_placement/placer.hpp>
#include <diagram_placement/layout_constants.hpp>
#include <diagram_model/errors.hpp>
#include <diagram_model/log.hpp>
#include "layout_passes.hpp"
#include <algorithm>
#include <limits>

namespace diagram_placement {

namespace detail {

std::size_t LayoutPass::index_of(const std::string& node_id) const {
    for (std::size_t i = 0; i < nodes.size(); ++i)
        if (nodes[i].node_id == node_id) return i;
    throw diagram_model::DiagramError(diagram_model::ErrorKind::Schema, node_id,
        "layout references unknown node '" + node_id + "'");
}

double place_centered_row(LayoutPass& pass, const std::vector<std::size_t>& members, double y, int tier) {
    if (members.empty()) return 0.0;
    double total_w = pass.h_gap() * static_cast<double>(members.size() - 1);
    double max_h = 0.0;
    for (auto i : members) {
        total_w += pass.nodes[i].rect.width;
        max_h = std::max(max_h, pass.nodes[i].rect.height);
    }
    double x = std::max(pass.config.page.content_left, (pass.config.page.width - total_w) / 2);
    for (auto i : members) {
        Rect& r = pass.nodes[i].rect;
        r.x = x;
        r.y = y + (max_h - r.height) / 2;
        pass.nodes[i].tier = tier;
        x += r.width + pass.h_gap();
    }
    return max_h;
}

void place_linear(LayoutPass& pass) {
    double y = pass.top;
    int tier = 0;
    for (auto& pn : pass.nodes) {
        pn.rect.x = (pass.config.page.width - pn.rect.width) / 2;
        pn.rect.y = y;
        pn.tier = tier++;
        // Same edge-to-edge gap between every pair of successive boxes.
        y += pn.rect.height + pass.v_gap();
    }
}

void place_horizontal(LayoutPass& pass) {
    std::vector<std::size_t> all(pass.nodes.size());
    for (std::size_t i = 0; i < all.size(); ++i) all[i] = i;
    place_centered_row(pass, all, pass.top, 0);
}

} // namespace detail

namespace {

const double unbounded = std::numeric_limits<double>::infinity();

std::vector<PlacedGroup> place_groups(const diagram_model::Diagram& diagram,
    const diagram_model::StyleConfig& config, const std::vector<PlacedNode>& nodes)
{
    const double pad = config.spacing.group_padding;
    std::vector<PlacedGroup> out;
    for (const auto& g : diagram.groups) {
        double left = unbounded, top = unbounded;
        double right = -unbounded, bottom = -unbounded;
        for (const auto& member : g.member_ids) {
            const PlacedNode* pn = nullptr;
            for (const auto& n : nodes)
                if (n.node_id == member) pn = &n;
            if (!pn) continue;
            left = std::min(left, pn->rect.x);
            top = std::min(top, pn->rect.y);
            right = std::max(right, pn->rect.x + pn->rect.width);
            bottom = std::max(bottom, pn->rect.y + pn->rect.height);
        }
        if (left == unbounded) continue; // validation guarantees members; keep layout total

        PlacedGroup pg;
        pg.group_id = g.id;
        pg.label = g.label;
        pg.color = g.color;
        pg.member_ids = g.member_ids;
        pg.rect = Rect{ left - pad, top - pad, (right - left) + 2 * pad, (bottom - top) + 2 * pad };
        out.push_back(std::move(pg));
    }
    return out;
}

void size_page(PlacedDiagram& out, const diagram_model::StyleConfig& config) {
    double max_x = 0.0, max_y = 0.0;
    auto extend = [&](const Rect& r) {
        max_x = std::max(max_x, r.x + r.width);
        max_y = std::max(max_y, r.y + r.height);
    };
    for (const auto& n : out.placed_nodes) extend(n.rect);
    for (const auto& g : out.placed_groups) extend(g.rect);
    for (const auto& l : out.placed_lanes) extend(l.rect);
    out.page_width = std::max(config.page.width, max_x + config.page.margin);
    out.page_height = std::max(config.page.min_height, max_y + config.page.margin);
}

} // namespace

const PlacedNode* find_placed_node(const PlacedDiagram& placed, const std::string& node_id) {
    for (const auto& n : placed.placed_nodes)
        if (n.node_id == node_id) return &n;
    return nullptr;
}

PlacedDiagram place_diagram(const diagram_model::Diagram& diagram,
    const diagram_model::StyleConfig& config)
{
    PlacedDiagram out;
    out.content_top = layout::content_top(diagram, config.spacing);

    for (const auto& n : diagram.nodes) {
        PlacedNode pn;
        pn.node_id = n.id;
        const auto size = config.node_size(n);
        pn.rect.width = size.width;
        pn.rect.height = size.height;
        out.placed_nodes.push_back(std::move(pn));
    }

    detail::LayoutPass pass{ diagram, config, out.content_top, out.placed_nodes };
    switch (diagram.layout) {
    case diagram_model::LayoutKind::Linear: detail::place_linear(pass); break;
    case diagram_model::LayoutKind::Horizontal: detail::place_horizontal(pass); break;
    case diagram_model::LayoutKind::Branching:
    case diagram_model::LayoutKind::Hierarchical: detail::place_tree(pass); break;
    case diagram_model::LayoutKind::Grid: detail::place_grid(pass); break;
    case diagram_model::LayoutKind::Swimlane: out.placed_lanes = detail::place_swimlanes(pass); break;
    case diagram_model::LayoutKind::Rows: detail::place_rows(pass); break;
    case diagram_model::LayoutKind::Pipeline: detail::place_pipeline(pass); break;
    case diagram_model::LayoutKind::Flow: detail::place_flow(pass); break;
    }

    out.placed_groups = place_groups(diagram, config, out.placed_nodes);
    size_page(out, config);

    diagram_model::engine_logger()->debug("placed {} nodes, {} groups, {} lanes with {} layout; page {}x{}",
        out.placed_nodes.size(), out.placed_groups.size(), out.placed_lanes.size(),
        diagram_model::to_string(diagram.layout), out.page_width, out.page_height);
    return out;
}

} // namespace diagram_placement
