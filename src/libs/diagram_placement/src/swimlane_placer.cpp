#include <diagram_placement/layout_constants.hpp>
#include <diagram_model/log.hpp>
#include "layout_passes.hpp"
#include <algorithm>

namespace diagram_placement {
namespace detail {

std::vector<PlacedLane> place_swimlanes(LayoutPass& pass) {
    const auto& spacing = pass.config.spacing;
    const auto& page = pass.config.page;
    const auto members = diagram_model::resolve_lane_members(pass.diagram);

    double empty_lane_h = layout::fallback_row_height;
    auto process = pass.config.dimensions.find("process");
    if (process != pass.config.dimensions.end()) empty_lane_h = process->second.height;

    std::vector<PlacedLane> lanes;
    double y = pass.top;
    double lane_w = page.content_width();
    for (std::size_t l = 0; l < pass.diagram.lanes.size(); ++l) {
        const auto& lane = pass.diagram.lanes[l];

        double max_h = 0.0;
        for (const auto& id : members[l])
            max_h = std::max(max_h, pass.nodes[pass.index_of(id)].rect.height);
        if (members[l].empty()) max_h = empty_lane_h;

        const double lane_h = spacing.swimlane_header + max_h + 2 * spacing.swimlane_padding;
        const double body_top = y + spacing.swimlane_header + spacing.swimlane_padding;

        double x = page.content_left + spacing.swimlane_padding;
        for (const auto& id : members[l]) {
            auto& pn = pass.nodes[pass.index_of(id)];
            pn.rect.x = x;
            pn.rect.y = body_top + (max_h - pn.rect.height) / 2;
            pn.tier = static_cast<int>(l);
            x += pn.rect.width + pass.h_gap();
        }
        // x ran one gap past the last member; swap it for the right padding.
        if (!members[l].empty())
            lane_w = std::max(lane_w, x - pass.h_gap() + spacing.swimlane_padding - page.content_left);

        PlacedLane pl;
        pl.lane_id = lane.id;
        pl.label = lane.label;
        pl.color = lane.color;
        pl.member_ids = members[l];
        pl.rect = Rect{ page.content_left, y, 0.0, lane_h };
        lanes.push_back(std::move(pl));
        y += lane_h;
    }
    for (auto& pl : lanes) pl.rect.width = lane_w;

    diagram_model::engine_logger()->debug("swimlane: {} lanes, width {}", lanes.size(), lane_w);
    return lanes;
}

} // namespace detail
} // namespace diagram_placement
