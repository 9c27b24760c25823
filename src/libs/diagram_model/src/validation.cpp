#include <diagram_model/validation.hpp>
#include <diagram_model/cell_ids.hpp>
#include <diagram_model/errors.hpp>
#include <diagram_model/log.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace diagram_model {

namespace {

[[noreturn]] void fail(const std::string& subject, const std::string& message) {
    throw DiagramError(ErrorKind::Schema, subject, message);
}

std::string layout_name(const Diagram& d) {
    return std::string(to_string(d.layout));
}

void check_node_ids(const Diagram& d, std::unordered_set<std::string>& ids) {
    for (const auto& n : d.nodes) {
        if (n.id.empty()) fail("nodes.id", "node with empty id");
        if (!ids.insert(n.id).second) fail(n.id, "duplicate node id '" + n.id + "'");
    }
}

void check_edge_refs(const Diagram& d, const std::unordered_set<std::string>& ids) {
    for (std::size_t i = 0; i < d.edges.size(); ++i) {
        const auto& e = d.edges[i];
        if (!ids.count(e.source_node_id))
            fail(e.source_node_id, "edge " + std::to_string(i) + " references unknown source node '"
                + e.source_node_id + "'");
        if (!ids.count(e.target_node_id))
            fail(e.target_node_id, "edge " + std::to_string(i) + " references unknown target node '"
                + e.target_node_id + "'");
    }
}

void check_lane_refs(const Diagram& d) {
    std::unordered_set<std::string> lane_ids;
    for (const auto& lane : d.lanes) {
        if (lane.id.empty()) fail("lanes.id", "lane with empty id");
        if (!lane_ids.insert(lane.id).second) fail(lane.id, "duplicate lane id '" + lane.id + "'");
    }
    for (const auto& n : d.nodes) {
        if (n.lane && !lane_ids.count(*n.lane))
            fail(*n.lane, "node '" + n.id + "' references undeclared lane '" + *n.lane + "'");
    }
}

void check_swimlane_fields(const Diagram& d, const std::unordered_set<std::string>& ids) {
    const bool swimlane = d.layout == LayoutKind::Swimlane;
    if (!swimlane) {
        if (!d.lanes.empty())
            fail("lanes", "lanes are only valid with the swimlane layout, not '" + layout_name(d) + "'");
        for (const auto& n : d.nodes)
            if (n.lane) fail(n.id, "node '" + n.id + "' has a lane but the layout is '" + layout_name(d) + "'");
        return;
    }
    if (d.lanes.empty()) fail("lanes", "swimlane layout requires at least one lane");

    std::unordered_map<std::string, std::string> listed_in;
    for (const auto& lane : d.lanes) {
        for (const auto& member : lane.member_ids) {
            if (!ids.count(member))
                fail(member, "lane '" + lane.id + "' lists unknown node '" + member + "'");
            auto [it, inserted] = listed_in.emplace(member, lane.id);
            if (!inserted && it->second != lane.id)
                fail(member, "node '" + member + "' is listed in lanes '" + it->second
                    + "' and '" + lane.id + "'");
        }
    }
    for (const auto& n : d.nodes) {
        auto it = listed_in.find(n.id);
        if (n.lane && it != listed_in.end() && it->second != *n.lane)
            fail(n.id, "node '" + n.id + "' declares lane '" + *n.lane + "' but is listed in lane '"
                + it->second + "'");
    }
}

void check_pipeline_fields(const Diagram& d, const std::unordered_set<std::string>& ids) {
    if (d.layout != LayoutKind::Pipeline) {
        if (!d.pipeline.empty())
            fail("pipeline", "pipeline is only valid with the pipeline layout, not '" + layout_name(d) + "'");
        return;
    }
    if (d.pipeline.empty()) return; // every node becomes its own step

    std::unordered_set<std::string> seen;
    for (std::size_t si = 0; si < d.pipeline.size(); ++si) {
        const auto& step = d.pipeline[si];
        if (step.empty()) fail("pipeline", "pipeline step " + std::to_string(si) + " is empty");
        for (const auto& id : step) {
            if (!ids.count(id)) fail(id, "pipeline references unknown node '" + id + "'");
            if (!seen.insert(id).second) fail(id, "node '" + id + "' appears twice in the pipeline");
        }
    }
    for (const auto& n : d.nodes)
        if (!seen.count(n.id)) fail(n.id, "node '" + n.id + "' is not placed by the pipeline");
}

void check_column_fields(const Diagram& d) {
    if (d.grid_columns) {
        if (d.layout != LayoutKind::Grid)
            fail("grid_columns", "grid_columns is only valid with the grid layout, not '" + layout_name(d) + "'");
        if (*d.grid_columns < 1) fail("grid_columns", "grid_columns must be at least 1");
    }
    if (d.flow_columns) {
        if (d.layout != LayoutKind::Flow)
            fail("flow_columns", "flow_columns is only valid with the flow layout, not '" + layout_name(d) + "'");
        if (*d.flow_columns < 1) fail("flow_columns", "flow_columns must be at least 1");
    }
    if (d.layout != LayoutKind::Rows) {
        for (const auto& n : d.nodes)
            if (n.row) fail(n.id, "node '" + n.id + "' has a row but the layout is '" + layout_name(d) + "'");
    }
}

void check_groups(const Diagram& d, const std::unordered_set<std::string>& ids) {
    for (const auto& g : d.groups) {
        if (g.id.empty()) fail("groups.id", "group with empty id");
        if (g.member_ids.empty()) fail(g.id, "group '" + g.id + "' has no members");
        for (const auto& member : g.member_ids)
            if (!ids.count(member)) fail(member, "group '" + g.id + "' lists unknown node '" + member + "'");
        if (g.member_ids.size() == 1)
            engine_logger()->warn("group '{}' has a single member; consider dropping it", g.id);
    }
}

void check_icons(const Diagram& d) {
    for (const auto& n : d.nodes) {
        if (n.type == NodeType::Icon && n.icon.empty())
            fail(n.id, "icon node '" + n.id + "' has no icon reference");
        if (n.type != NodeType::Icon && !n.icon.empty())
            fail(n.id, "node '" + n.id + "' carries an icon but its type is '"
                + std::string(to_string(n.type)) + "'");
    }
}

void check_cell_ids(const Diagram& d) {
    std::unordered_set<std::string> cells = { cell_ids::root, cell_ids::layer, cell_ids::title, cell_ids::subtitle };
    auto claim = [&](const std::string& id) {
        if (!cells.insert(id).second) fail(id, "document id '" + id + "' is used more than once");
    };
    for (const auto& n : d.nodes) claim(n.id);
    for (const auto& g : d.groups) claim(g.id);
    for (const auto& lane : d.lanes) claim(cell_ids::lane(lane.id));
    for (std::size_t i = 0; i < d.edges.size(); ++i) claim(cell_ids::edge(i));
}

} // namespace

void validate_references(const Diagram& diagram) {
    std::unordered_set<std::string> ids;
    check_node_ids(diagram, ids);
    check_edge_refs(diagram, ids);
    check_lane_refs(diagram);
}

void validate_diagram(const Diagram& diagram) {
    validate_references(diagram);
    std::unordered_set<std::string> ids;
    for (const auto& n : diagram.nodes) ids.insert(n.id);
    // Type, variant, style, color, theme and layout are closed enums here.
    check_swimlane_fields(diagram, ids);
    check_pipeline_fields(diagram, ids);
    check_column_fields(diagram);
    check_groups(diagram, ids);
    check_icons(diagram);
    check_cell_ids(diagram);

    engine_logger()->debug("validated diagram '{}': {} nodes, {} edges, layout {}",
        diagram.title, diagram.nodes.size(), diagram.edges.size(), layout_name(diagram));
}

} // namespace diagram_model
