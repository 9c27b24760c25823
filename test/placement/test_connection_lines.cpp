#include <catch2/catch.hpp>

#include <diagram_placement/connection_lines.hpp>
#include <diagram_placement/placer.hpp>
#include "test_support.hpp"

using namespace diagram_model;
using namespace diagram_placement;
using test_support::edge;
using test_support::node;

namespace {

std::vector<ConnectionLine> route(const Diagram& d) {
    const auto& cfg = test_support::style_config();
    const auto placed = place_diagram(d, cfg);
    return compute_connection_lines(d, placed, cfg.palette(d.theme));
}

} // namespace

TEST_CASE("compute_connection_lines: aligned vertical edge has no bends", "[placement][routing]") {
    Diagram d;
    d.nodes = { node("a"), node("b") };
    d.edges = { edge("a", "b") };

    const auto lines = route(d);
    REQUIRE(lines.size() == 1);
    const auto& line = lines[0];
    CHECK(line.edge_index == 0);
    CHECK(line.source_node_id == "a");
    CHECK(line.target_node_id == "b");
    CHECK(line.mode == RoutingMode::Orthogonal);
    CHECK(line.exit.x == 0.5);
    CHECK(line.exit.y == 1.0);
    CHECK(line.entry.x == 0.5);
    CHECK(line.entry.y == 0.0);
    REQUIRE(line.points.size() == 2);
    CHECK(line.points[0].second == Approx(156));
    CHECK(line.points[1].second == Approx(206));
}

TEST_CASE("compute_connection_lines: fan-out goes straight, a single child stays orthogonal",
          "[placement][routing]") {
    Diagram d;
    d.layout = LayoutKind::Branching;
    d.nodes = { node("root"), node("left"), node("right"), node("tail", NodeType::End) };
    d.edges = { edge("root", "left"), edge("root", "right"), edge("right", "tail") };

    const auto lines = route(d);
    REQUIRE(lines.size() == 3);
    CHECK(lines[0].mode == RoutingMode::Straight);
    CHECK(lines[1].mode == RoutingMode::Straight);
    CHECK(lines[0].points.size() == 2);
    // tail is centered under right.
    CHECK(lines[2].mode == RoutingMode::Orthogonal);
    CHECK(lines[2].points.size() == 2);
}

TEST_CASE("compute_connection_lines: vertical route bends at mid height", "[placement][routing]") {
    StyleConfig cfg = test_support::style_config();
    cfg.spacing.v_gap = 200;

    Diagram d;
    d.layout = LayoutKind::Branching;
    d.nodes = { node("r1"), node("r2"), node("child") };
    d.edges = { edge("r1", "child"), edge("r2", "child") };

    const auto lines = compute_connection_lines(d, place_diagram(d, cfg), cfg.light);
    REQUIRE(lines.size() == 2);
    const auto& line = lines[0];
    CHECK(line.mode == RoutingMode::Orthogonal);
    REQUIRE(line.points.size() == 4);
    // r1 bottom-center (440, 156) to child top-center (600, 356).
    CHECK(line.points[0].first == Approx(440));
    CHECK(line.points[0].second == Approx(156));
    CHECK(line.points[1].first == Approx(440));
    CHECK(line.points[1].second == Approx(256));
    CHECK(line.points[2].first == Approx(600));
    CHECK(line.points[2].second == Approx(256));
    CHECK(line.points[3].first == Approx(600));
    CHECK(line.points[3].second == Approx(356));
}

TEST_CASE("compute_connection_lines: mostly sideways route bends at mid width", "[placement][routing]") {
    Diagram d;
    d.layout = LayoutKind::Branching;
    d.nodes = { node("r1"), node("r2"), node("child") };
    d.edges = { edge("r1", "child"), edge("r2", "child") };

    const auto lines = route(d);
    const auto& line = lines[0];
    // Centers differ by 160 across and 106 down: leave right, enter left.
    CHECK(line.exit.x == 1.0);
    CHECK(line.entry.x == 0.0);
    REQUIRE(line.points.size() == 4);
    CHECK(line.points[0].first == Approx(570));
    CHECK(line.points[0].second == Approx(128));
    CHECK(line.points[1].first == Approx(520));
    CHECK(line.points[1].second == Approx(128));
    CHECK(line.points[2].first == Approx(520));
    CHECK(line.points[2].second == Approx(234));
    CHECK(line.points[3].first == Approx(470));
    CHECK(line.points[3].second == Approx(234));
}

TEST_CASE("compute_connection_lines: horizontal neighbours connect side to side", "[placement][routing]") {
    Diagram d;
    d.layout = LayoutKind::Horizontal;
    d.nodes = { node("a"), node("b") };
    d.edges = { edge("a", "b"), edge("b", "a") };

    const auto lines = route(d);
    CHECK(lines[0].exit.x == 1.0);
    CHECK(lines[0].entry.x == 0.0);
    CHECK(lines[1].exit.x == 0.0);
    CHECK(lines[1].entry.x == 1.0);
    CHECK(lines[0].exit.y == 0.5);
}

TEST_CASE("compute_connection_lines: fan-out never shares a bus", "[placement][routing]") {
    Diagram d;
    d.layout = LayoutKind::Branching;
    d.nodes = { node("src"), node("t1"), node("t2"), node("t3") };
    d.edges = { edge("src", "t1"), edge("src", "t2", EdgeStyle::Curved), edge("src", "t3") };

    const auto lines = route(d);
    CHECK(lines[0].mode == RoutingMode::Straight);
    CHECK(lines[1].mode == RoutingMode::Curved);
    CHECK(lines[2].mode == RoutingMode::Straight);
    for (const auto& line : lines) CHECK(line.points.size() == 2);
}

TEST_CASE("compute_connection_lines: curved style without fan-out", "[placement][routing]") {
    Diagram d;
    d.nodes = { node("a"), node("b") };
    d.edges = { edge("a", "b", EdgeStyle::Curved) };
    CHECK(route(d)[0].mode == RoutingMode::Curved);
}

TEST_CASE("compute_connection_lines: label background follows containers", "[placement][routing]") {
    const auto& palette = test_support::style_config().light;

    SECTION("groups") {
        Diagram d;
        d.nodes = { node("a"), node("b"), node("c") };
        d.edges = { edge("a", "b"), edge("b", "c") };
        Group g;
        g.id = "g";
        g.member_ids = { "a", "b" };
        d.groups = { g };

        const auto lines = route(d);
        CHECK(lines[0].label_background == palette.group_fill);
        CHECK(lines[1].label_background == palette.background);
    }
    SECTION("lanes") {
        Diagram d;
        d.layout = LayoutKind::Swimlane;
        d.nodes = { node("a"), node("b"), node("c") };
        Lane ops, dev;
        ops.id = "ops";
        dev.id = "dev";
        d.lanes = { ops, dev };
        d.nodes[2].lane = "dev";
        d.edges = { edge("a", "b"), edge("a", "c") };

        const auto lines = route(d);
        CHECK(lines[0].label_background == palette.lane_fill);
        CHECK(lines[1].label_background == palette.background);
    }
}

TEST_CASE("node_surface: group over lane over page", "[placement][routing]") {
    const auto& cfg = test_support::style_config();
    Diagram d;
    d.layout = LayoutKind::Swimlane;
    d.theme = Theme::Dark;
    d.nodes = { node("grouped"), node("laned") };
    Lane lane;
    lane.id = "only";
    d.lanes = { lane };
    Group g;
    g.id = "g";
    g.member_ids = { "grouped" };
    d.groups = { g };

    const auto placed = place_diagram(d, cfg);
    CHECK(node_surface(d, placed, cfg.dark, "grouped") == cfg.dark.group_fill);
    CHECK(node_surface(d, placed, cfg.dark, "laned") == cfg.dark.lane_fill);

    Diagram flat;
    flat.nodes = { node("x") };
    const auto flat_placed = place_diagram(flat, cfg);
    CHECK(node_surface(flat, flat_placed, cfg.dark, "x") == cfg.dark.background);
}
