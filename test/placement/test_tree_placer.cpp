#include <catch2/catch.hpp>

#include <diagram_placement/placer.hpp>
#include "test_support.hpp"

#include <string>

using namespace diagram_model;
using diagram_placement::place_diagram;
using test_support::capture_error;
using test_support::center_x;
using test_support::edge;
using test_support::node;
using test_support::placed;

TEST_CASE("tree layout: merge point sits below its deepest parent", "[placement][tree]") {
    Diagram d;
    d.layout = LayoutKind::Branching;
    d.nodes = { node("R"), node("P1"), node("Q"), node("P2"), node("M") };
    d.edges = { edge("R", "P1"), edge("R", "Q"), edge("Q", "P2"), edge("P1", "M"), edge("P2", "M") };

    const auto out = place_diagram(d, test_support::style_config());
    CHECK(placed(out, "R").tier == 0);
    CHECK(placed(out, "P1").tier == 1);
    CHECK(placed(out, "Q").tier == 1);
    CHECK(placed(out, "P2").tier == 2);
    CHECK(placed(out, "M").tier == 3);

    const double p1 = center_x(placed(out, "P1").rect);
    const double p2 = center_x(placed(out, "P2").rect);
    CHECK(center_x(placed(out, "M").rect) == Approx((p1 + p2) / 2));

    // Siblings under R are centered on it with the minimum gap between them.
    CHECK(placed(out, "P1").rect.x == Approx(310));
    CHECK(placed(out, "Q").rect.x == Approx(630));
    CHECK(center_x(placed(out, "P2").rect) == Approx(center_x(placed(out, "Q").rect)));

    CHECK(placed(out, "M").rect.y == Approx(418));
}

TEST_CASE("tree layout: level is one past the deepest parent", "[placement][tree]") {
    Diagram d;
    d.layout = LayoutKind::Hierarchical;
    d.nodes = { node("a"), node("b"), node("c"), node("d") };
    // d has parents at levels 0 and 2.
    d.edges = { edge("a", "b"), edge("b", "c"), edge("c", "d"), edge("a", "d") };

    const auto out = place_diagram(d, test_support::style_config());
    CHECK(placed(out, "d").tier == 3);
    CHECK(placed(out, "d").rect.y > placed(out, "c").rect.y);
}

TEST_CASE("tree layout: several roots share the first row", "[placement][tree]") {
    Diagram d;
    d.layout = LayoutKind::Branching;
    d.nodes = { node("r1"), node("r2"), node("child") };
    d.edges = { edge("r1", "child"), edge("r2", "child") };

    const auto out = place_diagram(d, test_support::style_config());
    CHECK(placed(out, "r1").rect.y == placed(out, "r2").rect.y);
    CHECK(placed(out, "r2").rect.x - (placed(out, "r1").rect.x + 260) == Approx(60));
    CHECK(center_x(placed(out, "child").rect) == Approx(600));
}

TEST_CASE("tree layout: wide levels keep the gap and stay on the page", "[placement][tree]") {
    Diagram d;
    d.layout = LayoutKind::Branching;
    d.nodes.push_back(node("root"));
    for (int i = 0; i < 5; ++i) {
        const std::string id = "c" + std::to_string(i);
        d.nodes.push_back(node(id));
        d.edges.push_back(edge("root", id));
    }

    const auto out = place_diagram(d, test_support::style_config());
    CHECK(placed(out, "c0").rect.x == Approx(60));
    for (int i = 1; i < 5; ++i) {
        const auto& prev = placed(out, "c" + std::to_string(i - 1)).rect;
        const auto& cur = placed(out, "c" + std::to_string(i)).rect;
        CHECK(cur.x - (prev.x + prev.width) >= 60 - 1e-9);
    }
    CHECK(out.page_width > 1200);
}

TEST_CASE("tree layout: neighbouring clusters are pushed apart", "[placement][tree]") {
    Diagram d;
    d.layout = LayoutKind::Branching;
    d.nodes = { node("a"), node("b"), node("a1"), node("a2"), node("b1"), node("b2") };
    d.edges = { edge("a", "a1"), edge("a", "a2"), edge("b", "b1"), edge("b", "b2") };

    const auto out = place_diagram(d, test_support::style_config());
    const auto& a2 = placed(out, "a2").rect;
    const auto& b1 = placed(out, "b1").rect;
    CHECK(b1.x - (a2.x + a2.width) >= 60 - 1e-9);
    CHECK(placed(out, "a1").rect.x < placed(out, "b1").rect.x);
}

TEST_CASE("tree layout: a cycle is a layout error naming its nodes", "[placement][tree]") {
    Diagram d;
    d.layout = LayoutKind::Branching;
    d.nodes = { node("a"), node("b"), node("c"), node("d") };
    d.edges = { edge("a", "b"), edge("b", "c"), edge("c", "b"), edge("c", "d") };

    auto err = capture_error([&] { place_diagram(d, test_support::style_config()); });
    REQUIRE(err);
    CHECK(err->kind() == ErrorKind::Layout);
    CHECK(err->subject() == "b");
    const std::string message = err->what();
    CHECK(message.substr(message.rfind(':')) == ": b, c");
}

TEST_CASE("tree layout: a self loop is a cycle", "[placement][tree]") {
    Diagram d;
    d.layout = LayoutKind::Hierarchical;
    d.nodes = { node("solo") };
    d.edges = { edge("solo", "solo") };

    auto err = capture_error([&] { place_diagram(d, test_support::style_config()); });
    REQUIRE(err);
    CHECK(err->subject() == "solo");
}
