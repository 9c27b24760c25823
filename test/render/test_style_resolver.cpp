#include <catch2/catch.hpp>

#include <diagram_render/number_format.hpp>
#include <diagram_render/style_attributes.hpp>
#include <diagram_render/style_resolver.hpp>
#include "test_support.hpp"

#include <algorithm>

using namespace diagram_model;
using namespace diagram_render;
using test_support::capture_error;
using test_support::node;

namespace {

constexpr NodeType all_types[] = {
    NodeType::Start, NodeType::End, NodeType::Process, NodeType::Decision, NodeType::Note,
    NodeType::Success, NodeType::DarkPanel, NodeType::Cylinder, NodeType::Cloud, NodeType::Actor,
    NodeType::Icon,
};

constexpr Variant all_variants[] = {
    Variant::Primary, Variant::Secondary, Variant::Accent, Variant::Warning, Variant::Danger,
    Variant::Neutral,
};

diagram_placement::ConnectionLine straight_down() {
    diagram_placement::ConnectionLine line;
    line.mode = diagram_placement::RoutingMode::Orthogonal;
    line.exit = { 0.5, 1.0 };
    line.entry = { 0.5, 0.0 };
    line.label_background = "#FFFFFF";
    return line;
}

} // namespace

TEST_CASE("StyleAttributes: parse keeps order and bare tokens", "[render][style]") {
    auto style = StyleAttributes::parse("ellipse;shape=cloud;whiteSpace=wrap;html=1;");
    REQUIRE(style.entries().size() == 4);
    CHECK(style.entries()[0].first == "ellipse");
    CHECK(style.has("shape"));
    CHECK(*style.get("shape") == "cloud");
    CHECK(style.str() == "ellipse;shape=cloud;whiteSpace=wrap;html=1;");

    style.set("shape", "note").set("fillColor", "#FFFFFF");
    CHECK(style.str() == "ellipse;shape=note;whiteSpace=wrap;html=1;fillColor=#FFFFFF;");
    CHECK(style.get("missing") == nullptr);
}

TEST_CASE("format_number: trims trailing zeros", "[render][style]") {
    CHECK(format_number(120) == "120");
    CHECK(format_number(0.5) == "0.5");
    CHECK(format_number(346.6666) == "346.67");
    CHECK(format_number(-0.001) == "0");
    CHECK(format_number(-12.25) == "-12.25");
}

TEST_CASE("palette_key: type with an optional variant", "[render][style]") {
    Node n = node("n");
    CHECK(palette_key(n) == "process/primary");
    n.variant = Variant::Danger;
    CHECK(palette_key(n) == "process/danger");
    n.type = NodeType::Cylinder;
    CHECK(palette_key(n) == "cylinder/danger");
    n.variant.reset();
    CHECK(palette_key(n) == "cylinder");
}

TEST_CASE("StyleResolver: every dark fill stays legible", "[render][style][dark]") {
    const StyleResolver resolver(test_support::style_config(), Theme::Dark);
    auto check_fill = [&](const Node& n) {
        const auto& p = resolver.node_palette(n);
        int r = 0, g = 0, b = 0;
        REQUIRE(parse_hex_color(p.fill, r, g, b));
        CHECK(std::max({ r, g, b }) >= min_dark_fill_channel);
    };
    for (auto type : all_types)
        check_fill(node("n", type));
    for (auto variant : all_variants) {
        Node n = node("n");
        n.variant = variant;
        check_fill(n);
    }
}

TEST_CASE("StyleResolver: node style is shape then colors", "[render][style]") {
    const auto& cfg = test_support::style_config();
    const StyleResolver resolver(cfg, Theme::Light);
    const auto& p = cfg.light.nodes.at("process/primary");

    const auto style = resolver.node_style(node("n"), "#123456");
    CHECK(style.str() == p.shape + "fillColor=" + p.fill + ";strokeColor=" + p.stroke
        + ";fontColor=" + p.font + ";");
    CHECK_FALSE(style.has("labelBackgroundColor"));
}

TEST_CASE("StyleResolver: icon nodes carry the image and their surface", "[render][style]") {
    const StyleResolver resolver(test_support::style_config(), Theme::Light);
    Node icon = node("logo", NodeType::Icon);
    icon.icon = "icons/logo.png";

    const auto style = resolver.node_style(icon, "#F8FAFC");
    REQUIRE(style.get("image"));
    CHECK(*style.get("image") == "icons/logo.png");
    CHECK(*style.get("labelBackgroundColor") == "#F8FAFC");
    CHECK(*style.get("shape") == "image");
}

TEST_CASE("StyleResolver: missing palette entries are style errors", "[render][style]") {
    StyleConfig cfg = test_support::style_config();

    SECTION("node") {
        cfg.dark.nodes.erase("process/danger");
        const StyleResolver resolver(cfg, Theme::Dark);
        Node n = node("n");
        n.variant = Variant::Danger;
        auto err = capture_error([&] { resolver.node_palette(n); });
        REQUIRE(err);
        CHECK(err->kind() == ErrorKind::Style);
        CHECK(err->subject() == "process/danger");
    }
    SECTION("variant the palette does not define") {
        const StyleResolver resolver(cfg, Theme::Light);
        Node n = node("q", NodeType::Decision);
        n.variant = Variant::Danger;
        auto err = capture_error([&] { resolver.node_style(n, "#FFFFFF"); });
        REQUIRE(err);
        CHECK(err->kind() == ErrorKind::Style);
        CHECK(err->subject() == "decision/danger");
    }
    SECTION("edge color") {
        cfg.light.edge_colors.erase("purple");
        const StyleResolver resolver(cfg, Theme::Light);
        Edge e = test_support::edge("a", "b");
        e.color = EdgeColor::Purple;
        auto err = capture_error([&] { resolver.edge_style(e, straight_down()); });
        REQUIRE(err);
        CHECK(err->subject() == "purple");
    }
    SECTION("container") {
        cfg.light.containers.erase("title");
        const StyleResolver resolver(cfg, Theme::Light);
        auto err = capture_error([&] { resolver.title_style(); });
        REQUIRE(err);
        CHECK(err->subject() == "title");
    }
}

TEST_CASE("StyleResolver: illegible dark fill is rejected, not corrected", "[render][style][dark]") {
    StyleConfig cfg = test_support::style_config();
    cfg.dark.nodes.at("cloud").fill = "#101820";
    cfg.light.nodes.at("cloud").fill = "#101820";

    auto err = capture_error([&] { StyleResolver(cfg, Theme::Dark).node_palette(node("c", NodeType::Cloud)); });
    REQUIRE(err);
    CHECK(err->kind() == ErrorKind::Style);
    CHECK(err->subject() == "cloud");

    CHECK_NOTHROW(StyleResolver(cfg, Theme::Light).node_palette(node("c", NodeType::Cloud)));
}

TEST_CASE("StyleResolver: edge descriptors", "[render][style]") {
    const auto& cfg = test_support::style_config();
    const StyleResolver resolver(cfg, Theme::Light);

    Edge e = test_support::edge("a", "b", EdgeStyle::Dashed);
    auto style = resolver.edge_style(e, straight_down());
    CHECK(*style.get("dashed") == "1");
    CHECK(*style.get("edgeStyle") == "orthogonalEdgeStyle");
    CHECK(*style.get("exitX") == "0.5");
    CHECK(*style.get("exitY") == "1");
    CHECK(*style.get("entryY") == "0");
    CHECK(*style.get("strokeColor") == cfg.light.edge_stroke);
    CHECK(*style.get("fontColor") == cfg.light.label_font);
    CHECK(*style.get("labelBackgroundColor") == "#FFFFFF");

    e.color = EdgeColor::Green;
    CHECK(*resolver.edge_style(e, straight_down()).get("strokeColor") == cfg.light.edge_colors.at("green"));

    auto fan = straight_down();
    fan.mode = diagram_placement::RoutingMode::Straight;
    CHECK(*resolver.edge_style(e, fan).get("edgeStyle") == "none");

    fan.mode = diagram_placement::RoutingMode::Curved;
    const auto curved = resolver.edge_style(e, fan);
    CHECK(*curved.get("curved") == "1");
    CHECK_FALSE(curved.has("edgeStyle"));
}

TEST_CASE("StyleResolver: containers", "[render][style]") {
    const auto& cfg = test_support::style_config();
    const StyleResolver resolver(cfg, Theme::Dark);

    diagram_placement::PlacedGroup group;
    CHECK(*resolver.group_style(group).get("fillColor") == cfg.dark.group_fill);
    CHECK(*resolver.group_style(group).get("strokeColor") == "#475569");
    group.color = "#FF00FF";
    CHECK(*resolver.group_style(group).get("strokeColor") == "#FF00FF");

    diagram_placement::PlacedLane lane;
    const auto lane_style = resolver.lane_style(lane);
    CHECK(*lane_style.get("startSize") == "44");
    CHECK(*lane_style.get("swimlaneFillColor") == cfg.dark.lane_fill);
    CHECK(lane_style.entries().front().first == "swimlane");
}
