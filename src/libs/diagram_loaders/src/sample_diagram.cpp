#include <diagram_loaders/sample_diagram.hpp>
#include <initializer_list>

namespace diagram_loaders {

diagram_model::Diagram generate_sample_diagram() {
    using diagram_model::EdgeColor;
    using diagram_model::EdgeStyle;
    using diagram_model::NodeType;
    using diagram_model::Variant;

    diagram_model::Diagram out;
    out.title = "Order fulfilment";
    out.subtitle = "From checkout to delivery";
    out.layout = diagram_model::LayoutKind::Branching;

    auto add_node = [&](const char* id, const char* label, NodeType type,
                        std::optional<Variant> variant = std::nullopt, const char* detail = "")
    {
        diagram_model::Node n;
        n.id = id;
        n.label = label;
        n.type = type;
        n.variant = variant;
        n.detail = detail;
        out.nodes.push_back(std::move(n));
    };
    auto add_edge = [&](const char* from, const char* to, EdgeStyle style = EdgeStyle::Solid,
                        std::optional<EdgeColor> color = std::nullopt, const char* label = "")
    {
        diagram_model::Edge e;
        e.source_node_id = from;
        e.target_node_id = to;
        e.style = style;
        e.color = color;
        e.label = label;
        out.edges.push_back(std::move(e));
    };
    auto add_group = [&](const char* id, const char* label, std::initializer_list<const char*> members) {
        diagram_model::Group g;
        g.id = id;
        g.label = label;
        for (auto m : members)
            g.member_ids.push_back(m);
        out.groups.push_back(std::move(g));
    };

    add_node("checkout", "Checkout", NodeType::Start);
    add_node("validate", "Validate order", NodeType::Process, Variant::Primary, "stock + address");
    add_node("pay", "Charge card", NodeType::Process, Variant::Accent);
    add_node("reserve", "Reserve stock", NodeType::Process, Variant::Secondary);
    add_node("fraud", "Fraud check", NodeType::Decision);
    add_node("pack", "Pack parcel", NodeType::Process, Variant::Neutral);
    add_node("ship", "Hand to carrier", NodeType::Process, Variant::Warning);
    add_node("orders", "Orders DB", NodeType::Cylinder);
    add_node("delivered", "Delivered", NodeType::Success);

    add_edge("checkout", "validate");
    add_edge("validate", "pay");
    add_edge("validate", "reserve");
    add_edge("pay", "fraud", EdgeStyle::Solid, EdgeColor::Purple);
    add_edge("fraud", "pack", EdgeStyle::Solid, EdgeColor::Green, "clear");
    add_edge("reserve", "pack", EdgeStyle::Dashed);
    add_edge("pack", "ship");
    add_edge("ship", "orders", EdgeStyle::Dotted, EdgeColor::Grey, "record");
    add_edge("ship", "delivered", EdgeStyle::Curved, EdgeColor::Green);

    add_group("payment", "Payment", { "pay", "fraud" });

    return out;
}

} // namespace diagram_loaders
