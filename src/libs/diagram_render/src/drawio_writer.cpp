#include <diagram_render/drawio_writer.hpp>
#include <diagram_render/number_format.hpp>
#include <diagram_placement/layout_constants.hpp>
#include <diagram_placement/placer.hpp>
#include <diagram_model/cell_ids.hpp>
#include <diagram_model/log.hpp>
#include <diagram_model/validation.hpp>
#include <tinyxml2.h>
#include <cstdint>
#include <cstdio>

namespace diagram_render {

namespace {

std::string escape_html(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out += c;
        }
    }
    return out;
}

// 64-bit FNV-1a.
std::string fingerprint(const char* text) {
    std::uint64_t h = 14695981039346656037ull;
    for (const char* p = text; *p; ++p) {
        h ^= static_cast<unsigned char>(*p);
        h *= 1099511628211ull;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(h));
    return buf;
}

class CellWriter {
public:
    CellWriter(tinyxml2::XMLDocument& doc, tinyxml2::XMLElement* root)
        : doc_(doc), root_(root) {}

    tinyxml2::XMLElement* vertex(const std::string& id, const std::string& value,
        const StyleAttributes& style, const diagram_placement::Rect& r)
    {
        auto* cell = cell_element(id, value, style);
        cell->SetAttribute("vertex", "1");
        cell->SetAttribute("parent", diagram_model::cell_ids::layer);
        auto* geo = doc_.NewElement("mxGeometry");
        geo->SetAttribute("x", format_number(r.x).c_str());
        geo->SetAttribute("y", format_number(r.y).c_str());
        geo->SetAttribute("width", format_number(r.width).c_str());
        geo->SetAttribute("height", format_number(r.height).c_str());
        geo->SetAttribute("as", "geometry");
        cell->InsertEndChild(geo);
        return cell;
    }

    tinyxml2::XMLElement* edge(const std::string& id, const diagram_model::Edge& e,
        const StyleAttributes& style, const diagram_placement::ConnectionLine& line)
    {
        auto* cell = cell_element(id, escape_html(e.label), style);
        cell->SetAttribute("edge", "1");
        cell->SetAttribute("parent", diagram_model::cell_ids::layer);
        cell->SetAttribute("source", e.source_node_id.c_str());
        cell->SetAttribute("target", e.target_node_id.c_str());

        auto* geo = doc_.NewElement("mxGeometry");
        geo->SetAttribute("relative", "1");
        geo->SetAttribute("as", "geometry");
        // Endpoints are implied by the anchors; only bends become waypoints.
        if (line.points.size() > 2) {
            auto* array = doc_.NewElement("Array");
            array->SetAttribute("as", "points");
            for (std::size_t i = 1; i + 1 < line.points.size(); ++i) {
                auto* pt = doc_.NewElement("mxPoint");
                pt->SetAttribute("x", format_number(line.points[i].first).c_str());
                pt->SetAttribute("y", format_number(line.points[i].second).c_str());
                array->InsertEndChild(pt);
            }
            geo->InsertEndChild(array);
        }
        cell->InsertEndChild(geo);
        return cell;
    }

private:
    tinyxml2::XMLElement* cell_element(const std::string& id, const std::string& value,
        const StyleAttributes& style)
    {
        auto* cell = doc_.NewElement("mxCell");
        cell->SetAttribute("id", id.c_str());
        cell->SetAttribute("value", value.c_str());
        cell->SetAttribute("style", style.str().c_str());
        root_->InsertEndChild(cell);
        return cell;
    }

    tinyxml2::XMLDocument& doc_;
    tinyxml2::XMLElement* root_;
};

} // namespace

std::string node_value(const diagram_model::Node& node, const std::string& detail_color) {
    std::string value = escape_html(node.label);
    if (!node.detail.empty()) {
        value += "<br><font style='font-size:10px;color:" + detail_color + "'>";
        value += escape_html(node.detail);
        value += "</font>";
    }
    return value;
}

std::string write_drawio(const diagram_model::Diagram& diagram,
    const diagram_placement::PlacedDiagram& placed,
    const std::vector<diagram_placement::ConnectionLine>& lines,
    const StyleResolver& styles)
{
    namespace layout = diagram_placement::layout;
    namespace ids = diagram_model::cell_ids;
    const auto& palette = styles.palette();

    tinyxml2::XMLDocument doc;
    doc.InsertEndChild(doc.NewDeclaration());

    auto* mxfile = doc.NewElement("mxfile");
    mxfile->SetAttribute("host", "diagram_forge");
    doc.InsertEndChild(mxfile);

    auto* drawio_diagram = doc.NewElement("diagram");
    drawio_diagram->SetAttribute("name", "Page-1");
    mxfile->InsertEndChild(drawio_diagram);

    auto* model = doc.NewElement("mxGraphModel");
    model->SetAttribute("grid", "1");
    model->SetAttribute("gridSize", "10");
    model->SetAttribute("guides", "1");
    model->SetAttribute("tooltips", "1");
    model->SetAttribute("connect", "1");
    model->SetAttribute("arrows", "1");
    model->SetAttribute("fold", "1");
    model->SetAttribute("page", "1");
    model->SetAttribute("pageScale", "1");
    model->SetAttribute("pageWidth", format_number(placed.page_width).c_str());
    model->SetAttribute("pageHeight", format_number(placed.page_height).c_str());
    model->SetAttribute("math", "0");
    model->SetAttribute("shadow", "0");
    if (styles.theme() == diagram_model::Theme::Dark)
        model->SetAttribute("background", palette.background.c_str());
    drawio_diagram->InsertEndChild(model);

    auto* root = doc.NewElement("root");
    model->InsertEndChild(root);

    auto* cell0 = doc.NewElement("mxCell");
    cell0->SetAttribute("id", ids::root);
    root->InsertEndChild(cell0);
    auto* cell1 = doc.NewElement("mxCell");
    cell1->SetAttribute("id", ids::layer);
    cell1->SetAttribute("parent", ids::root);
    root->InsertEndChild(cell1);

    CellWriter cells(doc, root);

    const auto& content = styles.config().page;
    double text_y = layout::title_y;
    if (!diagram.title.empty()) {
        cells.vertex(ids::title, escape_html(diagram.title), styles.title_style(),
            { content.content_left, text_y, content.content_width(), layout::title_height });
        text_y += layout::title_height;
    }
    if (!diagram.subtitle.empty()) {
        cells.vertex(ids::subtitle, escape_html(diagram.subtitle), styles.subtitle_style(),
            { content.content_left, text_y, content.content_width(), layout::subtitle_height });
    }

    for (const auto& lane : placed.placed_lanes)
        cells.vertex(ids::lane(lane.lane_id), escape_html(lane.label), styles.lane_style(lane), lane.rect);

    for (const auto& group : placed.placed_groups)
        cells.vertex(group.group_id, escape_html(group.label), styles.group_style(group), group.rect);

    for (const auto& line : lines) {
        const auto& e = diagram.edges[line.edge_index];
        cells.edge(ids::edge(line.edge_index), e, styles.edge_style(e, line), line);
    }

    for (std::size_t i = 0; i < diagram.nodes.size(); ++i) {
        const auto& node = diagram.nodes[i];
        const auto& pn = placed.placed_nodes[i];
        std::string surface;
        if (node.type == diagram_model::NodeType::Icon)
            surface = diagram_placement::node_surface(diagram, placed, palette, node.id);
        cells.vertex(node.id, node_value(node, palette.detail_text), styles.node_style(node, surface), pn.rect);
    }

    // Stable id: a hash of everything the diagram element holds.
    tinyxml2::XMLPrinter model_text(nullptr, true);
    model->Accept(&model_text);
    drawio_diagram->SetAttribute("id", ("diagram-" + fingerprint(model_text.CStr())).c_str());

    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return printer.CStr();
}

std::string generate_drawio(const diagram_model::Diagram& diagram,
    const diagram_model::StyleConfig& config)
{
    auto log = diagram_model::engine_logger();
    diagram_model::validate_diagram(diagram);
    const auto placed = diagram_placement::place_diagram(diagram, config);
    const StyleResolver styles(config, diagram.theme);
    const auto lines = diagram_placement::compute_connection_lines(diagram, placed, styles.palette());
    std::string xml = write_drawio(diagram, placed, lines, styles);
    log->info("generated '{}': {} nodes, {} edges, {} layout, {} theme",
        diagram.title, diagram.nodes.size(), diagram.edges.size(),
        diagram_model::to_string(diagram.layout), diagram_model::to_string(diagram.theme));
    return xml;
}

} // namespace diagram_render
