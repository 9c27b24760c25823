#include <diagram_loaders/json_loader.hpp>
#include <diagram_model/errors.hpp>
#include <diagram_model/validation.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace diagram_loaders {

namespace {

using diagram_model::DiagramError;
using diagram_model::ErrorKind;

[[noreturn]] void fail(const std::string& subject, const std::string& message) {
    throw DiagramError(ErrorKind::Schema, subject, message);
}

bool has(const nlohmann::json& obj, const char* key) {
    return obj.contains(key) && !obj[key].is_null();
}

std::string string_field(const nlohmann::json& obj, const char* key, const std::string& where,
    const std::string& fallback = "")
{
    if (!has(obj, key)) return fallback;
    if (!obj[key].is_string()) fail(where + "." + key, "'" + where + "." + key + "' must be a string");
    return obj[key].get<std::string>();
}

std::string required_string(const nlohmann::json& obj, const char* key, const std::string& where) {
    if (!has(obj, key)) fail(where + "." + key, "missing required field '" + where + "." + key + "'");
    return string_field(obj, key, where);
}

// First unknown enum tag of a document. It is reported only after the
// reference checks, which come first in validation order.
struct PendingTagError {
    std::optional<DiagramError> first;
};

template <typename Enum, typename Parse>
Enum tag_field(PendingTagError& pending, const nlohmann::json& obj, const char* key,
    const std::string& where, Enum fallback, Parse parse, const char* what)
{
    if (!has(obj, key)) return fallback;
    const std::string tag = string_field(obj, key, where);
    auto value = parse(tag);
    if (!value) {
        if (!pending.first)
            pending.first.emplace(ErrorKind::Schema, where + "." + key,
                std::string("unknown ") + what + " '" + tag + "'");
        return fallback;
    }
    return *value;
}

// Row keys may be given as strings or numbers; 2 and "2" name the same row.
std::string row_key(const nlohmann::json& v, const std::string& where) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (std::floor(d) == d && std::abs(d) < 1e15) return std::to_string(static_cast<long long>(d));
        return v.dump();
    }
    fail(where + ".row", "'" + where + ".row' must be a string or a number");
}

std::vector<std::string> id_list(const nlohmann::json& obj, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!has(obj, key)) return out;
    if (!obj[key].is_array()) fail(where + "." + key, "'" + where + "." + key + "' must be an array");
    for (const auto& v : obj[key]) {
        if (!v.is_string()) fail(where + "." + key, "'" + where + "." + key + "' must hold node ids");
        out.push_back(v.get<std::string>());
    }
    return out;
}

std::optional<int> column_count(const nlohmann::json& j, const char* key) {
    if (!has(j, key)) return std::nullopt;
    const auto& v = j[key];
    if (!v.is_number_integer()) fail(key, std::string("'") + key + "' must be an integer");
    const bool in_range = v.is_number_unsigned()
        ? v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : v.get<std::int64_t>() >= std::numeric_limits<int>::min()
            && v.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) fail(key, std::string("'") + key + "' is out of range");
    return v.get<int>();
}

diagram_model::Node parse_node(PendingTagError& pending, const nlohmann::json& n, std::size_t index) {
    if (!n.is_object()) fail("nodes", "nodes[" + std::to_string(index) + "] must be an object");
    diagram_model::Node node;
    node.id = required_string(n, "id", "nodes[" + std::to_string(index) + "]");
    const std::string where = "nodes." + node.id;
    node.label = string_field(n, "label", where);
    node.type = tag_field(pending, n, "type", where, diagram_model::NodeType::Process,
        diagram_model::node_type_from_string, "node type");
    if (has(n, "variant"))
        node.variant = tag_field(pending, n, "variant", where, diagram_model::Variant::Primary,
            diagram_model::variant_from_string, "variant");
    node.detail = string_field(n, "detail", where);
    node.icon = string_field(n, "icon", where);
    if (has(n, "row")) node.row = row_key(n["row"], where);
    if (has(n, "lane")) node.lane = string_field(n, "lane", where);
    return node;
}

diagram_model::Edge parse_edge(PendingTagError& pending, const nlohmann::json& e, std::size_t index) {
    const std::string where = "edges[" + std::to_string(index) + "]";
    if (!e.is_object()) fail("edges", where + " must be an object");
    diagram_model::Edge edge;
    edge.source_node_id = required_string(e, "from", where);
    edge.target_node_id = required_string(e, "to", where);
    edge.label = string_field(e, "label", where);
    edge.style = tag_field(pending, e, "style", where, diagram_model::EdgeStyle::Solid,
        diagram_model::edge_style_from_string, "edge style");
    if (has(e, "color"))
        edge.color = tag_field(pending, e, "color", where, diagram_model::EdgeColor::Grey,
            diagram_model::edge_color_from_string, "edge color");
    return edge;
}

diagram_model::Diagram parse_json(const nlohmann::json& j) {
    if (!j.is_object()) fail("document", "diagram description must be a JSON object");
    if (!j.contains("nodes") || !j["nodes"].is_array()) fail("nodes", "missing required 'nodes' array");

    PendingTagError pending;
    diagram_model::Diagram d;
    d.title = string_field(j, "title", "diagram", d.title);
    d.subtitle = string_field(j, "subtitle", "diagram");
    d.theme = tag_field(pending, j, "theme", "diagram", diagram_model::Theme::Light,
        diagram_model::theme_from_string, "theme");
    d.layout = tag_field(pending, j, "layout", "diagram", diagram_model::LayoutKind::Linear,
        diagram_model::layout_kind_from_string, "layout");

    const auto& nodes = j["nodes"];
    for (std::size_t i = 0; i < nodes.size(); ++i)
        d.nodes.push_back(parse_node(pending, nodes[i], i));

    if (has(j, "edges")) {
        if (!j["edges"].is_array()) fail("edges", "'edges' must be an array");
        const auto& edges = j["edges"];
        for (std::size_t i = 0; i < edges.size(); ++i)
            d.edges.push_back(parse_edge(pending, edges[i], i));
    }

    if (has(j, "groups")) {
        if (!j["groups"].is_array()) fail("groups", "'groups' must be an array");
        std::size_t index = 0;
        for (const auto& g : j["groups"]) {
            const std::string where = "groups[" + std::to_string(index) + "]";
            if (!g.is_object()) fail("groups", where + " must be an object");
            diagram_model::Group group;
            group.id = string_field(g, "id", where, "group_" + std::to_string(index));
            group.label = string_field(g, "label", where);
            group.color = string_field(g, "color", where);
            group.member_ids = id_list(g, "members", where);
            d.groups.push_back(std::move(group));
            ++index;
        }
    }

    if (has(j, "lanes")) {
        if (!j["lanes"].is_array()) fail("lanes", "'lanes' must be an array");
        std::size_t index = 0;
        for (const auto& l : j["lanes"]) {
            const std::string where = "lanes[" + std::to_string(index) + "]";
            if (!l.is_object()) fail("lanes", where + " must be an object");
            diagram_model::Lane lane;
            lane.id = required_string(l, "id", where);
            lane.label = string_field(l, "label", where, lane.id);
            lane.color = string_field(l, "color", where);
            lane.member_ids = id_list(l, "members", where);
            d.lanes.push_back(std::move(lane));
            ++index;
        }
    }

    if (has(j, "pipeline")) {
        if (!j["pipeline"].is_array()) fail("pipeline", "'pipeline' must be an array");
        for (const auto& entry : j["pipeline"]) {
            if (entry.is_string()) {
                d.pipeline.push_back({ entry.get<std::string>() });
            } else if (entry.is_array()) {
                diagram_model::PipelineStep step;
                for (const auto& id : entry) {
                    if (!id.is_string()) fail("pipeline", "pipeline stacks must hold node ids");
                    step.push_back(id.get<std::string>());
                }
                d.pipeline.push_back(std::move(step));
            } else {
                fail("pipeline", "pipeline entries must be node ids or lists of node ids");
            }
        }
    }

    d.grid_columns = column_count(j, "grid_columns");
    d.flow_columns = column_count(j, "flow_columns");

    if (pending.first) {
        diagram_model::validate_references(d);
        throw *pending.first;
    }
    return d;
}

} // namespace

diagram_model::Diagram load_diagram_from_json(std::istream& in) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
        fail("json", std::string("invalid JSON: ") + ex.what());
    }
    return parse_json(j);
}

diagram_model::Diagram load_diagram_from_json_string(const std::string& text) {
    std::istringstream in(text);
    return load_diagram_from_json(in);
}

std::optional<diagram_model::Diagram> load_diagram_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_diagram_from_json(f);
}

} // namespace diagram_loaders
