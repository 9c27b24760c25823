#include <diagram_loaders/json_loader.hpp>
#include <diagram_model/errors.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace diagram_loaders {

namespace {

using diagram_model::DiagramError;
using diagram_model::ErrorKind;

constexpr diagram_model::NodeType all_node_types[] = {
    diagram_model::NodeType::Start, diagram_model::NodeType::End, diagram_model::NodeType::Process,
    diagram_model::NodeType::Decision, diagram_model::NodeType::Note, diagram_model::NodeType::Success,
    diagram_model::NodeType::DarkPanel, diagram_model::NodeType::Cylinder, diagram_model::NodeType::Cloud,
    diagram_model::NodeType::Actor, diagram_model::NodeType::Icon,
};

[[noreturn]] void fail(const std::string& subject, const std::string& message) {
    throw DiagramError(ErrorKind::Config, subject, message);
}

const nlohmann::json& section(const nlohmann::json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || !j[key].is_object())
        fail(where + key, "configuration section '" + where + key + "' is missing");
    return j[key];
}

double number(const nlohmann::json& j, const char* key, const std::string& where, double fallback) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_number()) fail(where + key, "'" + where + key + "' must be a number");
    return j[key].get<double>();
}

std::string text(const nlohmann::json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || !j[key].is_string())
        fail(where + key, "'" + where + key + "' must be a string");
    return j[key].get<std::string>();
}

std::map<std::string, std::string> string_map(const nlohmann::json& j, const std::string& where) {
    std::map<std::string, std::string> out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) fail(where + it.key(), "'" + where + it.key() + "' must be a string");
        out.emplace(it.key(), it.value().get<std::string>());
    }
    return out;
}

diagram_model::ThemePalette parse_palette(const nlohmann::json& t, const std::string& where) {
    diagram_model::ThemePalette p;
    p.background = text(t, "background", where);
    p.detail_text = text(t, "detail_text", where);
    p.group_fill = text(t, "group_fill", where);
    p.lane_fill = text(t, "lane_fill", where);
    p.edge_stroke = text(t, "edge_stroke", where);
    p.label_font = text(t, "label_font", where);

    const auto& nodes = section(t, "nodes", where);
    for (auto it = nodes.begin(); it != nodes.end(); ++it) {
        const std::string entry = where + "nodes." + it.key() + ".";
        if (!it.value().is_object()) fail(entry, "'" + entry + "' must be an object");
        diagram_model::NodePalette np;
        np.fill = text(it.value(), "fill", entry);
        np.stroke = text(it.value(), "stroke", entry);
        np.font = text(it.value(), "font", entry);
        np.shape = text(it.value(), "shape", entry);
        p.nodes.emplace(it.key(), std::move(np));
    }
    p.edges = string_map(section(t, "edges", where), where + "edges.");
    p.edge_colors = string_map(section(t, "edge_colors", where), where + "edge_colors.");
    p.containers = string_map(section(t, "containers", where), where + "containers.");
    return p;
}

diagram_model::StyleConfig parse_config(const nlohmann::json& j) {
    if (!j.is_object()) fail("document", "style configuration must be a JSON object");
    diagram_model::StyleConfig cfg;

    const auto& page = section(j, "page", "");
    cfg.page.width = number(page, "width", "page.", cfg.page.width);
    cfg.page.content_left = number(page, "content_left", "page.", cfg.page.content_left);
    cfg.page.content_right = number(page, "content_right", "page.", cfg.page.content_right);
    cfg.page.min_height = number(page, "min_height", "page.", cfg.page.min_height);
    cfg.page.margin = number(page, "margin", "page.", cfg.page.margin);
    if (cfg.page.content_right <= cfg.page.content_left)
        fail("page.content_right", "page content area is empty");

    const auto& spacing = section(j, "spacing", "");
    cfg.spacing.h_gap = number(spacing, "h_gap", "spacing.", cfg.spacing.h_gap);
    cfg.spacing.v_gap = number(spacing, "v_gap", "spacing.", cfg.spacing.v_gap);
    cfg.spacing.group_padding = number(spacing, "group_padding", "spacing.", cfg.spacing.group_padding);
    cfg.spacing.title_bottom_margin =
        number(spacing, "title_bottom_margin", "spacing.", cfg.spacing.title_bottom_margin);
    cfg.spacing.swimlane_header = number(spacing, "swimlane_header", "spacing.", cfg.spacing.swimlane_header);
    cfg.spacing.swimlane_padding = number(spacing, "swimlane_padding", "spacing.", cfg.spacing.swimlane_padding);

    const auto& dims = section(j, "dimensions", "");
    cfg.detail_extra_height = number(dims, "detail_extra_height", "dimensions.", cfg.detail_extra_height);
    for (auto type : all_node_types) {
        const std::string key(diagram_model::to_string(type));
        if (!dims.contains(key)) fail("dimensions." + key, "no dimensions for node type '" + key + "'");
        const auto& wh = dims[key];
        if (!wh.is_array() || wh.size() != 2 || !wh[0].is_number() || !wh[1].is_number())
            fail("dimensions." + key, "'dimensions." + key + "' must be [width, height]");
        cfg.dimensions[key] = diagram_model::NodeSize{ wh[0].get<double>(), wh[1].get<double>() };
    }

    const auto& themes = section(j, "themes", "");
    cfg.light = parse_palette(section(themes, "light", "themes."), "themes.light.");
    cfg.dark = parse_palette(section(themes, "dark", "themes."), "themes.dark.");
    return cfg;
}

} // namespace

diagram_model::StyleConfig load_style_config_from_json(std::istream& in) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
        fail("json", std::string("invalid JSON: ") + ex.what());
    }
    return parse_config(j);
}

diagram_model::StyleConfig load_style_config_from_json_string(const std::string& text) {
    std::istringstream in(text);
    return load_style_config_from_json(in);
}

std::optional<diagram_model::StyleConfig> load_style_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_style_config_from_json(f);
}

} // namespace diagram_loaders
