#pragma once

#include <diagram_model/style_config.hpp>
#include <diagram_model/types.hpp>
#include <optional>
#include <istream>
#include <string>

namespace diagram_loaders {

// Parse a diagram description. Throws DiagramError(Schema) on malformed JSON,
// missing required fields, wrong value types and unknown enum tags.
diagram_model::Diagram load_diagram_from_json(std::istream& in);
diagram_model::Diagram load_diagram_from_json_string(const std::string& text);
// nullopt if the file cannot be opened; parse errors still throw.
std::optional<diagram_model::Diagram> load_diagram_from_json_file(const std::string& path);

// Parse the palette/dimension resource. Throws DiagramError(Config).
diagram_model::StyleConfig load_style_config_from_json(std::istream& in);
diagram_model::StyleConfig load_style_config_from_json_string(const std::string& text);
std::optional<diagram_model::StyleConfig> load_style_config_from_json_file(const std::string& path);

} // namespace diagram_loaders
