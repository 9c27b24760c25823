#pragma once

#include <diagram_model/types.hpp>

namespace diagram_model {

// Checks referential integrity and layout-field consistency of a parsed
// diagram. Stops at the first problem and throws DiagramError(Schema) whose
// subject() is the offending id or field. Unknown enum tags never get this
// far: the loaders reject them while parsing.
void validate_diagram(const Diagram& diagram);

// The first three checks of validate_diagram: unique node ids, edge
// endpoints, lane references. The loaders run these before reporting an
// unknown enum tag.
void validate_references(const Diagram& diagram);

} // namespace diagram_model
