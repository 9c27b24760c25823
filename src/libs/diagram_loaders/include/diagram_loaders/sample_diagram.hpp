#pragma once

#include <diagram_model/types.hpp>

namespace diagram_loaders {

// Built-in branching diagram with a merge point, a group and coloured edges.
// Used by the CLI's --sample switch and by the end-to-end tests.
diagram_model::Diagram generate_sample_diagram();

} // namespace diagram_loaders
