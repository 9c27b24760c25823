#pragma once

#include <string>

namespace diagram_render {

// Shortest decimal text for a coordinate or fraction, at most two decimals:
// 120 -> "120", 0.5 -> "0.5", 346.666 -> "346.67". Never "-0".
std::string format_number(double value);

} // namespace diagram_render
