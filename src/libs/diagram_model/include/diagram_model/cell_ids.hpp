#pragma once

#include <cstddef>
#include <string>

namespace diagram_model {

// Identifiers of the cells in the emitted document. Node and group cells use
// the ids from the input; everything else is derived here.
namespace cell_ids {

inline constexpr const char* root = "0";
inline constexpr const char* layer = "1";
inline constexpr const char* title = "title";
inline constexpr const char* subtitle = "subtitle";

inline std::string edge(std::size_t index) {
    return "e" + std::to_string(index);
}

inline std::string lane(const std::string& lane_id) {
    return "lane_" + lane_id;
}

} // namespace cell_ids
} // namespace diagram_model
