#pragma once

#include <diagram_model/style_config.hpp>
#include <diagram_model/types.hpp>

namespace diagram_placement {

// Fixed layout constants. Spacing and node sizes live in the StyleConfig;
// these are the values the page template itself is built around.

namespace layout {

constexpr double title_y = 20.0;
constexpr double title_height = 50.0;
constexpr double subtitle_height = 24.0;
// Content never starts above this line, even without a title.
constexpr double min_content_top = 100.0;
// Height used for an empty swimlane when no process size is configured.
constexpr double fallback_row_height = 56.0;

// Flow layout aims for a landscape, screen-shaped block.
constexpr double flow_target_aspect = 16.0 / 9.0;

// Boxes whose centers differ by less than this share a row for routing.
constexpr double same_row_tolerance = 1.0;
// Below this horizontal/vertical offset an orthogonal route needs no bend.
constexpr double bend_threshold = 5.0;

// Height of the title block (title + subtitle + bottom margin), 0 without text.
inline double title_block_height(const diagram_model::Diagram& diagram,
    const diagram_model::SpacingConfig& spacing)
{
    double h = 0.0;
    if (!diagram.title.empty()) h += title_height;
    if (!diagram.subtitle.empty()) h += subtitle_height;
    if (h > 0.0) h += spacing.title_bottom_margin;
    return h;
}

// Y coordinate where diagram content starts.
inline double content_top(const diagram_model::Diagram& diagram,
    const diagram_model::SpacingConfig& spacing)
{
    const double top = title_y + title_block_height(diagram, spacing);
    return top > min_content_top ? top : min_content_top;
}

} // namespace layout
} // namespace diagram_placement
