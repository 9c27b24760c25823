#include <diagram_placement/layout_constants.hpp>
#include <diagram_model/log.hpp>
#include "layout_passes.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <optional>

namespace diagram_placement {
namespace detail {

namespace {

struct RowSlot {
    std::optional<std::string> key;
    std::vector<std::size_t> members;
};

// A key is numeric when it is a plain decimal: optional sign, digits and an
// optional fraction. "nan", "inf", hex and padded keys stay textual.
bool parse_numeric_key(const std::string& key, double& value) {
    std::size_t i = 0;
    if (i < key.size() && (key[i] == '+' || key[i] == '-')) ++i;
    std::size_t digits = 0;
    auto is_digit = [&](std::size_t at) { return at < key.size() && key[at] >= '0' && key[at] <= '9'; };
    for (; is_digit(i); ++i) ++digits;
    if (i < key.size() && key[i] == '.') {
        ++i;
        for (; is_digit(i); ++i) ++digits;
    }
    if (digits == 0 || i != key.size()) return false;
    value = std::strtod(key.c_str(), nullptr);
    return true;
}

// Stacks rows top-to-bottom from pass.top; tier = row index.
void stack_rows(LayoutPass& pass, const std::vector<std::vector<std::size_t>>& rows) {
    double y = pass.top;
    int tier = 0;
    for (const auto& row : rows) {
        if (row.empty()) continue;
        const double h = place_centered_row(pass, row, y, tier++);
        y += h + pass.v_gap();
    }
}

} // namespace

void place_grid(LayoutPass& pass) {
    const auto& page = pass.config.page;
    const std::size_t cols = static_cast<std::size_t>(pass.diagram.grid_columns.value_or(3));
    const std::size_t n = pass.nodes.size();
    if (n == 0) return;

    double widest = 0.0;
    for (const auto& pn : pass.nodes) widest = std::max(widest, pn.rect.width);
    const double pitch = std::max(page.content_width() / static_cast<double>(cols), widest + pass.h_gap());
    const double start_x = std::max(page.content_left, (page.width - pitch * static_cast<double>(cols)) / 2);

    double y = pass.top;
    for (std::size_t row_start = 0; row_start < n; row_start += cols) {
        const std::size_t row_end = std::min(n, row_start + cols);
        double max_h = 0.0;
        for (std::size_t i = row_start; i < row_end; ++i)
            max_h = std::max(max_h, pass.nodes[i].rect.height);
        for (std::size_t i = row_start; i < row_end; ++i) {
            Rect& r = pass.nodes[i].rect;
            const double col = static_cast<double>(i - row_start);
            r.x = start_x + col * pitch + (pitch - r.width) / 2;
            r.y = y + (max_h - r.height) / 2;
            pass.nodes[i].tier = static_cast<int>(row_start / cols);
        }
        y += max_h + pass.v_gap();
    }
    diagram_model::engine_logger()->debug("grid: {} nodes in {} columns, pitch {}", n, cols, pitch);
}

void place_rows(LayoutPass& pass) {
    std::vector<RowSlot> slots;
    for (std::size_t i = 0; i < pass.diagram.nodes.size(); ++i) {
        const auto& key = pass.diagram.nodes[i].row;
        if (!key) {
            slots.push_back(RowSlot{ std::nullopt, { i } });
            continue;
        }
        auto it = std::find_if(slots.begin(), slots.end(),
            [&](const RowSlot& s) { return s.key && *s.key == *key; });
        if (it == slots.end()) slots.push_back(RowSlot{ key, { i } });
        else it->members.push_back(i);
    }

    // Numeric keys keep the slots they first claimed but take them in
    // ascending numeric order. Other keys stay in first-seen order.
    std::vector<std::size_t> numeric_slots;
    std::vector<std::pair<double, RowSlot>> numeric_rows;
    for (std::size_t s = 0; s < slots.size(); ++s) {
        double value = 0.0;
        if (slots[s].key && parse_numeric_key(*slots[s].key, value)) {
            numeric_slots.push_back(s);
            numeric_rows.emplace_back(value, slots[s]);
        }
    }
    std::stable_sort(numeric_rows.begin(), numeric_rows.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });
    for (std::size_t k = 0; k < numeric_slots.size(); ++k)
        slots[numeric_slots[k]] = numeric_rows[k].second;

    std::vector<std::vector<std::size_t>> rows;
    for (auto& s : slots) rows.push_back(std::move(s.members));
    stack_rows(pass, rows);
    diagram_model::engine_logger()->debug("rows: {} rows", rows.size());
}

void place_flow(LayoutPass& pass) {
    const std::size_t n = pass.nodes.size();
    if (n == 0) return;

    std::vector<std::vector<std::size_t>> rows;
    if (pass.diagram.flow_columns) {
        const std::size_t cols = static_cast<std::size_t>(*pass.diagram.flow_columns);
        for (std::size_t i = 0; i < n; ++i) {
            if (i % cols == 0) rows.emplace_back();
            rows.back().push_back(i);
        }
    } else {
        double widest = 0.0, sum_w = 0.0, sum_h = 0.0;
        for (const auto& pn : pass.nodes) {
            widest = std::max(widest, pn.rect.width);
            sum_w += pn.rect.width;
            sum_h += pn.rect.height;
        }
        const double count = static_cast<double>(n);
        const double cell_w = sum_w / count + pass.h_gap();
        const double cell_h = sum_h / count + pass.v_gap();
        const double budget = std::max(widest, std::sqrt(count * cell_w * cell_h * layout::flow_target_aspect));

        double cur = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            const double w = pass.nodes[i].rect.width;
            if (!rows.empty() && !rows.back().empty() && cur + pass.h_gap() + w <= budget) {
                rows.back().push_back(i);
                cur += pass.h_gap() + w;
            } else {
                rows.push_back({ i });
                cur = w;
            }
        }
        diagram_model::engine_logger()->debug("flow: width budget {}", budget);
    }
    stack_rows(pass, rows);
}

void place_pipeline(LayoutPass& pass) {
    std::vector<std::vector<std::size_t>> steps;
    if (pass.diagram.pipeline.empty()) {
        for (std::size_t i = 0; i < pass.nodes.size(); ++i) steps.push_back({ i });
    } else {
        for (const auto& step : pass.diagram.pipeline) {
            std::vector<std::size_t> members;
            for (const auto& id : step) members.push_back(pass.index_of(id));
            steps.push_back(std::move(members));
        }
    }
    if (steps.empty()) return;

    std::vector<double> step_w(steps.size(), 0.0), step_h(steps.size(), 0.0);
    double total_w = pass.h_gap() * static_cast<double>(steps.size() - 1);
    double tallest = 0.0;
    for (std::size_t s = 0; s < steps.size(); ++s) {
        for (auto i : steps[s]) {
            step_w[s] = std::max(step_w[s], pass.nodes[i].rect.width);
            step_h[s] += pass.nodes[i].rect.height;
        }
        step_h[s] += pass.v_gap() * static_cast<double>(steps[s].size() - 1);
        total_w += step_w[s];
        tallest = std::max(tallest, step_h[s]);
    }

    const double mid_y = pass.top + tallest / 2;
    double x = std::max(pass.config.page.content_left, (pass.config.page.width - total_w) / 2);
    for (std::size_t s = 0; s < steps.size(); ++s) {
        double y = mid_y - step_h[s] / 2;
        for (auto i : steps[s]) {
            Rect& r = pass.nodes[i].rect;
            r.x = x + (step_w[s] - r.width) / 2;
            r.y = y;
            pass.nodes[i].tier = static_cast<int>(s);
            y += r.height + pass.v_gap();
        }
        x += step_w[s] + pass.h_gap();
    }
    diagram_model::engine_logger()->debug("pipeline: {} steps", steps.size());
}

} // namespace detail
} // namespace diagram_placement
