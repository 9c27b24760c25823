#include <diagram_model/errors.hpp>
#include <diagram_model/log.hpp>
#include "layout_passes.hpp"
#include <algorithm>
#include <deque>
#include <limits>
#include <map>
#include <unordered_map>

namespace diagram_placement {
namespace detail {

namespace {

struct Adjacency {
    std::vector<std::vector<std::size_t>> parents;  // unique, sorted by node id
    std::vector<std::vector<std::size_t>> children; // one entry per edge
};

Adjacency build_adjacency(const LayoutPass& pass) {
    const std::size_t n = pass.nodes.size();
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < n; ++i) index[pass.nodes[i].node_id] = i;

    Adjacency adj;
    adj.parents.resize(n);
    adj.children.resize(n);
    for (const auto& e : pass.diagram.edges) {
        const std::size_t from = index.at(e.source_node_id);
        const std::size_t to = index.at(e.target_node_id);
        adj.children[from].push_back(to);
        auto& ps = adj.parents[to];
        if (std::find(ps.begin(), ps.end(), from) == ps.end()) ps.push_back(from);
    }
    for (auto& ps : adj.parents)
        std::sort(ps.begin(), ps.end(), [&](std::size_t a, std::size_t b) {
            return pass.nodes[a].node_id < pass.nodes[b].node_id;
        });
    return adj;
}

// Names the nodes that keep a cycle alive: what is left unleveled once
// nodes with no unleveled successor are peeled off.
[[noreturn]] void report_cycle(const LayoutPass& pass, const Adjacency& adj, std::vector<bool> remaining) {
    bool peeled = true;
    while (peeled) {
        peeled = false;
        for (std::size_t i = 0; i < remaining.size(); ++i) {
            if (!remaining[i]) continue;
            const bool has_successor = std::any_of(adj.children[i].begin(), adj.children[i].end(),
                [&](std::size_t c) { return remaining[c]; });
            if (!has_successor) {
                remaining[i] = false;
                peeled = true;
            }
        }
    }

    std::string names, first;
    for (std::size_t i = 0; i < remaining.size(); ++i) {
        if (!remaining[i]) continue;
        if (first.empty()) first = pass.nodes[i].node_id;
        else names += ", ";
        names += pass.nodes[i].node_id;
    }
    throw diagram_model::DiagramError(diagram_model::ErrorKind::Layout, first,
        "cycle in tree layout through nodes: " + names);
}

// level(n) = 0 without parents, else max(level(parent)) + 1.
std::vector<int> assign_levels(const LayoutPass& pass, const Adjacency& adj) {
    const std::size_t n = pass.nodes.size();
    std::vector<std::size_t> pending(n);
    std::deque<std::size_t> ready;
    for (std::size_t i = 0; i < n; ++i) {
        pending[i] = adj.parents[i].size();
        if (pending[i] == 0) ready.push_back(i);
    }

    std::vector<int> level(n, 0);
    std::vector<bool> remaining(n, true);
    std::size_t done = 0;
    while (!ready.empty()) {
        const std::size_t i = ready.front();
        ready.pop_front();
        remaining[i] = false;
        ++done;
        for (auto p : adj.parents[i]) level[i] = std::max(level[i], level[p] + 1);
        // pending counts distinct parents, so release each child once.
        std::vector<std::size_t> released;
        for (auto c : adj.children[i])
            if (std::find(released.begin(), released.end(), c) == released.end()) released.push_back(c);
        for (auto c : released)
            if (--pending[c] == 0) ready.push_back(c);
    }
    if (done != n) report_cycle(pass, adj, remaining);
    return level;
}

struct Cluster {
    std::vector<std::size_t> members;
    double anchor = 0.0;
    double width = 0.0;
};

double center_x(const Rect& r) { return r.x + r.width / 2; }

} // namespace

void place_tree(LayoutPass& pass) {
    const std::size_t n = pass.nodes.size();
    if (n == 0) return;

    const Adjacency adj = build_adjacency(pass);
    const std::vector<int> level = assign_levels(pass, adj);
    const int depth = *std::max_element(level.begin(), level.end());
    const double min_left = pass.config.page.content_left;

    double y = pass.top;
    for (int lv = 0; lv <= depth; ++lv) {
        std::vector<std::size_t> at_level;
        for (std::size_t i = 0; i < n; ++i)
            if (level[i] == lv) at_level.push_back(i);

        if (lv == 0) {
            y += place_centered_row(pass, at_level, y, 0) + pass.v_gap();
            continue;
        }

        std::vector<Cluster> clusters;
        std::map<std::vector<std::size_t>, std::size_t> by_parents;
        for (auto i : at_level) {
            auto it = by_parents.find(adj.parents[i]);
            if (it == by_parents.end()) {
                Cluster c;
                for (auto p : adj.parents[i]) c.anchor += center_x(pass.nodes[p].rect);
                c.anchor /= static_cast<double>(adj.parents[i].size());
                by_parents.emplace(adj.parents[i], clusters.size());
                clusters.push_back(std::move(c));
                it = by_parents.find(adj.parents[i]);
            }
            clusters[it->second].members.push_back(i);
        }
        std::stable_sort(clusters.begin(), clusters.end(),
            [](const Cluster& a, const Cluster& b) { return a.anchor < b.anchor; });

        double max_h = 0.0;
        for (auto& c : clusters) {
            c.width = pass.h_gap() * static_cast<double>(c.members.size() - 1);
            for (auto i : c.members) {
                c.width += pass.nodes[i].rect.width;
                max_h = std::max(max_h, pass.nodes[i].rect.height);
            }
        }

        // Sweep left to right: each cluster sits centered on its anchor unless
        // that would bring it within h_gap of the previous one.
        double cursor = -std::numeric_limits<double>::infinity();
        double level_left = std::numeric_limits<double>::infinity();
        for (const auto& c : clusters) {
            double x = std::max(c.anchor - c.width / 2, cursor);
            level_left = std::min(level_left, x);
            for (auto i : c.members) {
                Rect& r = pass.nodes[i].rect;
                r.x = x;
                r.y = y + (max_h - r.height) / 2;
                pass.nodes[i].tier = lv;
                x += r.width + pass.h_gap();
            }
            cursor = x;
        }
        if (level_left < min_left) {
            const double shift = min_left - level_left;
            for (auto i : at_level) pass.nodes[i].rect.x += shift;
        }
        y += max_h + pass.v_gap();
    }
    diagram_model::engine_logger()->debug("tree: {} levels", depth + 1);
}

} // namespace detail
} // namespace diagram_placement
