#pragma once
#ifndef LFRBENCH_ADJACENCY_GRAPH_HPP
#define LFRBENCH_ADJACENCY_GRAPH_HPP

#include <cassert>
#include <vector>
#include <algorithm>
#include <utility>

#include <tlx/define.hpp>
#include <range/v3/view.hpp>
#include <range/v3/algorithm.hpp>

#include "defs.hpp"
#include "GraphHandle.hpp"

namespace lfrbench {

/**
 * Simple graph over nodes [0, n) with sorted neighbor lists. Undirected edges are stored in both
 * lists; directed edges only in the successor list of their source (in-degrees are counted).
 */
class AdjacencyGraph final : public GraphHandle {
public:
    explicit AdjacencyGraph(count num_nodes = 0, bool directed = false)
        : directed_(directed), adj_(num_nodes), in_degree_(directed ? num_nodes : 0, 0) {}

    AdjacencyGraph(AdjacencyGraph &&) = default;
    AdjacencyGraph &operator=(AdjacencyGraph &&) = default;

private: // copy is expensive, so make using it explicit via copy()
    AdjacencyGraph(const AdjacencyGraph &) = default;
    AdjacencyGraph &operator=(const AdjacencyGraph &) = default;

public:
    //! return copy of the data structure
    AdjacencyGraph copy() const { return {*this}; }

    [[nodiscard]] count num_nodes() const override { return adj_.size(); }
    [[nodiscard]] bool is_directed() const override { return directed_; }
    [[nodiscard]] count num_edges() const override { return num_edges_; }

    //! number of neighbors (undirected) or successors (directed) of u
    [[nodiscard]] count degree(node u) const override {
        assert(u < num_nodes());
        return adj_[u].size();
    }

    //! number of predecessors; equals degree(u) for undirected graphs
    [[nodiscard]] count in_degree(node u) const noexcept {
        assert(u < num_nodes());
        return directed_ ? in_degree_[u] : adj_[u].size();
    }

    //! returns a sequence of all degrees
    [[nodiscard]] auto degrees() const noexcept {
        return nodes() | ranges::views::transform([&](node u) { return degree(u); });
    }

    //! sorted view of all neighbors (successors if directed) of node u
    [[nodiscard]] auto neighbors(node u) const noexcept {
        assert(u < num_nodes());
        return ranges::views::all(adj_[u]);
    }

    //! view of std::pair<node, node> over all edges; undirected edges (u, v) appear once with u < v
    [[nodiscard]] auto edges() const noexcept {
        return nodes() | ranges::views::for_each([&](node u) { //
            return neighbors(u) | ranges::views::filter([=](auto v) { return directed_ || u < v; }) |
                   ranges::views::transform([=](node v) { return std::pair<node, node>{u, v}; });
        });
    }

    [[nodiscard]] bool has_edge(node u, node v) const override {
        assert(u < num_nodes() && v < num_nodes());
        const auto &neigh = adj_[u];
        auto it = std::lower_bound(neigh.begin(), neigh.end(), v);
        return it != neigh.end() && *it == v;
    }

    void add_edge(node u, node v) override {
        assert(u != v);
        assert(!has_edge(u, v));

        add_half_edge(u, v);
        if (directed_) {
            in_degree_[v]++;
        } else {
            add_half_edge(v, u);
        }
        num_edges_++;
    }

    //! only add if edge does not yet exist and is no loop; returns true if there was a change
    bool add_unique_edge(node u, node v) {
        if (TLX_UNLIKELY(u == v) || has_edge(u, v))
            return false;
        add_edge(u, v);
        return true;
    }

    //! erase all edges while keeping the nodes
    void clear() noexcept {
        for (auto &neigh : adj_)
            neigh.clear();
        std::fill(in_degree_.begin(), in_degree_.end(), 0);
        num_edges_ = 0;
    }

    //! number of nodes without any incident edge
    [[nodiscard]] count num_isolated_nodes() const noexcept {
        return static_cast<count>(ranges::count_if(nodes(), [&](node u) { return !degree(u) && !in_degree(u); }));
    }

    [[nodiscard]] uint64_t fingerprint() const noexcept;

private:
    bool directed_;
    std::vector<std::vector<node>> adj_;
    std::vector<count> in_degree_;
    count num_edges_{0};

    void add_half_edge(node u, node v) {
        auto &neigh = adj_[u];
        neigh.push_back(v);

        // insertion sort
        auto it = std::prev(neigh.end());
        while (it != neigh.begin()) {
            auto prev = std::prev(it);
            if (*prev <= *it) break;
            std::swap(*prev, *it);
            it = prev;
        }

        assert(ranges::is_sorted(neigh));
    }
};

}

#endif // LFRBENCH_ADJACENCY_GRAPH_HPP
