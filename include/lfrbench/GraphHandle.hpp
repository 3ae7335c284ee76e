#pragma once
#ifndef LFRBENCH_GRAPH_HANDLE_HPP
#define LFRBENCH_GRAPH_HANDLE_HPP

#include <range/v3/view.hpp>

#include <lfrbench/defs.hpp>

namespace lfrbench {

/**
 * Capabilities the generator needs from a host graph. Node ids are [0, num_nodes()).
 * For directed graphs degree(u) is the out-degree.
 */
class GraphHandle {
public:
    virtual ~GraphHandle() = default;

    [[nodiscard]] virtual count num_nodes() const = 0;
    [[nodiscard]] virtual bool is_directed() const = 0;

    //! true if u -> v exists (for undirected graphs the orientation is irrelevant)
    [[nodiscard]] virtual bool has_edge(node u, node v) const = 0;

    //! precondition: u != v and the edge does not exist yet
    virtual void add_edge(node u, node v) = 0;

    [[nodiscard]] virtual count degree(node u) const = 0;
    [[nodiscard]] virtual count num_edges() const = 0;

    //! sequence from 0 to n-1
    [[nodiscard]] auto nodes() const {
        return ranges::views::ints(node(0), static_cast<node>(num_nodes()));
    }
};

}

#endif // LFRBENCH_GRAPH_HANDLE_HPP
