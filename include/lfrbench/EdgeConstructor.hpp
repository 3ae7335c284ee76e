#pragma once
#ifndef LFRBENCH_EDGE_CONSTRUCTOR_HPP
#define LFRBENCH_EDGE_CONSTRUCTOR_HPP

#include <queue>
#include <random>
#include <unordered_set>
#include <utility>
#include <vector>

#include <lfrbench/defs.hpp>
#include <lfrbench/CommunityAssignment.hpp>
#include <lfrbench/GraphHandle.hpp>

namespace lfrbench {

struct EdgeConstructionStatistics {
    edgeid target_edges{0};
    edgeid edges_created{0};   // counted like target_edges; mirrored edges are not included
    edgeid mirrored_edges{0};  // reverse edges added in symmetrical directed mode
    edgeid intra_edges{0};
    edgeid inter_edges{0};
    count rounds{0};
    count max_rounds{0};
    bool round_limit_reached{false};
    count unsaturated_nodes{0}; // nodes that ended below their target degree
};

/**
 * Greedy LFR wiring: repeatedly serves the node with the largest remaining degree deficit,
 * splitting the deficit into (1 - mu) intra- and mu inter-community edges drawn from shuffled
 * candidate lists. Never creates loops or duplicates and never lets a node exceed its target.
 */
class EdgeConstructor {
public:
    EdgeConstructor(const std::vector<count> &degree_sequence, const CommunityAssignment &communities,
                    double mu, bool symmetrical = false, count iteration_factor = 3);

    EdgeConstructionStatistics construct(GraphHandle &graph, std::mt19937_64 &gen);

    //! degrees after the last construct(), counting edges the host graph already had;
    //! construction never raises a node above its target
    [[nodiscard]] const std::vector<count> &current_degrees() const noexcept { return current_degree_; }

    [[nodiscard]] count deficit(node u) const noexcept {
        return degree_sequence_[u] > current_degree_[u] ? degree_sequence_[u] - current_degree_[u] : 0;
    }

private:
    struct QueueEntry {
        count deficit;
        uint64_t ticket; // insertion order; breaks ties first-in first-out
        node u;
    };

    struct QueueOrder {
        // max-heap on deficit
        bool operator()(const QueueEntry &a, const QueueEntry &b) const noexcept {
            return a.deficit != b.deficit ? a.deficit < b.deficit : a.ticket > b.ticket;
        }
    };

    using NodeQueue = std::priority_queue<QueueEntry, std::vector<QueueEntry>, QueueOrder>;

    const std::vector<count> &degree_sequence_;
    const CommunityAssignment &communities_;
    double mu_;
    bool symmetrical_;
    count iteration_factor_;

    // state of the current run
    std::vector<count> current_degree_;
    std::unordered_set<uint64_t> created_;
    std::vector<node> candidates_;
    bool directed_{false};
    uint64_t next_ticket_{0};

    void push(NodeQueue &queue, node u, count d) {
        queue.push(QueueEntry{d, next_ticket_++, u});
    }

    [[nodiscard]] bool is_saturated(node v) const noexcept {
        return current_degree_[v] >= degree_sequence_[v];
    }

    [[nodiscard]] uint64_t edge_key(node u, node v) const noexcept {
        if (!directed_ && v < u) std::swap(u, v);
        return (static_cast<uint64_t>(u) << 32) | v;
    }

    void collect_intra_candidates(node u);
    void collect_inter_candidates(node u);

    //! tries to connect u to up to num_edges of the current candidates; returns edges added
    count add_random_edges(GraphHandle &graph, node u, count num_edges, std::mt19937_64 &gen,
                           EdgeConstructionStatistics &stats);
};

}

#endif // LFRBENCH_EDGE_CONSTRUCTOR_HPP
