#include <lfrbench/EdgeConstructor.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <shuffle/algorithms/FisherYates.hpp>

#include <tlx/die.hpp>
#include <tlx/logger.hpp>

#include <range/v3/numeric.hpp>

namespace lfrbench {

static constexpr bool debug = false;

EdgeConstructor::EdgeConstructor(const std::vector<count> &degree_sequence, const CommunityAssignment &communities,
                                 double mu, bool symmetrical, count iteration_factor)
    : degree_sequence_(degree_sequence), communities_(communities), mu_(mu), symmetrical_(symmetrical),
      iteration_factor_(iteration_factor) {
    if (degree_sequence_.size() != communities_.num_nodes())
        throw std::invalid_argument("Degree sequence and community assignment disagree on the number of nodes");

    if (degree_sequence_.size() > std::numeric_limits<uint32_t>::max() - 1)
        throw std::runtime_error("The edge constructor only supports 32 bit node ids");
}

EdgeConstructionStatistics EdgeConstructor::construct(GraphHandle &graph, std::mt19937_64 &gen) {
    if (graph.num_nodes() != degree_sequence_.size())
        throw std::invalid_argument("Graph and degree sequence disagree on the number of nodes");

    const count n = degree_sequence_.size();
    directed_ = graph.is_directed();
    created_.clear();
    next_ticket_ = 0;

    // edges already present in the host graph count against the targets
    current_degree_.resize(n);
    for (node u = 0; u < n; ++u)
        current_degree_[u] = graph.degree(u);
#ifndef NDEBUG
    const auto initial_degree = current_degree_;
#endif

    EdgeConstructionStatistics stats;
    const count total_degree = ranges::accumulate(degree_sequence_, count(0));
    stats.target_edges = directed_ ? total_degree : total_degree / 2;
    stats.max_rounds = iteration_factor_ * stats.target_edges;

    NodeQueue queue;
    for (node u = 0; u < n; ++u) {
        if (deficit(u))
            push(queue, u, deficit(u));
    }

    while (stats.edges_created < stats.target_edges && !queue.empty()) {
        if (stats.rounds >= stats.max_rounds) {
            stats.round_limit_reached = true;
            break;
        }

        const auto entry = queue.top();
        queue.pop();

        const node u = entry.u;
        const count d = deficit(u);
        if (!d) { // saturated in the meantime
            stats.rounds++;
            continue;
        }

        if (d < entry.deficit) {
            // other nodes linked to u since it was queued; requeue with the current deficit
            push(queue, u, d);
            continue;
        }

        stats.rounds++;

        const auto intra_target = static_cast<count>(std::llround(static_cast<double>(d) * (1.0 - mu_)));
        const count inter_target = d - intra_target;

        if (intra_target) {
            collect_intra_candidates(u);
            add_random_edges(graph, u, intra_target, gen, stats);
        }

        if (inter_target) {
            collect_inter_candidates(u);
            add_random_edges(graph, u, inter_target, gen, stats);
        }

        if (deficit(u))
            push(queue, u, deficit(u));
    }

    stats.unsaturated_nodes = static_cast<count>(
        ranges::count_if(graph.nodes(), [&](node u) { return deficit(u) > 0; }));

    sLOG << "created" << stats.edges_created << "of" << stats.target_edges << "edges in" << stats.rounds
         << "rounds;" << stats.unsaturated_nodes << "nodes below target degree";

#ifndef NDEBUG
    for (node u : graph.nodes()) {
        die_unequal(current_degree_[u], graph.degree(u));
        die_unless(current_degree_[u] <= std::max(degree_sequence_[u], initial_degree[u]));
    }
#endif

    return stats;
}

void EdgeConstructor::collect_intra_candidates(node u) {
    candidates_.clear();
    for (node v : communities_.members(communities_.community_of(u))) {
        if (v != u && !is_saturated(v))
            candidates_.push_back(v);
    }
}

void EdgeConstructor::collect_inter_candidates(node u) {
    candidates_.clear();
    const auto own = communities_.community_of(u);
    for (community_id c = 0; c < communities_.num_communities(); ++c) {
        if (c == own) continue;
        for (node v : communities_.members(c)) {
            if (!is_saturated(v))
                candidates_.push_back(v);
        }
    }
}

count EdgeConstructor::add_random_edges(GraphHandle &graph, node u, count num_edges, std::mt19937_64 &gen,
                                        EdgeConstructionStatistics &stats) {
    if (!num_edges || candidates_.empty())
        return 0;

    shuffle::fisher_yates(candidates_.begin(), candidates_.end(), gen);

    count added = 0;
    for (node v : candidates_) {
        if (added >= num_edges) break;

        // candidates_ was filtered when collected, but earlier edges of this pass may have filled v
        if (is_saturated(v)) continue;

        const auto key = edge_key(u, v);
        if (created_.count(key) || graph.has_edge(u, v)) continue;

        graph.add_edge(u, v);
        created_.insert(key);
        current_degree_[u]++;

        const bool is_intra = communities_.same_community(u, v);
        (is_intra ? stats.intra_edges : stats.inter_edges)++;

        if (!directed_) {
            current_degree_[v]++;
        } else if (symmetrical_) {
            const auto reverse_key = edge_key(v, u);
            if (!created_.count(reverse_key) && !graph.has_edge(v, u)) {
                graph.add_edge(v, u);
                created_.insert(reverse_key);
                current_degree_[v]++;
                stats.mirrored_edges++;
                (is_intra ? stats.intra_edges : stats.inter_edges)++;
            }
        }

        added++;
    }

    stats.edges_created += added;
    LOG << "node " << u << " gained " << added << " of " << num_edges << " edges";
    return added;
}

}
