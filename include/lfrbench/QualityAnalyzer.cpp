#include <lfrbench/QualityAnalyzer.hpp>

#include <algorithm>
#include <iomanip>
#include <limits>
#include <ostream>
#include <stdexcept>

#include <range/v3/algorithm.hpp>
#include <range/v3/numeric.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view.hpp>

namespace lfrbench {

double modularity(const GraphHandle &graph, const CommunityAssignment &communities) {
    if (communities.num_nodes() != graph.num_nodes())
        throw std::invalid_argument("Graph and community assignment disagree on the number of nodes");

    const edgeid num_edges = graph.num_edges();
    if (!num_edges) return 0.0;

    const double two_m = 2.0 * static_cast<double>(num_edges);

    // pairs in different communities contribute nothing, so only same-community pairs are summed
    double q = 0.0;
    for (const auto &members : communities.communities()) {
        for (node i : members) {
            const double k_i = static_cast<double>(graph.degree(i));
            for (node j : members) {
                const double a_ij = (i != j && graph.has_edge(i, j)) ? 1.0 : 0.0;
                q += a_ij - k_i * static_cast<double>(graph.degree(j)) / two_m;
            }
        }
    }

    return q / two_m;
}

double average_degree(const GraphHandle &graph) {
    if (!graph.num_nodes()) return 0.0;
    auto degrees = graph.nodes() | ranges::views::transform([&](node u) { return graph.degree(u); });
    return static_cast<double>(ranges::accumulate(degrees, count(0))) / static_cast<double>(graph.num_nodes());
}

DegreeStatistics degree_statistics(const GraphHandle &graph, const std::vector<count> &degree_sequence) {
    DegreeStatistics stats;

    if (!degree_sequence.empty()) {
        stats.expected_mean = static_cast<double>(ranges::accumulate(degree_sequence, count(0))) /
                              static_cast<double>(degree_sequence.size());
        stats.expected_min = ranges::min(degree_sequence);
        stats.expected_max = ranges::max(degree_sequence);
    }

    if (!graph.num_nodes()) return stats;

    auto degrees = graph.nodes()
                   | ranges::views::transform([&](node u) { return graph.degree(u); })
                   | ranges::to<std::vector<count>>();
    ranges::sort(degrees);

    stats.actual_mean = static_cast<double>(ranges::accumulate(degrees, count(0))) /
                        static_cast<double>(degrees.size());
    stats.actual_min = degrees.front();
    stats.actual_median = degrees[degrees.size() / 2];
    stats.actual_max = degrees.back();

    return stats;
}

CommunityStatistics community_statistics(const CommunityAssignment &communities) {
    CommunityStatistics stats;
    stats.num_communities = communities.num_communities();
    if (!stats.num_communities) return stats;

    stats.min_size = std::numeric_limits<count>::max();
    count total = 0;
    for (count size : communities.sizes()) {
        stats.min_size = std::min(stats.min_size, size);
        stats.max_size = std::max(stats.max_size, size);
        stats.size_histogram[size]++;
        total += size;
    }
    stats.mean_size = static_cast<double>(total) / static_cast<double>(stats.num_communities);

    return stats;
}

std::vector<AttributeStatistics> attribute_statistics(const CommunityAssignment &communities,
                                                      const std::vector<double> &attribute) {
    if (attribute.size() != communities.num_nodes())
        throw std::invalid_argument("Attribute vector must hold one value per node");

    std::vector<AttributeStatistics> result;
    for (community_id c = 0; c < communities.num_communities(); ++c) {
        const auto &members = communities.members(c);
        if (members.empty()) continue;

        AttributeStatistics stats;
        stats.community = c;
        stats.size = members.size();
        stats.min = std::numeric_limits<double>::infinity();
        stats.max = -std::numeric_limits<double>::infinity();

        double sum = 0;
        for (node u : members) {
            sum += attribute[u];
            stats.min = std::min(stats.min, attribute[u]);
            stats.max = std::max(stats.max, attribute[u]);
        }
        stats.mean = sum / static_cast<double>(members.size());

        result.push_back(stats);
    }

    return result;
}

NetworkValidation validate_network(const GraphHandle &graph, const CommunityAssignment &communities) {
    if (communities.num_nodes() != graph.num_nodes())
        throw std::invalid_argument("Graph and community assignment disagree on the number of nodes");

    NetworkValidation result;
    const count n = graph.num_nodes();
    result.num_nodes = n;
    result.num_edges = graph.num_edges();

    std::vector<bool> touched(n, false);
    for (node u = 0; u < n; ++u) {
        result.has_self_loops |= graph.has_edge(u, u);

        // undirected edges are visited once with u < v; directed edges in both orientations
        for (node v = graph.is_directed() ? 0 : u + 1; v < n; ++v) {
            if (u == v || !graph.has_edge(u, v)) continue;

            touched[u] = touched[v] = true;
            (communities.same_community(u, v) ? result.intra_edges : result.inter_edges)++;
        }
    }

    result.isolated_nodes = static_cast<count>(std::count(touched.begin(), touched.end(), false));

    if (n > 1) {
        const double ordered_pairs = static_cast<double>(n) * static_cast<double>(n - 1);
        const double pairs = graph.is_directed() ? ordered_pairs : ordered_pairs / 2.0;
        result.density = static_cast<double>(result.num_edges) / pairs;
    }

    const auto classified = result.intra_edges + result.inter_edges;
    if (classified)
        result.mixing_ratio = static_cast<double>(result.inter_edges) / static_cast<double>(classified);

    return result;
}

NetworkReport analyze_network(const GraphHandle &graph, const CommunityAssignment &communities,
                              const std::vector<count> &degree_sequence, bool with_modularity) {
    NetworkReport report;
    report.directed = graph.is_directed();
    report.degrees = degree_statistics(graph, degree_sequence);
    report.communities = community_statistics(communities);
    report.validation = validate_network(graph, communities);
    if (with_modularity)
        report.modularity = modularity(graph, communities);
    return report;
}

std::ostream &operator<<(std::ostream &os, const NetworkReport &report) {
    const auto &v = report.validation;
    const auto &d = report.degrees;
    const auto &c = report.communities;

    const auto flags = os.flags();
    const auto precision = os.precision();

    os << std::fixed << std::setprecision(2);
    os << "=== LFR Network Statistics ===\n"
       << "Nodes: " << v.num_nodes << "\n"
       << "Edges: " << v.num_edges << " (intra " << v.intra_edges << ", inter " << v.inter_edges << ")\n"
       << "Directed: " << (report.directed ? "true" : "false") << "\n"
       << "Expected Average Degree: " << d.expected_mean << "\n"
       << "Actual Average Degree: " << d.actual_mean << "\n"
       << "Expected Degree Range: [" << d.expected_min << ", " << d.expected_max << "]\n"
       << "Actual Degree Range: [" << d.actual_min << ", " << d.actual_max << "], median " << d.actual_median << "\n"
       << "Realized Mixing: " << std::setprecision(4) << v.mixing_ratio << "\n"
       << "Density: " << v.density << "\n"
       << "Isolated Nodes: " << v.isolated_nodes << "\n"
       << "Number of Communities: " << c.num_communities << "\n"
       << "Community Sizes: min " << c.min_size << ", max " << c.max_size
       << ", mean " << std::setprecision(2) << c.mean_size << "\n";

    for (const auto &[size, num] : c.size_histogram)
        os << "  size " << size << ": " << num << " communities\n";

    if (report.modularity)
        os << "Modularity: " << std::setprecision(4) << *report.modularity << "\n";

    os << "===============================\n";
    os.flags(flags);
    os.precision(precision);
    return os;
}

}
