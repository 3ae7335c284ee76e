#pragma once
#ifndef LFRBENCH_QUALITY_ANALYZER_HPP
#define LFRBENCH_QUALITY_ANALYZER_HPP

#include <iosfwd>
#include <map>
#include <optional>
#include <vector>

#include <lfrbench/defs.hpp>
#include <lfrbench/CommunityAssignment.hpp>
#include <lfrbench/GraphHandle.hpp>

namespace lfrbench {

struct DegreeStatistics {
    double expected_mean{0};
    double actual_mean{0};
    count expected_min{0};
    count expected_max{0};
    count actual_min{0};
    count actual_median{0};
    count actual_max{0};
};

struct CommunityStatistics {
    count num_communities{0};
    count min_size{0};
    count max_size{0};
    double mean_size{0};
    std::map<count, count> size_histogram; // size -> number of communities
};

struct AttributeStatistics {
    community_id community{0};
    count size{0};
    double mean{0};
    double min{0};
    double max{0};
};

struct NetworkValidation {
    count num_nodes{0};
    edgeid num_edges{0};
    edgeid intra_edges{0};
    edgeid inter_edges{0};
    count isolated_nodes{0};
    double density{0};
    double mixing_ratio{0}; // fraction of inter-community edges
    bool has_self_loops{false};
};

struct NetworkReport {
    bool directed{false};
    DegreeStatistics degrees;
    CommunityStatistics communities;
    NetworkValidation validation;
    std::optional<double> modularity;
};

//! Q = 1/(2E) * sum_{i,j in same community} [A_ij - k_i k_j / (2E)]; 0 for a graph without edges
double modularity(const GraphHandle &graph, const CommunityAssignment &communities);

double average_degree(const GraphHandle &graph);

DegreeStatistics degree_statistics(const GraphHandle &graph, const std::vector<count> &degree_sequence);

CommunityStatistics community_statistics(const CommunityAssignment &communities);

//! per community mean/min/max of an external per-node attribute; empty communities are skipped
std::vector<AttributeStatistics> attribute_statistics(const CommunityAssignment &communities,
                                                      const std::vector<double> &attribute);

//! scans all node pairs to classify edges and detect isolated nodes
NetworkValidation validate_network(const GraphHandle &graph, const CommunityAssignment &communities);

NetworkReport analyze_network(const GraphHandle &graph, const CommunityAssignment &communities,
                              const std::vector<count> &degree_sequence, bool with_modularity = true);

std::ostream &operator<<(std::ostream &os, const NetworkReport &report);

}

#endif // LFRBENCH_QUALITY_ANALYZER_HPP
