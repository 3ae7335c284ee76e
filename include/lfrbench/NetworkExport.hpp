#pragma once
#ifndef LFRBENCH_NETWORK_EXPORT_HPP
#define LFRBENCH_NETWORK_EXPORT_HPP

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <lfrbench/defs.hpp>
#include <lfrbench/AdjacencyGraph.hpp>
#include <lfrbench/CommunityAssignment.hpp>

namespace lfrbench {

using NodeLabeler = std::function<std::string(node)>;

//! what a GML or CSV file describes; produced by the readers below
struct ExportedNetwork {
    struct Node {
        node id;
        std::string label;
        community_id community;
        count degree;
        std::optional<count> expected_degree; // CSV only
    };

    struct Edge {
        node source;
        node target;
        bool intra;
    };

    bool directed{false};
    std::optional<double> avg_degree; // GML only
    std::optional<double> mu;         // GML only
    std::vector<Node> nodes;
    std::vector<Edge> edges;

    //! community labels indexed by node id; throws if the ids are not exactly [0, n)
    [[nodiscard]] std::vector<community_id> community_labels() const;
};

struct ExportMetadata {
    double avg_degree{0};
    double mu{0};
    NodeLabeler labeler; // defaults to the decimal node id
};

void write_gml(std::ostream &os, const AdjacencyGraph &graph, const CommunityAssignment &communities,
               const ExportMetadata &meta);

void write_csv_nodes(std::ostream &os, const AdjacencyGraph &graph, const CommunityAssignment &communities,
                     const std::vector<count> &degree_sequence, const NodeLabeler &labeler = {});

void write_csv_edges(std::ostream &os, const AdjacencyGraph &graph, const CommunityAssignment &communities);

//! parse the formats written above; malformed input raises std::runtime_error naming the line
ExportedNetwork read_gml(std::istream &is);
ExportedNetwork read_csv(std::istream &nodes, std::istream &edges);

}

#endif // LFRBENCH_NETWORK_EXPORT_HPP
