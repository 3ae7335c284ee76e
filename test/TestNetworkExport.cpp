#include <lfrbench/AdjacencyGraph.hpp>
#include <lfrbench/LFRGenerator.hpp>
#include <lfrbench/NetworkExport.hpp>

#include <gtest/gtest.h>
#include <sstream>

using namespace lfrbench;

class TestNetworkExport : public ::testing::Test {
protected:
    static LFRParameters params(uint64_t seed) {
        LFRParameters params;
        params.seed = seed;
        params.mu = 0.3;
        return params;
    }

    static void check_edges(const ExportedNetwork &net, const AdjacencyGraph &graph,
                            const CommunityAssignment &communities) {
        ASSERT_EQ(net.edges.size(), graph.num_edges());
        for (const auto &e : net.edges) {
            ASSERT_TRUE(graph.has_edge(e.source, e.target));
            ASSERT_EQ(e.intra, communities.same_community(e.source, e.target));
        }
    }
};

TEST_F(TestNetworkExport, GmlRoundTrip) {
    for (bool directed : {false, true}) {
        AdjacencyGraph graph(60, directed);
        LFRGenerator generator(params(1));
        generator.generate(graph);

        std::stringstream ss;
        write_gml(ss, graph, generator.community_assignment(), {12.5, 0.3, {}});

        auto net = read_gml(ss);
        ASSERT_EQ(net.directed, directed);
        ASSERT_EQ(net.nodes.size(), 60);
        ASSERT_DOUBLE_EQ(*net.avg_degree, 12.5);
        ASSERT_DOUBLE_EQ(*net.mu, 0.3);
        ASSERT_EQ(net.community_labels(), generator.node_communities());

        for (const auto &n : net.nodes) {
            ASSERT_EQ(n.label, std::to_string(n.id));
            ASSERT_EQ(n.degree, graph.degree(n.id));
            ASSERT_FALSE(n.expected_degree.has_value());
        }

        check_edges(net, graph, generator.community_assignment());
    }
}

TEST_F(TestNetworkExport, CsvRoundTrip) {
    AdjacencyGraph graph(80);
    LFRGenerator generator(params(2));
    generator.generate(graph);

    std::stringstream nodes, edges;
    write_csv_nodes(nodes, graph, generator.community_assignment(), generator.degree_sequence(),
                    [](node u) { return "agent \"" + std::to_string(u) + "\", x"; });
    write_csv_edges(edges, graph, generator.community_assignment());

    auto net = read_csv(nodes, edges);
    ASSERT_EQ(net.nodes.size(), 80);
    ASSERT_FALSE(net.avg_degree.has_value());
    ASSERT_EQ(net.community_labels(), generator.node_communities());

    for (const auto &n : net.nodes) {
        ASSERT_EQ(n.label, "agent \"" + std::to_string(n.id) + "\", x");
        ASSERT_EQ(n.degree, graph.degree(n.id));
        ASSERT_EQ(*n.expected_degree, generator.degree_sequence()[n.id]);
    }

    check_edges(net, graph, generator.community_assignment());
}

TEST_F(TestNetworkExport, Headers) {
    AdjacencyGraph graph(3);
    graph.add_edge(0, 2);
    auto communities = CommunityAssignment::from_labels({0, 1, 0});

    std::stringstream nodes, edges;
    write_csv_nodes(nodes, graph, communities, {1, 0, 1});
    write_csv_edges(edges, graph, communities);

    ASSERT_EQ(nodes.str(), "id,label,community,degree,expected_degree\n"
                           "0,\"0\",0,1,1\n"
                           "1,\"1\",1,0,0\n"
                           "2,\"2\",0,1,1\n");
    ASSERT_EQ(edges.str(), "source,target,type,source_community,target_community\n"
                           "0,2,intra,0,0\n");

    std::stringstream gml;
    write_gml(gml, graph, communities, {1.0, 0.0, {}});
    ASSERT_EQ(gml.str().rfind("graph [\n", 0), 0);
    ASSERT_NE(gml.str().find("comment \"LFR Benchmark Network\""), std::string::npos);
    ASSERT_NE(gml.str().find("type \"intra\""), std::string::npos);
}

TEST_F(TestNetworkExport, MalformedInput) {
    {
        std::stringstream ss("graph [\n  node [\n    id x\n    community 0\n    degree 0\n  ]\n]\n");
        ASSERT_THROW(read_gml(ss), std::runtime_error);
    }
    {
        std::stringstream ss("graph [\n  node [\n    id 0\n  ]\n]\n");
        ASSERT_THROW(read_gml(ss), std::runtime_error);
    }
    {
        std::stringstream ss("graph [\n  directed 0\n");
        ASSERT_THROW(read_gml(ss), std::runtime_error);
    }
    {
        std::stringstream ss("graph [\n  edge [\n    source 0\n    target 1\n    type \"both\"\n  ]\n]\n");
        ASSERT_THROW(read_gml(ss), std::runtime_error);
    }
    {
        std::stringstream nodes("id,community\n0,0\n");
        std::stringstream edges("source,target,type,source_community,target_community\n");
        ASSERT_THROW(read_csv(nodes, edges), std::runtime_error);
    }
    {
        std::stringstream nodes("id,label,community,degree,expected_degree\n0,\"a\",0,1\n");
        std::stringstream edges("source,target,type,source_community,target_community\n");
        ASSERT_THROW(read_csv(nodes, edges), std::runtime_error);
    }
    {
        std::stringstream nodes("id,label,community,degree,expected_degree\n0,\"a,0,1,1\n");
        std::stringstream edges("source,target,type,source_community,target_community\n");
        ASSERT_THROW(read_csv(nodes, edges), std::runtime_error);
    }
}

TEST_F(TestNetworkExport, GmlLabelsWithQuotes) {
    AdjacencyGraph graph(3);
    graph.add_edge(0, 1);
    auto communities = CommunityAssignment::from_labels({0, 0, 1});

    ExportMetadata meta;
    meta.labeler = [](node u) { return "say \"" + std::to_string(u) + "\" & go"; };

    std::stringstream ss;
    write_gml(ss, graph, communities, meta);
    ASSERT_NE(ss.str().find("&quot;"), std::string::npos);

    auto net = read_gml(ss);
    ASSERT_EQ(net.nodes.size(), 3);
    for (const auto &n : net.nodes)
        ASSERT_EQ(n.label, "say \"" + std::to_string(n.id) + "\" & go");
}

TEST_F(TestNetworkExport, CommunityOutOfRange) {
    {
        std::stringstream nodes("id,label,community,degree,expected_degree\n"
                                "0,\"a\",0,0,0\n"
                                "1,\"b\",18446744073709551615,0,0\n");
        std::stringstream edges("source,target,type,source_community,target_community\n");
        auto net = read_csv(nodes, edges);
        ASSERT_THROW(net.community_labels(), std::runtime_error);
    }
    {
        std::stringstream ss("graph [\n  node [\n    id 0\n    community 5\n    degree 0\n  ]\n]\n");
        auto net = read_gml(ss);
        ASSERT_THROW(net.community_labels(), std::runtime_error);
    }
}

TEST_F(TestNetworkExport, DuplicateNodeIds) {
    std::stringstream nodes("id,label,community,degree,expected_degree\n0,\"a\",0,0,0\n0,\"b\",1,0,0\n");
    std::stringstream edges("source,target,type,source_community,target_community\n");
    auto net = read_csv(nodes, edges);
    ASSERT_THROW(net.community_labels(), std::runtime_error);
}
