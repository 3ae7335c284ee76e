#include <lfrbench/AdjacencyGraph.hpp>
#include <lfrbench/LFRGenerator.hpp>
#include <lfrbench/QualityAnalyzer.hpp>

#include <gtest/gtest.h>
#include <range/v3/all.hpp>

using namespace lfrbench;

class TestLFRGenerator : public ::testing::Test {
protected:
    static LFRParameters scenario_params(uint64_t seed) {
        LFRParameters params;
        params.tau1 = 2.5;
        params.tau2 = 1.5;
        params.mu = 0.2;
        params.min_degree = 5;
        params.max_degree = 20;
        params.avg_degree = 10;
        params.min_community = 10;
        params.max_community = 50;
        params.seed = seed;
        return params;
    }

    static void expect_parameter_error(const LFRParameters &params, const std::string &name) {
        try {
            LFRGenerator generator(params);
            FAIL() << "expected ParameterError for " << name;
        } catch (const ParameterError &e) {
            ASSERT_EQ(e.parameter(), name);
        }
    }
};

TEST_F(TestLFRGenerator, SmallUndirectedScenario) {
    for (uint64_t seed = 0; seed < 5; ++seed) {
        AdjacencyGraph graph(100);
        LFRGenerator generator(scenario_params(seed));
        generator.generate(graph);

        ASSERT_TRUE(generator.has_generated());
        ASSERT_EQ(graph.num_nodes(), 100);

        const double avg = generator.actual_average_degree(graph);
        ASSERT_GE(avg, 8.0) << "seed " << seed;
        ASSERT_LE(avg, 12.0) << "seed " << seed;

        ASSERT_GE(generator.community_assignment().num_communities(), 2);
        ASSERT_EQ(graph.num_isolated_nodes(), 0);
        ASSERT_EQ(validate_network(graph, generator.community_assignment()).isolated_nodes, 0);
    }
}

TEST_F(TestLFRGenerator, StructuralInvariants) {
    for (uint64_t seed = 10; seed < 15; ++seed) {
        for (bool directed : {false, true}) {
            auto params = scenario_params(seed);
            params.mu = 0.1 * static_cast<double>(seed - 10);
            params.symmetrical = directed && seed % 2;

            AdjacencyGraph graph(250, directed);
            LFRGenerator generator(params);
            generator.generate(graph);

            const auto &degrees = generator.degree_sequence();
            ASSERT_EQ(degrees.size(), 250);
            for (auto d : degrees) {
                ASSERT_GE(d, params.min_degree);
                ASSERT_LE(d, params.max_degree);
            }
            if (!directed)
                ASSERT_EQ(ranges::accumulate(degrees, count(0)) % 2, 0u);

            ASSERT_EQ(ranges::accumulate(generator.community_sizes(), count(0)), 250);
            ASSERT_TRUE(generator.community_assignment().is_consistent());
            ASSERT_EQ(generator.communities().size(), generator.statistics().num_communities);
            ASSERT_EQ(generator.node_communities().size(), 250);

            for (node u : graph.nodes()) {
                ASSERT_FALSE(graph.has_edge(u, u));
                ASSERT_LE(graph.degree(u), degrees[u]);
            }

            const auto &edges = generator.statistics().edges;
            ASSERT_LE(edges.edges_created, edges.target_edges);
            ASSERT_EQ(edges.edges_created + edges.mirrored_edges, graph.num_edges());
        }
    }
}

TEST_F(TestLFRGenerator, Deterministic) {
    auto params = scenario_params(1234);

    AdjacencyGraph first(300);
    LFRGenerator a(params);
    a.generate(first);

    AdjacencyGraph second(300);
    LFRGenerator b(params);
    b.generate(second);

    ASSERT_EQ(a.degree_sequence(), b.degree_sequence());
    ASSERT_EQ(a.community_sizes(), b.community_sizes());
    ASSERT_EQ(a.node_communities(), b.node_communities());
    ASSERT_EQ(first.fingerprint(), second.fingerprint());
    ASSERT_DOUBLE_EQ(a.modularity(first), b.modularity(second));

    // generate() reseeds, so a second run on the same instance repeats the first
    AdjacencyGraph third(300);
    a.generate(third);
    ASSERT_EQ(first.fingerprint(), third.fingerprint());
}

TEST_F(TestLFRGenerator, RegenerateOnSameGraphKeepsDegreeBounds) {
    for (bool directed : {false, true}) {
        AdjacencyGraph graph(100, directed);
        LFRGenerator generator(scenario_params(3));

        generator.generate(graph);
        const auto edges_after_first = graph.num_edges();
        const auto fingerprint_after_first = graph.fingerprint();

        // the second run reseeds, samples the same targets and finds them (almost) served
        generator.generate(graph);
        const auto &degrees = generator.degree_sequence();
        for (node u : graph.nodes())
            ASSERT_LE(graph.degree(u), degrees[u]) << "node " << u;

        const auto &stats = generator.statistics().edges;
        ASSERT_EQ(graph.num_edges(), edges_after_first + stats.edges_created + stats.mirrored_edges);
        ASSERT_LE(graph.num_edges(), stats.target_edges);

        // repeating the whole sequence on a fresh graph gives the same result
        AdjacencyGraph replay(100, directed);
        LFRGenerator other(scenario_params(3));
        other.generate(replay);
        ASSERT_EQ(replay.fingerprint(), fingerprint_after_first);
        other.generate(replay);
        ASSERT_EQ(replay.fingerprint(), graph.fingerprint());
    }
}

TEST_F(TestLFRGenerator, ModularityDecreasesWithMixing) {
    auto params = scenario_params(7);

    params.mu = 0.0;
    AdjacencyGraph separated(200);
    LFRGenerator low_mixing(params);
    low_mixing.generate(separated);

    params.mu = 0.8;
    AdjacencyGraph mixed(200);
    LFRGenerator high_mixing(params);
    high_mixing.generate(mixed);

    const double q_low = low_mixing.modularity(separated);
    const double q_high = high_mixing.modularity(mixed);
    ASSERT_GT(q_low, q_high);
    ASSERT_GT(q_low, 0.3);

    ASSERT_EQ(validate_network(separated, low_mixing.community_assignment()).inter_edges, 0);
}

TEST_F(TestLFRGenerator, TooFewNodes) {
    AdjacencyGraph graph(9);
    LFRGenerator generator(scenario_params(0));
    ASSERT_THROW(generator.generate(graph), GenerationError);

    ASSERT_FALSE(generator.has_generated());
    ASSERT_TRUE(generator.degree_sequence().empty());
    ASSERT_EQ(graph.num_edges(), 0);
    ASSERT_EQ(generator.modularity(graph), 0.0);
}

TEST_F(TestLFRGenerator, AverageDegreeNotBelowNodeCount) {
    AdjacencyGraph graph(10);
    LFRGenerator generator(scenario_params(0));
    ASSERT_THROW(generator.generate(graph), GenerationError);
    ASSERT_EQ(graph.num_edges(), 0);

    AdjacencyGraph larger(11);
    ASSERT_NO_THROW(generator.generate(larger));
}

TEST_F(TestLFRGenerator, InvalidParameters) {
    {
        auto params = scenario_params(0);
        params.tau1 = 1.0;
        expect_parameter_error(params, "tau1");
    }
    {
        auto params = scenario_params(0);
        params.tau2 = 0.5;
        expect_parameter_error(params, "tau2");
    }
    {
        auto params = scenario_params(0);
        params.mu = 1.5;
        expect_parameter_error(params, "mu");
    }
    {
        auto params = scenario_params(0);
        params.min_degree = 0;
        expect_parameter_error(params, "min_degree");
    }
    {
        auto params = scenario_params(0);
        params.max_degree = 4;
        expect_parameter_error(params, "max_degree");
    }
    {
        auto params = scenario_params(0);
        params.avg_degree = 25;
        expect_parameter_error(params, "avg_degree");
    }
    {
        auto params = scenario_params(0);
        params.min_community = 0;
        expect_parameter_error(params, "min_community");
    }
    {
        auto params = scenario_params(0);
        params.max_community = 5;
        expect_parameter_error(params, "max_community");
    }
}

TEST_F(TestLFRGenerator, DefaultAverageDegree) {
    LFRParameters params;
    params.min_degree = 4;
    params.max_degree = 30;
    params.with_default_average_degree();
    ASSERT_DOUBLE_EQ(params.avg_degree, 17.0);
    ASSERT_NO_THROW(params.validate());
}
