#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

#include <lfrbench/ScopedTimer.hpp>
#include <lfrbench/AdjacencyGraph.hpp>
#include <lfrbench/LFRGenerator.hpp>
#include <lfrbench/QualityAnalyzer.hpp>

namespace lfrbench {

void benchmark(count n, double mu, int graphs, std::vector<double> &times) {
    std::random_device rd;

    LFRParameters params;
    params.mu = mu;
    params.min_degree = 5;
    params.max_degree = 50;
    params.avg_degree = 15;
    params.min_community = 20;
    params.max_community = 100;

    std::string label = "n=" + std::to_string(n) + " mu=" + std::to_string(int(100 * mu));

    for (int i = 0; i < graphs; ++i) {
        params.seed = rd();
        LFRGenerator generator(params);
        AdjacencyGraph graph(n);

        {
            ScopedTimer timer(label);
            generator.generate(graph);
            times.emplace_back(timer.elapsed());
        }

        const auto &stats = generator.statistics().edges;
        std::cout << label << " m=" << stats.edges_created << "/" << stats.target_edges
                  << " avg_d=" << average_degree(graph)
                  << " communities=" << generator.communities().size() << "\n";
    }
}

}

int main() {
    using namespace lfrbench;

    for (count n : {count(1) << 10, count(1) << 12, count(1) << 14}) {
        for (double mu : {0.1, 0.3, 0.5}) {
            std::vector<double> times;
            benchmark(n, mu, 5, times);

            const double mean = std::accumulate(times.begin(), times.end(), 0.0) / times.size();
            std::cout << "n=" << n << " mu=" << mu << " mean " << mean << "ms\n";
        }
    }

    return 0;
}
