#include <lfrbench/AdjacencyGraph.hpp>
#include <range/v3/numeric.hpp>

namespace lfrbench {

uint64_t AdjacencyGraph::fingerprint() const noexcept {
    return ranges::accumulate(edges(), uint64_t(0), [] (uint64_t s, std::pair<node, node> e) {
        return s * 1000003u + (e.first + 1) * (e.second + 1);
    });
}

}
