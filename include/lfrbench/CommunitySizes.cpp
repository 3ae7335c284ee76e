#include <lfrbench/CommunitySizes.hpp>

#include <tlx/die.hpp>
#include <tlx/logger.hpp>

#include <range/v3/numeric.hpp>

#include <lfrbench/PowerlawVariate.hpp>

namespace lfrbench {

static constexpr bool debug = false;

std::vector<count> generate_community_sizes(std::mt19937_64 &gen, count num_nodes, count min_size, count max_size,
                                            double tau2) {
    PowerlawVariate variate(min_size, max_size, tau2);

    std::vector<count> sizes;
    count assigned = 0;
    while (assigned < num_nodes) {
        const count size = variate(gen);

        if (assigned + size <= num_nodes) {
            sizes.push_back(size);
            assigned += size;
        } else {
            close_community_sizes(sizes, num_nodes - assigned, min_size);
            assigned = num_nodes;
        }
    }

    sLOG << "sampled" << sizes.size() << "communities for" << num_nodes << "nodes";
#ifndef NDEBUG
    die_unequal(ranges::accumulate(sizes, count(0)), num_nodes);
#endif

    return sizes;
}

void close_community_sizes(std::vector<count> &sizes, count remaining, count min_size) {
    if (!remaining) return;

    if (remaining >= min_size || sizes.empty()) {
        // a lone remainder below min_size still has to become a community
        sizes.push_back(remaining);
    } else {
        sizes.back() += remaining;
    }
}

}
