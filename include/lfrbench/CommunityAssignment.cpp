#include <lfrbench/CommunityAssignment.hpp>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

#include <shuffle/algorithms/FisherYates.hpp>

#include <tlx/logger.hpp>

namespace lfrbench {

static constexpr bool debug = false;

CommunityAssignment CommunityAssignment::from_sizes(count num_nodes, const std::vector<count> &sizes,
                                                    std::mt19937_64 &gen) {
    std::vector<node> order(num_nodes);
    std::iota(order.begin(), order.end(), node(0));
    shuffle::fisher_yates(order.begin(), order.end(), gen);

    CommunityAssignment result(num_nodes, sizes.size());

    auto it = order.cbegin();
    for (community_id c = 0; c < sizes.size(); ++c) {
        const auto intake = std::min<count>(sizes[c], std::distance(it, order.cend()));
        result.members_[c].reserve(intake);
        for (count i = 0; i < intake; ++i, ++it)
            result.assign(*it, c);
    }

    if (it != order.cend()) {
        sLOG << std::distance(it, order.cend()) << "nodes left after serving all community sizes";
        if (result.members_.empty())
            result.members_.resize(1);
    }

    for (; it != order.cend(); ++it)
        result.assign(*it, result.smallest_community());

    return result;
}

CommunityAssignment CommunityAssignment::from_labels(const std::vector<community_id> &labels) {
    // at most one community per node
    auto it = std::find_if(labels.begin(), labels.end(), [&](community_id c) { return c >= labels.size(); });
    if (it != labels.end())
        throw std::invalid_argument("Community label " + std::to_string(*it) + " of node " +
                                    std::to_string(std::distance(labels.begin(), it)) +
                                    " is not below the number of nodes " + std::to_string(labels.size()));

    const auto num_communities = labels.empty() ? 0 : *std::max_element(labels.begin(), labels.end()) + 1;
    CommunityAssignment result(labels.size(), num_communities);
    for (node u = 0; u < labels.size(); ++u)
        result.assign(u, labels[u]);
    return result;
}

community_id CommunityAssignment::smallest_community() const noexcept {
    assert(!members_.empty());
    auto it = std::min_element(members_.begin(), members_.end(),
                               [](const auto &a, const auto &b) { return a.size() < b.size(); });
    return static_cast<community_id>(std::distance(members_.begin(), it));
}

bool CommunityAssignment::is_consistent() const {
    std::vector<count> seen(num_nodes(), 0);
    for (community_id c = 0; c < members_.size(); ++c) {
        for (auto u : members_[c]) {
            if (u >= num_nodes() || community_of_[u] != c)
                return false;
            seen[u]++;
        }
    }
    return std::all_of(seen.begin(), seen.end(), [](count x) { return x == 1; });
}

}
