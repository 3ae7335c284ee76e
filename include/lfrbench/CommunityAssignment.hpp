#pragma once
#ifndef LFRBENCH_COMMUNITY_ASSIGNMENT_HPP
#define LFRBENCH_COMMUNITY_ASSIGNMENT_HPP

#include <cassert>
#include <random>
#include <vector>

#include <range/v3/view.hpp>

#include <lfrbench/defs.hpp>

namespace lfrbench {

/**
 * Disjoint, exhaustive partition of the nodes [0, n) into communities [0, k).
 * Stores both directions: the community of every node and the member list of every community.
 */
class CommunityAssignment {
public:
    CommunityAssignment() = default;

    explicit CommunityAssignment(count num_nodes, count num_communities = 0)
        : community_of_(num_nodes, kUnassigned), members_(num_communities) {}

    //! partitions a uniformly shuffled node order by the given sizes (in order); nodes left over
    //! after all sizes are served go one by one to the currently smallest community
    static CommunityAssignment from_sizes(count num_nodes, const std::vector<count> &sizes, std::mt19937_64 &gen);

    //! rebuilds an assignment from a node -> community map (e.g. read from a file);
    //! throws std::invalid_argument if a label is not below the number of nodes
    static CommunityAssignment from_labels(const std::vector<community_id> &labels);

    [[nodiscard]] count num_nodes() const noexcept { return community_of_.size(); }
    [[nodiscard]] count num_communities() const noexcept { return members_.size(); }

    [[nodiscard]] community_id community_of(node u) const noexcept {
        assert(u < num_nodes());
        return community_of_[u];
    }

    [[nodiscard]] bool same_community(node u, node v) const noexcept {
        return community_of(u) == community_of(v);
    }

    [[nodiscard]] const std::vector<node> &members(community_id c) const noexcept {
        assert(c < num_communities());
        return members_[c];
    }

    [[nodiscard]] count size(community_id c) const noexcept { return members(c).size(); }

    [[nodiscard]] const std::vector<community_id> &node_communities() const noexcept { return community_of_; }
    [[nodiscard]] const std::vector<std::vector<node>> &communities() const noexcept { return members_; }

    //! sizes of all communities, in community id order
    [[nodiscard]] auto sizes() const noexcept {
        return members_ | ranges::views::transform([](const auto &m) { return static_cast<count>(m.size()); });
    }

    //! community with the fewest members; ties go to the lowest id
    [[nodiscard]] community_id smallest_community() const noexcept;

    //! true if every node is in exactly one member list and the lists match community_of
    [[nodiscard]] bool is_consistent() const;

    void assign(node u, community_id c) {
        assert(community_of_[u] == kUnassigned);
        if (c >= members_.size())
            members_.resize(c + 1);
        community_of_[u] = c;
        members_[c].push_back(u);
    }

    static constexpr community_id kUnassigned = static_cast<community_id>(-1);

private:
    std::vector<community_id> community_of_;
    std::vector<std::vector<node>> members_;
};

}

#endif // LFRBENCH_COMMUNITY_ASSIGNMENT_HPP
