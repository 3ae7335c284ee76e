#pragma once
#ifndef LFRBENCH_COMMUNITY_SIZES_HPP
#define LFRBENCH_COMMUNITY_SIZES_HPP

#include <random>
#include <vector>

#include <lfrbench/defs.hpp>

namespace lfrbench {

//! draws community sizes from PowerlawVariate(min_size, max_size, tau2) until they cover num_nodes;
//! the result sums to num_nodes and its length is not known in advance
std::vector<count> generate_community_sizes(std::mt19937_64 &gen, count num_nodes, count min_size, count max_size,
                                            double tau2);

//! folds the remainder that does not fit another sampled community into the size list
void close_community_sizes(std::vector<count> &sizes, count remaining, count min_size);

}

#endif // LFRBENCH_COMMUNITY_SIZES_HPP
