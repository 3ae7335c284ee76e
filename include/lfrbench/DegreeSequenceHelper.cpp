#include <lfrbench/DegreeSequenceHelper.hpp>

#include <cassert>
#include <cmath>
#include <algorithm>
#include <functional>

#include <tlx/define/likely.hpp>
#include <tlx/logger.hpp>

#include <range/v3/numeric.hpp>

#include <lfrbench/PowerlawVariate.hpp>

namespace lfrbench {

static constexpr bool debug = false;

static constexpr double kMinRescaleFactor = 0.8;
static constexpr double kMaxRescaleFactor = 1.3;

std::vector<count> generate_degree_sequence(std::mt19937_64 &gen, std::size_t n, bool directed,
                                            const LFRParameters &params, DegreeSequenceStatistics *stats) {
    PowerlawVariate variate(params.min_degree, params.max_degree, params.tau1);
    auto degree_sequence = variate.sample(n, gen);

    const double sampled_mean = mean_degree(degree_sequence);
    sLOG << "sampled degree mean" << sampled_mean << "target" << params.avg_degree;

    const double factor = rescale_degree_sequence(degree_sequence, params.avg_degree, params.rescale_threshold,
                                                  params.min_degree, params.max_degree);

    bool parity_fixed = true;
    if (!directed) {
        parity_fixed = fix_degree_sum_parity(degree_sequence, gen, params.min_degree, params.max_degree);
        if (TLX_UNLIKELY(!parity_fixed)) {
            LOG1 << "degree sum of undirected sequence stays odd; every node is pinned to "
                 << params.max_degree;
        }
    }

    if (stats) {
        stats->sampled_mean = sampled_mean;
        stats->final_mean = mean_degree(degree_sequence);
        stats->rescale_factor = factor;
        stats->rescaled = (factor != 1.0);
        stats->parity_fixed = parity_fixed;
        stats->graphical = directed || is_degree_sequence_graphical(degree_sequence);
    }

    return degree_sequence;
}

double rescale_degree_sequence(std::vector<count> &degree_sequence, double target_mean, double threshold,
                               count min_degree, count max_degree) {
    const double current = mean_degree(degree_sequence);
    if (current <= 0 || std::abs(current - target_mean) / target_mean < threshold)
        return 1.0;

    const double factor = std::clamp(target_mean / current, kMinRescaleFactor, kMaxRescaleFactor);
    for (auto &d : degree_sequence) {
        const auto scaled = static_cast<count>(std::llround(static_cast<double>(d) * factor));
        d = std::clamp(scaled, min_degree, max_degree);
    }

    sLOG << "rescaled degree sequence by" << factor << "new mean" << mean_degree(degree_sequence);
    return factor;
}

bool fix_degree_sum_parity(std::vector<count> &degree_sequence, std::mt19937_64 &gen,
                           count min_degree, count max_degree) {
    if (degree_sequence.empty() || ranges::accumulate(degree_sequence, count(0)) % 2 == 0)
        return true;

    auto start = std::uniform_int_distribution<std::size_t>{0, degree_sequence.size() - 1}(gen);
    if (degree_sequence[start] < max_degree) {
        degree_sequence[start]++;
        return true;
    }

    auto it = std::find_if(degree_sequence.begin(), degree_sequence.end(),
                           [max_degree](count d) { return d < max_degree; });
    if (it != degree_sequence.end()) {
        ++*it;
        return true;
    }

    // all nodes are at max_degree; lowering one is the only way to an even sum
    if (degree_sequence[start] > min_degree) {
        degree_sequence[start]--;
        return true;
    }

    return false;
}

double mean_degree(const std::vector<count> &degree_sequence) {
    if (degree_sequence.empty()) return 0.0;
    return static_cast<double>(ranges::accumulate(degree_sequence, count(0))) /
           static_cast<double>(degree_sequence.size());
}


///! This function is derived from NetworKit::StaticDegreeSequence::isRealizable()
///! https://networkit.github.io/; CODE UNDER MIT LICENSE
bool is_degree_sequence_graphical(const std::vector<count> &seq) {
    count n = seq.size();
    if (n == 0) return true;

    // First inequality
    count deg_sum = 0;
    for (count i = 0; i < n; ++i) {
        if (TLX_UNLIKELY(seq[i] >= n)) {
            return false;
        }
        deg_sum += seq[i];
    }

    if (deg_sum % 2 != 0) {
        return false;
    }

    std::vector<count> partialSeqSum(n + 1);
    std::copy(seq.cbegin(), seq.cend(), partialSeqSum.begin());
    sort(partialSeqSum.begin(), partialSeqSum.end(), std::greater<count>());
    for (size_t i = n - 1; i--;) { // not using std::partial_sum as unclear whether input/output may be identical
        partialSeqSum[i] += partialSeqSum[i + 1];
    }

    auto degreeOf = [&](size_t i) {
        assert(i < n);
        return partialSeqSum[i] - partialSeqSum[i + 1];
    };

    deg_sum = 0;
    for (count j = 0; j < n; ++j) {
        deg_sum += degreeOf(j);
        count min_deg_sum = 0;

        size_t sumFrom = j + 1;
        if (sumFrom < n && degreeOf(sumFrom) >= j + 1) {
            // find the first element right of j that has a value less or equal to j
            const auto it = std::lower_bound(partialSeqSum.data() + sumFrom, partialSeqSum.data() + n, j,
                                             [](const count &x, const count j) { return x - *(&x + 1) > j; });
            sumFrom = std::distance(partialSeqSum.data(), it);
            min_deg_sum += (j + 1) * (sumFrom - j - 1);
        }

        if (sumFrom != n)
            min_deg_sum += partialSeqSum[sumFrom];

        if (TLX_UNLIKELY(deg_sum > (j + 1) * j + min_deg_sum)) {
            return false;
        }
    }

    return true;
}

}
