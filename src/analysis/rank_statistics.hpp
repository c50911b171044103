#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <vector>

// ---------------------------------------------------------------------------
// Rank statistics over pooled observations
//
// Ranks are 1-based. Tied values receive the mean of the ranks they would
// occupy (mid-rank method), so the ranks of N values always sum to N(N+1)/2.
// ---------------------------------------------------------------------------

inline std::vector<double> average_ranks(const std::vector<double>& data) {
    size_t n = data.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return data[a] < data[b];
    });

    std::vector<double> ranks(n);
    size_t i = 0;
    while (i < n) {
        size_t j = i + 1;
        while (j < n && data[order[j]] == data[order[i]]) ++j;
        // Average rank for ties
        double avg_rank = 0.5 * (static_cast<double>(i + 1) + static_cast<double>(j));
        for (size_t k = i; k < j; ++k) {
            ranks[order[k]] = avg_rank;
        }
        i = j;
    }
    return ranks;
}

// Multiplicity of each distinct value, in ascending value order.
inline std::vector<size_t> tie_counts(const std::vector<double>& data) {
    std::vector<double> sorted(data);
    std::sort(sorted.begin(), sorted.end());

    std::vector<size_t> counts;
    size_t i = 0;
    while (i < sorted.size()) {
        size_t j = i + 1;
        while (j < sorted.size() && sorted[j] == sorted[i]) ++j;
        counts.push_back(j - i);
        i = j;
    }
    return counts;
}

// C = 1 - sum(t^3 - t) / (N^3 - N) over tie multiplicities t.
// Returns 1 for N <= 1, where the denominator vanishes.
inline double tie_correction(const std::vector<double>& data) {
    size_t n = data.size();
    if (n <= 1) return 1.0;

    double tie_term = 0.0;
    for (size_t t : tie_counts(data)) {
        double tf = static_cast<double>(t);
        tie_term += tf * tf * tf - tf;
    }
    double nf = static_cast<double>(n);
    return 1.0 - tie_term / (nf * nf * nf - nf);
}

// Sum and count of ranks for members labelled with each group index.
struct GroupRankSums {
    std::vector<double> rank_sums;
    std::vector<size_t> sizes;

    double mean_rank(size_t g) const {
        return sizes[g] > 0 ? rank_sums[g] / static_cast<double>(sizes[g]) : 0.0;
    }
};

inline GroupRankSums group_rank_sums(const std::vector<double>& ranks,
                                     const std::vector<size_t>& labels,
                                     size_t num_groups) {
    GroupRankSums sums;
    sums.rank_sums.assign(num_groups, 0.0);
    sums.sizes.assign(num_groups, 0);
    for (size_t i = 0; i < ranks.size(); ++i) {
        sums.rank_sums[labels[i]] += ranks[i];
        ++sums.sizes[labels[i]];
    }
    return sums;
}
