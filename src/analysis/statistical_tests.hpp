#pragma once

#include "analysis/rank_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <map>
#include <vector>

// ---------------------------------------------------------------------------
// TestResult - generic {statistic, p_value} pair
// ---------------------------------------------------------------------------
struct TestResult {
    double statistic = 0.0;
    double p_value = 1.0;
    int df = 0;
};

namespace detail {

// Regularized upper incomplete gamma Q(a, x).
// Series for x < a + 1, Lentz continued fraction otherwise.
inline double upper_incomplete_gamma_q(double a, double x) {
    if (x <= 0.0) return 1.0;
    constexpr int MAX_ITER = 500;
    constexpr double EPS = 1e-14;
    constexpr double TINY = 1e-300;
    double log_prefix = -x + a * std::log(x) - std::lgamma(a);

    if (x < a + 1.0) {
        double ap = a;
        double term = 1.0 / a;
        double sum = term;
        for (int k = 0; k < MAX_ITER; ++k) {
            ap += 1.0;
            term *= x / ap;
            sum += term;
            if (std::abs(term) < std::abs(sum) * EPS) break;
        }
        double p = std::exp(log_prefix) * sum;
        return std::min(1.0, std::max(0.0, 1.0 - p));
    }

    double b = x + 1.0 - a;
    double c = 1.0 / TINY;
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i <= MAX_ITER; ++i) {
        double an = -static_cast<double>(i) * (static_cast<double>(i) - a);
        b += 2.0;
        d = an * d + b;
        if (std::abs(d) < TINY) d = TINY;
        c = b + an / c;
        if (std::abs(c) < TINY) c = TINY;
        d = 1.0 / d;
        double delta = d * c;
        h *= delta;
        if (std::abs(delta - 1.0) < EPS) break;
    }
    return std::min(1.0, std::max(0.0, std::exp(log_prefix) * h));
}

}  // namespace detail

// Chi-squared survival function (1 - CDF) for df degrees of freedom.
inline double chi2_sf(double x, int df) {
    if (df <= 0 || x <= 0.0) return 1.0;
    if (std::isinf(x)) return 0.0;
    if (df == 2) return std::exp(-x / 2.0);
    return detail::upper_incomplete_gamma_q(static_cast<double>(df) / 2.0, x / 2.0);
}

inline double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

// Upper tail P(Z > x). erfc keeps precision far into the tail.
inline double normal_sf(double x) {
    return 0.5 * std::erfc(x / std::sqrt(2.0));
}

// 2 * (1 - Phi(|z|)), 0 for infinite z.
inline double two_sided_normal_p(double z) {
    if (std::isinf(z)) return 0.0;
    return std::min(1.0, 2.0 * normal_sf(std::abs(z)));
}

// ---------------------------------------------------------------------------
// Kruskal-Wallis H test across k groups
// H = [12 / (N(N+1)) * sum(R_g^2 / n_g) - 3(N+1)] / C,  H ~ chi2(k - 1)
// Empty groups are ignored. Fewer than 2 non-empty groups, or all values
// tied (C == 0), yields {0, 1}.
// ---------------------------------------------------------------------------
template <typename G>
TestResult kruskal_wallis_test(const std::map<G, std::vector<double>>& groups) {
    std::vector<double> pooled;
    std::vector<size_t> labels;
    size_t k = 0;
    for (const auto& [id, values] : groups) {
        if (values.empty()) continue;
        pooled.insert(pooled.end(), values.begin(), values.end());
        labels.insert(labels.end(), values.size(), k);
        ++k;
    }
    if (k < 2) return {};

    double c = tie_correction(pooled);
    if (c <= 0.0) return {0.0, 1.0, static_cast<int>(k - 1)};

    auto ranks = average_ranks(pooled);
    auto sums = group_rank_sums(ranks, labels, k);

    double nf = static_cast<double>(pooled.size());
    double weighted = 0.0;
    for (size_t g = 0; g < k; ++g) {
        weighted += sums.rank_sums[g] * sums.rank_sums[g] / static_cast<double>(sums.sizes[g]);
    }
    double h = (12.0 / (nf * (nf + 1.0)) * weighted - 3.0 * (nf + 1.0)) / c;
    h = std::max(0.0, h);

    int df = static_cast<int>(k - 1);
    return {h, chi2_sf(h, df), df};
}
