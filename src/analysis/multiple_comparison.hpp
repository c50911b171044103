#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AdjustMethod - family-wise error correction applied to pairwise p-values
// ---------------------------------------------------------------------------
enum class AdjustMethod { HOLM, BONFERRONI };

inline std::string adjust_method_name(AdjustMethod method) {
    return method == AdjustMethod::HOLM ? "holm" : "bonferroni";
}

// Case-insensitive. Throws std::invalid_argument for anything but holm/bonferroni.
inline AdjustMethod parse_adjust_method(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "holm") return AdjustMethod::HOLM;
    if (lower == "bonferroni") return AdjustMethod::BONFERRONI;
    throw std::invalid_argument("p-value adjustment must be 'holm' or 'bonferroni', got '" +
                                name + "'");
}

namespace detail {

inline double clip_unit(double p) {
    return std::min(1.0, std::max(0.0, p));
}

}  // namespace detail

// Holm step-down correction for multiple comparisons.
// Returns adjusted p-values in the SAME order as input.
inline std::vector<double> holm_adjust(const std::vector<double>& raw_pvals) {
    size_t m = raw_pvals.size();
    if (m == 0) return {};
    if (m == 1) return {detail::clip_unit(raw_pvals[0])};

    // Index array sorted by ascending raw p-value
    std::vector<size_t> order(m);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return raw_pvals[a] < raw_pvals[b];
    });

    std::vector<double> adjusted(m);
    double running_max = 0.0;
    for (size_t rank = 0; rank < m; ++rank) {
        size_t idx = order[rank];
        double candidate = raw_pvals[idx] * static_cast<double>(m - rank);
        // Adjusted p-values must be non-decreasing in sorted order
        running_max = std::max(running_max, candidate);
        adjusted[idx] = detail::clip_unit(running_max);
    }

    return adjusted;
}

// Single-step Bonferroni: every p-value scaled by the number of comparisons.
inline std::vector<double> bonferroni_adjust(const std::vector<double>& raw_pvals) {
    double m = static_cast<double>(raw_pvals.size());
    std::vector<double> adjusted(raw_pvals.size());
    for (size_t i = 0; i < raw_pvals.size(); ++i) {
        adjusted[i] = detail::clip_unit(raw_pvals[i] * m);
    }
    return adjusted;
}

inline std::vector<double> adjust_pvalues(const std::vector<double>& raw_pvals,
                                          AdjustMethod method) {
    switch (method) {
        case AdjustMethod::HOLM: return holm_adjust(raw_pvals);
        case AdjustMethod::BONFERRONI: return bonferroni_adjust(raw_pvals);
    }
    throw std::invalid_argument("unknown p-value adjustment method");
}

inline std::vector<double> adjust_pvalues(const std::vector<double>& raw_pvals,
                                          const std::string& method) {
    return adjust_pvalues(raw_pvals, parse_adjust_method(method));
}
