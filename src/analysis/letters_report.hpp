#pragma once

#include "analysis/compact_letter_display.hpp"
#include "analysis/dunn_test.hpp"
#include "analysis/multiple_comparison.hpp"
#include "analysis/statistical_tests.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Observation - one measured value of a group within a partition
// ---------------------------------------------------------------------------
template <typename G>
struct Observation {
    std::string partition;
    G group{};
    double value = 0.0;
};

// ---------------------------------------------------------------------------
// LettersReportConfig
// ---------------------------------------------------------------------------
template <typename G>
struct LettersReportConfig {
    double alpha = 0.05;
    AdjustMethod adjust = AdjustMethod::HOLM;
    // Presentation order of groups within a partition. Groups not listed
    // follow the listed ones in id order.
    std::vector<G> category_order;
    MissingPairPolicy missing_pairs = MissingPairPolicy::REQUIRE_COMPLETE;
};

template <typename G>
struct LetterRow {
    std::string partition;
    G group{};
    std::string letters;
    double mean = 0.0;
    int count = 0;
};

template <typename G>
struct PartitionSummary {
    std::string partition;
    int group_count = 0;
    int observation_count = 0;
    int dropped_nan = 0;
    TestResult kruskal_wallis;
    std::vector<DunnComparison<G>> comparisons;
};

struct SkippedPartition {
    std::string partition;
    std::string reason;
};

template <typename G>
struct LettersReport {
    std::vector<LetterRow<G>> rows;
    std::vector<PartitionSummary<G>> partitions;
    std::vector<SkippedPartition> skipped_partitions;
};

// A numeric group id that is NaN or infinite names no group: NaN has no
// place in the ordering of a std::map key.
inline bool is_missing_group(double group) {
    return !std::isfinite(group);
}

inline bool is_missing_group(const std::string&) {
    return false;
}

namespace detail {

// Position of a group in the presentation order; unlisted groups sort last.
template <typename G>
size_t category_rank(const std::vector<G>& order, const G& group) {
    for (size_t i = 0; i < order.size(); ++i) {
        if (!(order[i] < group) && !(group < order[i])) return i;
    }
    return order.size();
}

}  // namespace detail

// ---------------------------------------------------------------------------
// compute_letters_per_group - Dunn + CLD independently within each partition
//
// NaN values, and observations whose group id is missing (see
// is_missing_group), are dropped and counted in dropped_nan. Partitions left
// with fewer than 2 non-empty groups are skipped and listed in
// skipped_partitions. Rows are ordered by partition, then by category_order.
// ---------------------------------------------------------------------------
template <typename G>
LettersReport<G> compute_letters_per_group(const std::vector<Observation<G>>& observations,
                                           const LettersReportConfig<G>& config = {}) {
    std::map<std::string, std::map<G, std::vector<double>>> partitions;
    std::map<std::string, int> dropped;
    for (const auto& obs : observations) {
        auto& groups = partitions[obs.partition];
        if (std::isnan(obs.value) || is_missing_group(obs.group)) {
            ++dropped[obs.partition];
            continue;
        }
        groups[obs.group].push_back(obs.value);
    }

    LettersReport<G> report;
    for (auto& [partition, groups] : partitions) {
        if (groups.size() < 2) {
            report.skipped_partitions.push_back(
                {partition, "fewer than 2 non-empty groups (" +
                                std::to_string(groups.size()) + ")"});
            continue;
        }

        std::map<G, double> means;
        int n_total = 0;
        for (const auto& [group, values] : groups) {
            double sum = 0.0;
            for (double v : values) sum += v;
            means[group] = sum / static_cast<double>(values.size());
            n_total += static_cast<int>(values.size());
        }

        PartitionSummary<G> summary;
        summary.partition = partition;
        summary.group_count = static_cast<int>(groups.size());
        summary.observation_count = n_total;
        summary.dropped_nan = dropped[partition];
        summary.kruskal_wallis = kruskal_wallis_test(groups);
        summary.comparisons = dunn_pairwise(groups, config.adjust);

        auto letters = cld_letters(means, to_pvalue_map(summary.comparisons),
                                   config.alpha, config.missing_pairs);

        std::vector<LetterRow<G>> rows;
        for (const auto& [group, letter] : letters) {
            LetterRow<G> row;
            row.partition = partition;
            row.group = group;
            row.letters = letter;
            row.mean = means[group];
            row.count = static_cast<int>(groups[group].size());
            rows.push_back(row);
        }
        std::stable_sort(rows.begin(), rows.end(), [&](const LetterRow<G>& a, const LetterRow<G>& b) {
            return detail::category_rank(config.category_order, a.group) <
                   detail::category_rank(config.category_order, b.group);
        });

        report.rows.insert(report.rows.end(), rows.begin(), rows.end());
        report.partitions.push_back(std::move(summary));
    }

    return report;
}
