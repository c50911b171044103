#pragma once

#include "analysis/group_pair.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Compact Letter Display (CLD)
//
// Groups that are NOT significantly different (adjusted p >= alpha) may share
// a letter; groups sharing a letter are never significantly different.
//
// The assignment is a single greedy pass in descending mean order. It does
// not backtrack, so a display can carry a redundant letter or under-merge an
// intransitive chain: with A~B, B~C, A!~C it yields A="a", B="a", C="b".
// ---------------------------------------------------------------------------

enum class MissingPairPolicy {
    ASSUME_NON_SIGNIFICANT,  // absent pair reads as p = 1.0
    REQUIRE_COMPLETE         // absent pair is an error
};

namespace detail {

constexpr size_t MAX_LETTERS = 52;

// a..z, then A..Z
inline char cld_letter(size_t index) {
    if (index >= MAX_LETTERS) {
        throw std::length_error("compact letter display needs more than " +
                                std::to_string(MAX_LETTERS) + " letters");
    }
    return index < 26 ? static_cast<char>('a' + index)
                      : static_cast<char>('A' + (index - 26));
}

template <typename G>
double pair_pvalue(const PairwisePValues<G>& pvals, const G& a, const G& b) {
    auto it = pvals.find(make_group_pair(a, b));
    return it == pvals.end() ? 1.0 : it->second;
}

template <typename G>
std::string describe_pair(const GroupPair<G>& pair) {
    std::ostringstream ss;
    ss << "(" << pair.first << ", " << pair.second << ")";
    return ss.str();
}

}  // namespace detail

// Throws std::invalid_argument naming the first pair of groups with no p-value.
template <typename G>
void require_complete_pairs(const std::map<G, double>& group_means,
                            const PairwisePValues<G>& pvals) {
    for (auto a = group_means.begin(); a != group_means.end(); ++a) {
        for (auto b = std::next(a); b != group_means.end(); ++b) {
            auto pair = make_group_pair(a->first, b->first);
            if (pvals.find(pair) == pvals.end()) {
                throw std::invalid_argument("missing pairwise p-value for groups " +
                                            detail::describe_pair(pair));
            }
        }
    }
}

template <typename G>
std::map<G, std::string> cld_letters(
    const std::map<G, double>& group_means,
    const PairwisePValues<G>& pvals,
    double alpha = 0.05,
    MissingPairPolicy policy = MissingPairPolicy::ASSUME_NON_SIGNIFICANT) {

    if (!(alpha > 0.0 && alpha <= 1.0)) {
        throw std::invalid_argument("alpha must lie in (0, 1]");
    }
    for (const auto& [group, mean] : group_means) {
        if (!std::isfinite(mean)) {
            std::ostringstream ss;
            ss << "non-finite mean for group " << group;
            throw std::invalid_argument(ss.str());
        }
    }
    if (policy == MissingPairPolicy::REQUIRE_COMPLETE) {
        require_complete_pairs(group_means, pvals);
    }

    // Descending mean; map iteration plus stable sort breaks ties by id
    std::vector<std::pair<G, double>> ordered(group_means.begin(), group_means.end());
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    auto non_significant = [&](const G& a, const G& b) {
        return detail::pair_pvalue(pvals, a, b) >= alpha;
    };

    std::map<G, std::string> letters;
    std::vector<std::vector<G>> letter_members;  // index = letter creation order

    for (const auto& entry : ordered) {
        const G& g = entry.first;
        std::string& assigned = letters[g];
        for (size_t li = 0; li < letter_members.size(); ++li) {
            auto& members = letter_members[li];
            bool compatible = std::all_of(members.begin(), members.end(),
                                          [&](const G& h) { return non_significant(g, h); });
            if (compatible) {
                assigned += detail::cld_letter(li);
                members.push_back(g);
            }
        }
        if (assigned.empty()) {
            assigned += detail::cld_letter(letter_members.size());
            letter_members.push_back({g});
        }
    }

    return letters;
}

// True when every pair of groups sharing a letter is non-significant.
template <typename G>
bool letters_consistent(const std::map<G, std::string>& letters,
                        const PairwisePValues<G>& pvals,
                        double alpha) {
    for (auto a = letters.begin(); a != letters.end(); ++a) {
        for (auto b = std::next(a); b != letters.end(); ++b) {
            bool shares = std::any_of(a->second.begin(), a->second.end(), [&](char c) {
                return b->second.find(c) != std::string::npos;
            });
            if (shares && detail::pair_pvalue(pvals, a->first, b->first) < alpha) {
                return false;
            }
        }
    }
    return true;
}
