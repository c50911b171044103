#pragma once

#include <map>
#include <tuple>
#include <utility>

// ---------------------------------------------------------------------------
// GroupPair - unordered pair of group identifiers in canonical form
//
// first <= second under operator< of G. Construct through make_group_pair so
// that lookups and insertions always agree on the key.
// ---------------------------------------------------------------------------
template <typename G>
struct GroupPair {
    G first;
    G second;

    bool operator<(const GroupPair& other) const {
        return std::tie(first, second) < std::tie(other.first, other.second);
    }
    bool operator==(const GroupPair& other) const {
        return !(first < other.first) && !(other.first < first) &&
               !(second < other.second) && !(other.second < second);
    }
};

template <typename G>
GroupPair<G> make_group_pair(const G& a, const G& b) {
    if (b < a) return GroupPair<G>{b, a};
    return GroupPair<G>{a, b};
}

// Adjusted p-value per unordered group pair.
template <typename G>
using PairwisePValues = std::map<GroupPair<G>, double>;
