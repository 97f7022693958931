#pragma once

// Sequence helpers shared by the diff and merge engines.
//
// Internal header, not installed.

#include <algorithm>
#include <cstddef>
#include <vector>

namespace canvas_merge::detail {

// Mark the members of one longest strictly increasing subsequence of
// `values`. Elements outside it are the minimal set of moves that turns the
// sorted order into `values`. Ties resolve to the earliest candidates, so
// the result is deterministic.
inline auto longest_increasing_subsequence(const std::vector<std::size_t>& values)
    -> std::vector<bool> {
    auto n = values.size();
    auto tails = std::vector<std::size_t>{};        // positions of pile tops
    auto previous = std::vector<std::size_t>(n, n);  // predecessor links
    for (std::size_t i = 0; i < n; ++i) {
        auto it = std::lower_bound(tails.begin(), tails.end(), values[i],
                                   [&](std::size_t pos, std::size_t v) { return values[pos] < v; });
        if (it != tails.begin()) previous[i] = *(it - 1);
        if (it == tails.end()) {
            tails.push_back(i);
        } else {
            *it = i;
        }
    }

    auto in_sequence = std::vector<bool>(n, false);
    if (tails.empty()) return in_sequence;
    for (auto i = tails.back(); i != n; i = previous[i]) in_sequence[i] = true;
    return in_sequence;
}

}  // namespace canvas_merge::detail
