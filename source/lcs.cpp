// lcs.cpp
// Dynamic-programming longest common subsequence

#include <draftcow/lcs.h>

#include <algorithm>
#include <stdexcept>

namespace draftcow {

std::vector<LcsMatch> DynamicLongestCommonSubsequence::get(const ValueList& left,
                                                           const ValueList& right,
                                                           std::size_t left_start,
                                                           std::size_t left_length,
                                                           std::size_t right_start,
                                                           std::size_t right_length,
                                                           const EqualityComparer& equals) const
{
    if (left_start + left_length > left.size() || right_start + right_length > right.size()) {
        throw std::out_of_range("LCS slice exceeds the list bounds");
    }
    if (left_length == 0 || right_length == 0) {
        return {};
    }

    auto same = [&](std::size_t i, std::size_t j) {
        const Value& l = left[left_start + i - 1];
        const Value& r = right[right_start + j - 1];
        return equals ? equals(l, r) : l == r;
    };

    // table[i][j] = LCS length of the first i left and first j right elements
    const std::size_t width = right_length + 1;
    std::vector<std::size_t> table((left_length + 1) * width, 0);
    auto cell = [&](std::size_t i, std::size_t j) -> std::size_t& { return table[i * width + j]; };

    for (std::size_t i = 1; i <= left_length; ++i) {
        for (std::size_t j = 1; j <= right_length; ++j) {
            if (same(i, j)) {
                cell(i, j) = cell(i - 1, j - 1) + 1;
            } else {
                cell(i, j) = std::max(cell(i - 1, j), cell(i, j - 1));
            }
        }
    }

    std::vector<LcsMatch> matches;
    matches.reserve(cell(left_length, right_length));

    std::size_t i = left_length;
    std::size_t j = right_length;
    while (i > 0 && j > 0) {
        if (same(i, j)) {
            matches.push_back({left_start + i - 1, right_start + j - 1});
            --i;
            --j;
        } else if (cell(i, j - 1) > cell(i - 1, j)) {
            --j;
        } else {
            --i;
        }
    }

    std::reverse(matches.begin(), matches.end());
    return matches;
}

} // namespace draftcow
