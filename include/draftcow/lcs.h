// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lcs.h
/// @brief Longest common subsequence over two slices of Value lists.
///
/// Used by the list patch generator to find the elements that survive an
/// edit. Equality is pluggable because an original element must compare
/// equal to a draft of that same element.

#pragma once

#include <draftcow/value.h>

#include <cstddef>
#include <functional>
#include <vector>

namespace draftcow {

/// One matched pair: left[left] corresponds to right[right] (absolute indices)
struct LcsMatch {
    std::size_t left = 0;
    std::size_t right = 0;

    bool operator==(const LcsMatch&) const = default;
};

class DRAFTCOW_API LongestCommonSubsequence {
public:
    using EqualityComparer = std::function<bool(const Value& left, const Value& right)>;

    virtual ~LongestCommonSubsequence() = default;

    /// Matches of a longest common subsequence of
    /// left[left_start, left_start + left_length) and
    /// right[right_start, right_start + right_length), in ascending order.
    [[nodiscard]] virtual std::vector<LcsMatch> get(const ValueList& left,
                                                    const ValueList& right,
                                                    std::size_t left_start,
                                                    std::size_t left_length,
                                                    std::size_t right_start,
                                                    std::size_t right_length,
                                                    const EqualityComparer& equals) const = 0;
};

/// O(n*m) dynamic programming table with a deterministic backtrack: a
/// diagonal step on every match, otherwise the right index moves only when
/// the cell to the left is strictly larger than the cell above.
class DRAFTCOW_API DynamicLongestCommonSubsequence final : public LongestCommonSubsequence {
public:
    [[nodiscard]] std::vector<LcsMatch> get(const ValueList& left,
                                            const ValueList& right,
                                            std::size_t left_start,
                                            std::size_t left_length,
                                            std::size_t right_start,
                                            std::size_t right_length,
                                            const EqualityComparer& equals) const override;
};

} // namespace draftcow
