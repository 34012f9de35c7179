// test_lcs.cpp - Tests for the dynamic programming longest common subsequence

#include <catch2/catch_all.hpp>
#include <draftcow/lcs.h>

#include <vector>

using namespace draftcow;

// ============================================================
// Helper Functions
// ============================================================

namespace {

ValueList letters(const std::string& text)
{
    ValueList result;
    for (char c : text) {
        result = result.push_back(Value{std::string(1, c)});
    }
    return result;
}

std::string matched_letters(const ValueList& left, const std::vector<LcsMatch>& matches)
{
    std::string result;
    for (const auto& match : matches) {
        result += left[match.left].as_string();
    }
    return result;
}

} // namespace

// ============================================================
// DynamicLongestCommonSubsequence
// ============================================================

TEST_CASE("LCS of full sequences", "[lcs]") {
    DynamicLongestCommonSubsequence lcs;

    SECTION("classic example") {
        auto left = letters("ABCBDAB");
        auto right = letters("BDCABA");
        auto matches = lcs.get(left, right, 0, left.size(), 0, right.size(), {});
        REQUIRE(matches.size() == 4);
        for (const auto& match : matches) {
            REQUIRE(left[match.left] == right[match.right]);
        }
    }

    SECTION("matches are strictly increasing on both sides") {
        auto left = letters("XMJYAUZ");
        auto right = letters("MZJAWXU");
        auto matches = lcs.get(left, right, 0, left.size(), 0, right.size(), {});
        REQUIRE(matched_letters(left, matches).size() == 4);
        for (std::size_t i = 1; i < matches.size(); ++i) {
            REQUIRE(matches[i - 1].left < matches[i].left);
            REQUIRE(matches[i - 1].right < matches[i].right);
        }
    }

    SECTION("identical sequences match entirely") {
        auto left = letters("ABC");
        auto matches = lcs.get(left, left, 0, 3, 0, 3, {});
        REQUIRE(matches == std::vector<LcsMatch>{{0, 0}, {1, 1}, {2, 2}});
    }

    SECTION("disjoint sequences have no match") {
        auto matches = lcs.get(letters("ABC"), letters("XYZ"), 0, 3, 0, 3, {});
        REQUIRE(matches.empty());
    }

    SECTION("empty slices") {
        auto left = letters("ABC");
        REQUIRE(lcs.get(left, left, 0, 0, 0, 3, {}).empty());
        REQUIRE(lcs.get(left, left, 3, 0, 3, 0, {}).empty());
    }
}

TEST_CASE("LCS backtrack is deterministic", "[lcs]") {
    DynamicLongestCommonSubsequence lcs;

    // F S R M -> S R B keeps S and R
    auto left = letters("FSRM");
    auto right = letters("SRB");
    auto matches = lcs.get(left, right, 0, 4, 0, 3, {});
    REQUIRE(matches == std::vector<LcsMatch>{{1, 0}, {2, 1}});

    // On a tie the left index moves first
    auto tie = lcs.get(letters("AB"), letters("BA"), 0, 2, 0, 2, {});
    REQUIRE(tie == std::vector<LcsMatch>{{0, 1}});
}

TEST_CASE("LCS on slices uses absolute indices", "[lcs]") {
    DynamicLongestCommonSubsequence lcs;
    auto left = letters("xxABCyy");
    auto right = letters("zACz");

    auto matches = lcs.get(left, right, 2, 3, 1, 2, {});
    REQUIRE(matches == std::vector<LcsMatch>{{2, 1}, {4, 2}});

    REQUIRE_THROWS_AS(lcs.get(left, right, 5, 3, 0, 1, {}), std::out_of_range);
}

TEST_CASE("LCS with a custom comparer", "[lcs]") {
    DynamicLongestCommonSubsequence lcs;
    ValueList left{Value{1}, Value{2}, Value{3}};
    ValueList right{Value{10}, Value{30}};

    auto same_decade = [](const Value& l, const Value& r) { return l.as_int() * 10 == r.as_int(); };
    auto matches = lcs.get(left, right, 0, 3, 0, 2, same_decade);
    REQUIRE(matches == std::vector<LcsMatch>{{0, 0}, {2, 1}});
}
