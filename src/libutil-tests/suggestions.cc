#include "ocs/util/suggestions.hh"
#include "ocs/util/terminal.hh"
#include <gtest/gtest.h>

namespace ocs {

struct LevenshteinDistanceParam
{
    std::string s1, s2;
    int distance;
};

class LevenshteinDistanceTest : public ::testing::TestWithParam<LevenshteinDistanceParam>
{};

TEST_P(LevenshteinDistanceTest, CorrectlyComputed)
{
    auto params = GetParam();

    ASSERT_EQ(levenshteinDistance(params.s1, params.s2), params.distance);
    ASSERT_EQ(levenshteinDistance(params.s2, params.s1), params.distance);
}

INSTANTIATE_TEST_SUITE_P(
    LevenshteinDistance,
    LevenshteinDistanceTest,
    ::testing::Values(
        LevenshteinDistanceParam{"foo", "foo", 0},
        LevenshteinDistanceParam{"foo", "", 3},
        LevenshteinDistanceParam{"", "", 0},
        LevenshteinDistanceParam{"foo", "fo", 1},
        LevenshteinDistanceParam{"foo", "oo", 1},
        LevenshteinDistanceParam{"foo", "fao", 1},
        LevenshteinDistanceParam{"foo", "abc", 3},
        LevenshteinDistanceParam{"musik", "music", 1}));

TEST(Suggestions, Trim)
{
    auto suggestions = Suggestions::bestMatches({"foooo", "bar", "fo", "gao"}, "foo");
    auto onlyOne = suggestions.trim(1);
    ASSERT_EQ(onlyOne.suggestions.size(), 1);
    ASSERT_TRUE(onlyOne.suggestions.begin()->suggestion == "fo");

    auto closest = suggestions.trim(999, 3);
    ASSERT_EQ(closest.suggestions.size(), 3);
}

TEST(Suggestions, ToStringOneOf)
{
    auto suggestions = Suggestions::bestMatches({"icons", "fonts", "books"}, "ions").trim();

    ASSERT_EQ(filterANSIEscapes(suggestions.to_string(), true), "icons");

    Suggestions several{{{1, "books"}, {1, "icons"}, {2, "fonts"}}};
    ASSERT_EQ(filterANSIEscapes(several.to_string(), true), "one of books, icons or fonts");
}

TEST(Suggestions, nothingClose)
{
    auto suggestions = Suggestions::bestMatches({"wallpapers", "documents"}, "xyz").trim();

    ASSERT_TRUE(suggestions.suggestions.empty());
    ASSERT_EQ(suggestions.to_string(), "");
}

TEST(Suggestions, tiesAreAlphabetical)
{
    auto suggestions = Suggestions::bestMatches({"foot", "fonts", "books"}, "font").trim();

    ASSERT_EQ(filterANSIEscapes(suggestions.to_string(), true), "one of fonts or foot");
}

} // namespace ocs
