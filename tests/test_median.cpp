#include <levtools/distance.hpp>
#include <levtools/median.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

const std::vector<std::string> fixme = {"Levnhtein", "Leveshein", "Leenshten", "Leveshtei",
                                        "Lenshtein", "Lvenstein", "Levenhtin", "evenshtei"};

double total_distance(const std::string& median, const std::vector<std::string>& strings)
{
    double sum = 0.0;
    for (const auto& s : strings)
        sum += (double)levtools::distance(median, s);
    return sum;
}

} // namespace

TEST(GreedyMedian, Literals)
{
    std::vector<std::string> spam = {"SpSm", "mpamm", "Spam", "Spa", "Sua", "hSam"};
    EXPECT_EQ(levtools::median(spam), "Spam");
    EXPECT_EQ(levtools::greedy_median(fixme), "Levenshtein");
}

TEST(GreedyMedian, Degenerate)
{
    EXPECT_EQ(levtools::median(std::vector<std::string>()), "");
    EXPECT_EQ(levtools::median(std::vector<std::string>{"", ""}), "");
    EXPECT_EQ(levtools::median(std::vector<std::string>{"spam"}), "spam");
}

TEST(GreedyMedian, Weights)
{
    std::vector<std::string> strings = {"spam", "eggs"};
    EXPECT_EQ(levtools::median(strings, {1.0, 5.0}), "eggs");
    EXPECT_EQ(levtools::median(strings, {5.0, 1.0}), "spam");

    EXPECT_THROW(levtools::median(strings, {1.0}), levtools::invalid_argument);
    EXPECT_THROW(levtools::median(strings, {1.0, -1.0}), levtools::invalid_argument);
}

TEST(GreedyMedian, ZeroWeightIgnored)
{
    std::vector<std::string> strings = {"spam", "eggs", "eggs"};
    EXPECT_EQ(levtools::greedy_median(strings, {1.0, 0.0, 0.0}), "spam");
}

TEST(GreedyMedian, CodePoints)
{
    std::vector<std::u32string> strings = {U"ŠpŠm", U"Špam", U"Špa", U"Šam"};
    EXPECT_EQ(levtools::median(strings), U"Špam");
}

TEST(QuickMedian, Literals)
{
    EXPECT_EQ(levtools::quick_median(fixme), "Levnshein");
    EXPECT_EQ(levtools::quick_median(std::vector<std::string>()), "");
    EXPECT_EQ(levtools::quick_median(std::vector<std::string>{"", "", "a"}), "");
    EXPECT_EQ(levtools::quick_median(fixme, std::vector<double>(fixme.size(), 0.0)), "");
}

TEST(SetMedian, Literals)
{
    std::vector<std::string> strings = {"ehee", "cceaes", "chees", "chreesc", "chees", "cheesee", "cseese", "chetese"};
    EXPECT_EQ(levtools::set_median(strings), "chees");
    EXPECT_EQ(levtools::detail::set_median_index(strings, std::vector<double>(strings.size(), 1.0)), 2u);
}

TEST(SetMedian, ZeroWeightIgnored)
{
    std::vector<std::string> strings = {"spam", "spam", "eggs"};
    EXPECT_EQ(levtools::set_median(strings), "spam");
    EXPECT_EQ(levtools::set_median(strings, {0.0, 0.0, 1.0}), "eggs");
}

TEST(SetMedian, Member)
{
    std::string median = levtools::set_median(fixme);
    EXPECT_NE(std::find(fixme.begin(), fixme.end(), median), fixme.end());
    EXPECT_EQ(levtools::set_median(std::vector<std::string>{"spam"}), "spam");
    EXPECT_EQ(levtools::set_median(std::vector<std::string>()), "");
}

TEST(MedianImprove, Literals)
{
    std::string improved = levtools::median_improve(std::string("spam"), fixme);
    EXPECT_EQ(improved, "enhtein");
    EXPECT_EQ(levtools::median_improve(improved, fixme), "Levenshtein");
}

TEST(MedianImprove, ShortCandidates)
{
    std::vector<std::string> single = {"b"};
    EXPECT_EQ(levtools::median_improve(std::string("a"), single), "b");
    EXPECT_EQ(levtools::median_improve(std::string(""), single), "b");
    EXPECT_EQ(levtools::median_improve(std::string("ab"), std::vector<std::string>{"ab"}), "ab");
    EXPECT_EQ(levtools::median_improve(std::string("spamx"), std::vector<std::string>{"spam"}), "spam");

    /* nothing can improve a zero total distance */
    std::vector<std::string> strings = {"ab", "cd"};
    EXPECT_EQ(levtools::median_improve(std::string(""), strings, {0.0, 0.0}), "");
    EXPECT_EQ(levtools::median_improve(std::string("x"), strings, {0.0, 0.0}), "x");
}

TEST(MedianImprove, NeverWorse)
{
    std::vector<std::string> candidates = {"", "spam", "Levenshtein", levtools::quick_median(fixme),
                                           levtools::set_median(fixme)};
    for (const auto& candidate : candidates) {
        std::string improved = levtools::median_improve(candidate, fixme);
        EXPECT_LE(total_distance(improved, fixme), total_distance(candidate, fixme));
    }
}

TEST(Weights, Rejected)
{
    std::vector<std::string> strings = {"spam", "eggs"};
    std::vector<double> too_few = {1.0};
    std::vector<double> negative = {1.0, -0.5};

    EXPECT_THROW(levtools::greedy_median(strings, too_few), levtools::invalid_argument);
    EXPECT_THROW(levtools::greedy_median(strings, negative), levtools::invalid_argument);
    EXPECT_THROW(levtools::median_improve(std::string("spam"), strings, too_few), levtools::invalid_argument);
    EXPECT_THROW(levtools::median_improve(std::string("spam"), strings, negative), levtools::invalid_argument);
    EXPECT_THROW(levtools::quick_median(strings, too_few), levtools::invalid_argument);
    EXPECT_THROW(levtools::quick_median(strings, negative), levtools::invalid_argument);
    EXPECT_THROW(levtools::set_median(strings, too_few), levtools::invalid_argument);
    EXPECT_THROW(levtools::set_median(strings, negative), levtools::invalid_argument);
    EXPECT_THROW(levtools::set_median(strings, {1.0, 1.0, 1.0}), levtools::invalid_argument);
}
