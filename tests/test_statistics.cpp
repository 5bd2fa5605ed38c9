#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "metrics/statistics.h"

TEST(Statistics, DescribeUsesPopulationStd)
{
    auto s = Statistics::describe({1.0, 2.0, 3.0, 4.0});
    EXPECT_DOUBLE_EQ(*s.mean, 2.5);
    EXPECT_DOUBLE_EQ(*s.max, 4.0);
    EXPECT_DOUBLE_EQ(*s.min, 1.0);
    EXPECT_NEAR(*s.std, std::sqrt(1.25), 1e-12);
}

TEST(Statistics, EmptySamplesGiveNothing)
{
    auto s = Statistics::describe({});
    EXPECT_FALSE(s.mean.has_value());
    EXPECT_FALSE(s.max.has_value());
    EXPECT_FALSE(s.min.has_value());
    EXPECT_FALSE(s.std.has_value());
    EXPECT_FALSE(Statistics::rms({}).has_value());
    EXPECT_FALSE(Statistics::range({}).has_value());
}

TEST(Statistics, RmsAndRange)
{
    EXPECT_DOUBLE_EQ(*Statistics::rms({3.0, 4.0}), std::sqrt(12.5));
    EXPECT_DOUBLE_EQ(*Statistics::range({-2.0, 5.0, 1.0}), 7.0);
}

TEST(Statistics, MeanOfValidSkipsMissingAndInfinite)
{
    FieldValues values = {{"a", 1.0},
                          {"b", std::nullopt},
                          {"c", std::numeric_limits<double>::infinity()},
                          {"d", 3.0}};
    EXPECT_DOUBLE_EQ(*Statistics::meanOfValid(values), 2.0);

    FieldValues none = {{"a", std::nullopt}};
    EXPECT_FALSE(Statistics::meanOfValid(none).has_value());
}

TEST(Statistics, PearsonDegenerateInputs)
{
    EXPECT_NEAR(*Statistics::pearson({1, 2, 3}, {2, 4, 6}), 1.0, 1e-12);
    EXPECT_NEAR(*Statistics::pearson({1, 2, 3}, {3, 2, 1}), -1.0, 1e-12);
    EXPECT_FALSE(Statistics::pearson({1, 1, 1}, {1, 2, 3}).has_value());
    EXPECT_FALSE(Statistics::pearson({1, 2}, {1, 2, 3}).has_value());
}

TEST(Statistics, HistogramLastBinClosed)
{
    auto h = Statistics::histogram({0.0, 0.5, 1.0, 1.0, 2.0}, 2);
    ASSERT_EQ(h.counts.size(), 2u);
    ASSERT_EQ(h.edges.size(), 3u);
    EXPECT_DOUBLE_EQ(h.edges.front(), 0.0);
    EXPECT_DOUBLE_EQ(h.edges.back(), 2.0);
    // [0,1) 两个，[1,2] 三个
    EXPECT_DOUBLE_EQ(h.counts[0], 2.0);
    EXPECT_DOUBLE_EQ(h.counts[1], 3.0);
}

TEST(Statistics, HistogramConstantValuesWidenRange)
{
    auto h = Statistics::histogram({3.0, 3.0, 3.0}, 4);
    EXPECT_DOUBLE_EQ(h.edges.front(), 2.5);
    EXPECT_DOUBLE_EQ(h.edges.back(), 3.5);

    double total = 0.0;
    for (double c : h.counts) total += c;
    EXPECT_DOUBLE_EQ(total, 3.0);
}

TEST(Statistics, HistogramRangeBeyondDoubleMax)
{
    auto h = Statistics::histogram({-1e308, 1e308, -1e308, 0.0, 1e308}, 4);
    ASSERT_EQ(h.edges.size(), 5u);
    for (double e : h.edges) EXPECT_TRUE(std::isfinite(e));
    EXPECT_DOUBLE_EQ(h.edges[2], 0.0);

    ASSERT_EQ(h.counts.size(), 4u);
    EXPECT_DOUBLE_EQ(h.counts[0], 2.0);
    EXPECT_DOUBLE_EQ(h.counts[1], 0.0);
    EXPECT_DOUBLE_EQ(h.counts[2], 1.0);
    EXPECT_DOUBLE_EQ(h.counts[3], 2.0);
}

TEST(Statistics, BinIndex)
{
    const std::vector<double> edges = {0.0, 1.0, 2.0};
    EXPECT_EQ(Statistics::binIndex(edges, 0.0), 0);
    EXPECT_EQ(Statistics::binIndex(edges, 1.0), 1);
    EXPECT_EQ(Statistics::binIndex(edges, 2.0), 1);
    EXPECT_EQ(Statistics::binIndex(edges, -0.1), -1);
    EXPECT_EQ(Statistics::binIndex(edges, 2.1), -1);
}

TEST(Statistics, EntropyInNats)
{
    EXPECT_NEAR(Statistics::entropy({5, 5}), std::log(2.0), 1e-12);
    EXPECT_NEAR(Statistics::entropy({1, 1, 1, 1}), std::log(4.0), 1e-12);
    EXPECT_DOUBLE_EQ(Statistics::entropy({7, 0, 0}), 0.0);
    EXPECT_DOUBLE_EQ(Statistics::entropy({}), 0.0);
}
