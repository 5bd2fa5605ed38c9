#include <gtest/gtest.h>

#include "metrics/numerical_metrics.h"
#include "test_helpers.h"

using test_helpers::gnssRecord;
using test_helpers::makeDataset;

namespace {

const std::vector<std::string> kAltitude = {"position_lla.altitude_m"};

} // namespace

TEST(NumericalMetrics, ConstantOffset)
{
    auto gt = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10), gnssRecord(1, 22, 114, 12),
                                                 gnssRecord(2, 22, 114, 14)});
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10.5), gnssRecord(1, 22, 114, 12.5),
                                                   gnssRecord(2, 22, 114, 14.5)});

    auto result = NumericalMetrics::fieldErrors(gt, conv, kAltitude, 0.1).at(kAltitude[0]);

    EXPECT_DOUBLE_EQ(*result.mae, 0.5);
    EXPECT_DOUBLE_EQ(*result.rmse, 0.5);
    EXPECT_DOUBLE_EQ(*result.maxError, 0.5);
    EXPECT_DOUBLE_EQ(*result.minError, 0.5);
    EXPECT_NEAR(*result.stdError, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(*result.nrmse, 0.5 / 4.0);
    EXPECT_EQ(result.numMatchedPoints, 3u);
    EXPECT_DOUBLE_EQ(result.matchedPercentage, 100.0);
}

TEST(NumericalMetrics, ConstantGroundTruthHasNoNrmse)
{
    auto gt = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10), gnssRecord(1, 22, 114, 10)});
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 11), gnssRecord(1, 22, 114, 9)});

    auto result = NumericalMetrics::fieldErrors(gt, conv, kAltitude, 0.1).at(kAltitude[0]);

    EXPECT_DOUBLE_EQ(*result.mae, 1.0);
    EXPECT_FALSE(result.nrmse.has_value());
}

TEST(NumericalMetrics, EmptyConvertedMatchesNothing)
{
    auto gt = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10), gnssRecord(1, 22, 114, 12)});
    Dataset conv;

    auto result = NumericalMetrics::fieldErrors(gt, conv, kAltitude, 0.1).at(kAltitude[0]);

    EXPECT_EQ(result.numMatchedPoints, 0u);
    EXPECT_DOUBLE_EQ(result.matchedPercentage, 0.0);
    EXPECT_FALSE(result.mae.has_value());
    EXPECT_FALSE(result.rmse.has_value());
    EXPECT_FALSE(result.nrmse.has_value());
}

TEST(NumericalMetrics, PartialMatchPercentageAgainstGroundTruthCount)
{
    auto gt = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10), gnssRecord(1, 22, 114, 11),
                                                 gnssRecord(2, 22, 114, 12), gnssRecord(3, 22, 114, 13)});
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(0.02, 22, 114, 10), gnssRecord(5, 22, 114, 99)});

    auto result = NumericalMetrics::fieldErrors(gt, conv, kAltitude, 0.1).at(kAltitude[0]);

    EXPECT_EQ(result.numMatchedPoints, 1u);
    EXPECT_DOUBLE_EQ(result.matchedPercentage, 25.0);
    EXPECT_DOUBLE_EQ(*result.mae, 0.0);
}

TEST(NumericalMetrics, FieldMissingOnOneSideIsSkipped)
{
    nlohmann::json noAlt = {{"time_unix", 1.0}, {"position_lla", {{"latitude_deg", 22.0}}}};
    auto gt = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10), gnssRecord(1, 22, 114, 20)});
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 12), noAlt});

    auto result = NumericalMetrics::fieldErrors(gt, conv, kAltitude, 0.1).at(kAltitude[0]);

    EXPECT_EQ(result.numMatchedPoints, 1u);
    EXPECT_DOUBLE_EQ(result.matchedPercentage, 50.0);
    EXPECT_DOUBLE_EQ(*result.mae, 2.0);
    // 极差取真值全部取值
    EXPECT_DOUBLE_EQ(*result.nrmse, 0.2);
}

TEST(NumericalMetrics, MatchedPercentageOfEmptyTotal)
{
    EXPECT_DOUBLE_EQ(NumericalMetrics::matchedPercentage(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(NumericalMetrics::matchedPercentage(3, 4), 75.0);
}

TEST(NumericalMetrics, RecordOrderDoesNotMatter)
{
    auto gt = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10), gnssRecord(1, 22, 114, 12),
                                                 gnssRecord(2, 22, 114, 15)});
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(0.01, 22, 114, 11), gnssRecord(1, 22, 114, 12.5),
                                                   gnssRecord(2.02, 22, 114, 13)});
    auto gtShuffled = makeDataset(SensorCategory::Gnss, {gnssRecord(2, 22, 114, 15), gnssRecord(0, 22, 114, 10),
                                                         gnssRecord(1, 22, 114, 12)});
    auto convShuffled = makeDataset(SensorCategory::Gnss, {gnssRecord(1, 22, 114, 12.5),
                                                           gnssRecord(2.02, 22, 114, 13),
                                                           gnssRecord(0.01, 22, 114, 11)});

    auto a = NumericalMetrics::fieldErrors(gt, conv, kAltitude, 0.1).at(kAltitude[0]);
    auto b = NumericalMetrics::fieldErrors(gtShuffled, convShuffled, kAltitude, 0.1).at(kAltitude[0]);

    EXPECT_EQ(a.numMatchedPoints, b.numMatchedPoints);
    EXPECT_NEAR(*a.mae, *b.mae, 1e-12);
    EXPECT_NEAR(*a.rmse, *b.rmse, 1e-12);
    EXPECT_NEAR(*a.nrmse, *b.nrmse, 1e-12);
    EXPECT_NEAR(*a.stdError, *b.stdError, 1e-12);
}
