#include <gtest/gtest.h>

#include <cmath>

#include "metrics/sensor_error_metrics.h"
#include "test_helpers.h"

using test_helpers::gnssRecord;
using test_helpers::imuRecord;
using test_helpers::makeDataset;

namespace {

nlohmann::json orientedRecord(double t, double w, double x, double y, double z)
{
    auto r = imuRecord(t, 0.0, 0.0, 9.8);
    r["orientation"] = {{"w", w}, {"x", x}, {"y", y}, {"z", z}};
    return r;
}

} // namespace

// ---------------------------------------------------------------------------
// 位置误差
// ---------------------------------------------------------------------------

TEST(SensorErrorMetrics, AltitudeOffsetIsPositionError)
{
    auto gt = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10), gnssRecord(1, 22, 114, 10)});
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 13), gnssRecord(1, 22, 114, 7)});

    auto r = SensorErrorMetrics::positionError(gt, conv, 1.0);

    EXPECT_EQ(r.numMatchedPoints, 2u);
    EXPECT_DOUBLE_EQ(r.matchedPercentage, 100.0);
    EXPECT_NEAR(*r.error.mean, 3.0, 1e-9);
    EXPECT_NEAR(*r.error.std, 0.0, 1e-9);
}

TEST(SensorErrorMetrics, LatitudeOffsetUsesMeridianRadius)
{
    auto ned = SensorErrorMetrics::nedDifference({0.0, 0.0, 0.0}, {1e-5, 0.0, 0.0});
    ASSERT_TRUE(ned.has_value());
    // 赤道处 Rm = a(1-e²)
    const double rm = 6378137.0 * (1.0 - 0.00669437999014);
    EXPECT_NEAR(ned->x(), rm * 1e-5 * M_PI / 180.0, 1e-6);
    EXPECT_NEAR(ned->y(), 0.0, 1e-12);
    EXPECT_NEAR(ned->z(), 0.0, 1e-12);
}

TEST(SensorErrorMetrics, InvalidLatitudeIsSkipped)
{
    EXPECT_FALSE(SensorErrorMetrics::nedDifference({95.0, 0.0, 0.0}, {90.0, 0.0, 0.0}).has_value());

    auto gt = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 95, 114, 10), gnssRecord(1, 22, 114, 10)});
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 95, 114, 10), gnssRecord(1, 22, 114, 10)});

    auto r = SensorErrorMetrics::positionError(gt, conv, 1.0);
    EXPECT_EQ(r.numMatchedPoints, 1u);
    EXPECT_DOUBLE_EQ(r.matchedPercentage, 50.0);
}

TEST(SensorErrorMetrics, NoMatchesGiveEmptyStats)
{
    auto gt = makeDataset(SensorCategory::Gnss, {gnssRecord(0, 22, 114, 10)});
    auto conv = makeDataset(SensorCategory::Gnss, {gnssRecord(10, 22, 114, 10)});

    auto r = SensorErrorMetrics::positionError(gt, conv, 1.0);
    EXPECT_EQ(r.numMatchedPoints, 0u);
    EXPECT_DOUBLE_EQ(r.matchedPercentage, 0.0);
    EXPECT_FALSE(r.error.mean.has_value());
}

// ---------------------------------------------------------------------------
// 姿态误差
// ---------------------------------------------------------------------------

TEST(SensorErrorMetrics, OrientationAngle)
{
    const double h = std::sqrt(0.5);
    auto gt = makeDataset(SensorCategory::Imu, {orientedRecord(0, 1, 0, 0, 0), orientedRecord(0.01, 1, 0, 0, 0)});
    auto conv = makeDataset(SensorCategory::Imu, {orientedRecord(0, h, 0, 0, h), orientedRecord(0.01, -1, 0, 0, 0)});

    auto r = SensorErrorMetrics::orientationError(gt, conv, 0.005);

    EXPECT_EQ(r.numMatchedPoints, 2u);
    EXPECT_NEAR(*r.error.max, 90.0, 1e-9);
    EXPECT_NEAR(*r.error.min, 0.0, 1e-9);
    EXPECT_NEAR(*r.error.mean, 45.0, 1e-9);
}

TEST(SensorErrorMetrics, DegenerateQuaternionIsSkipped)
{
    auto gt = makeDataset(SensorCategory::Imu, {orientedRecord(0, 1, 0, 0, 0)});
    auto conv = makeDataset(SensorCategory::Imu, {orientedRecord(0, 0, 0, 0, 0)});

    auto r = SensorErrorMetrics::orientationError(gt, conv, 0.1);
    EXPECT_EQ(r.numMatchedPoints, 0u);
    EXPECT_FALSE(r.error.mean.has_value());
}

// ---------------------------------------------------------------------------
// 加速度误差
// ---------------------------------------------------------------------------

TEST(SensorErrorMetrics, AccelerationNorm)
{
    auto gt = makeDataset(SensorCategory::Imu, {imuRecord(0, 0, 0, 9.8), imuRecord(0.01, 0, 0, 9.8)});
    auto conv = makeDataset(SensorCategory::Imu, {imuRecord(0, 3, 4, 9.8), imuRecord(0.01, 0, 0, 9.8)});

    auto r = SensorErrorMetrics::accelerationError(gt, conv, 0.005);

    EXPECT_EQ(r.numMatchedPoints, 2u);
    EXPECT_NEAR(*r.error.max, 5.0, 1e-12);
    EXPECT_NEAR(*r.error.min, 0.0, 1e-12);
    EXPECT_NEAR(*r.error.mean, 2.5, 1e-12);
    EXPECT_NEAR(*r.error.std, 2.5, 1e-12);
}
