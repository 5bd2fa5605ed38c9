#ifndef NAV_EVAL_TEMPORAL_METRICS_H
#define NAV_EVAL_TEMPORAL_METRICS_H

#include <optional>
#include <vector>

#include "measurement/nav_record.h"
#include "metrics/metric_types.h"

class TemporalMetrics
{
public:
    /**
     * @brief 每个真值时间戳到最近转换后时间戳的距离 (us)，不设容差
     */
    static TimestampError timestampError(const Dataset &groundTruth, const Dataset &converted);

    static SamplingRate samplingRate(const Dataset &groundTruth, const Dataset &converted);

    /**
     * @brief GNSS 与 IMU 之间平均最近时间间隔，真值与转换后各算一次再取差的绝对值
     */
    static CrossSensorAlignment crossSensorAlignment(const Dataset &groundTruthGnss,
                                                     const Dataset &groundTruthImu,
                                                     const Dataset &convertedGnss,
                                                     const Dataset &convertedImu);

    /**
     * @brief 采样率 = 1 / 相邻时间差均值（按记录顺序），少于两个时间戳或均值不为正时返回空
     */
    static std::optional<double> rateHz(const std::vector<double> &timestamps);

    static std::optional<double> meanNearestGapUs(const std::vector<double> &from,
                                                  const std::vector<double> &to);
};

#endif //NAV_EVAL_TEMPORAL_METRICS_H
