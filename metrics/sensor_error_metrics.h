#ifndef NAV_EVAL_SENSOR_ERROR_METRICS_H
#define NAV_EVAL_SENSOR_ERROR_METRICS_H

#include <optional>
#include <vector>
#include <Eigen/Core>

#include "measurement/nav_record.h"
#include "metrics/metric_types.h"

class SensorErrorMetrics
{
public:
    /**
     * @brief GNSS 三维位置误差 (m)
     *
     * 经纬高差在真值纬度处经 Rm/Rn 投影到当地 NED，取模长。
     * 两侧 position_lla 不完整或真值纬度越界的配对不计入。
     */
    static SensorErrorStats positionError(const Dataset &groundTruth, const Dataset &converted,
                                          double tolerance);

    /**
     * @brief IMU 姿态误差 (deg)，相对旋转的旋转角
     */
    static SensorErrorStats orientationError(const Dataset &groundTruth, const Dataset &converted,
                                             double tolerance);

    /**
     * @brief IMU 线加速度误差 (m/s²)，三维差值模长
     */
    static SensorErrorStats accelerationError(const Dataset &groundTruth, const Dataset &converted,
                                              double tolerance);

    /**
     * @brief 两组 LLH (deg, deg, m) 的 NED 位置差，参考纬度非法时返回空
     */
    static std::optional<Eigen::Vector3d> nedDifference(const Eigen::Vector3d &refLla,
                                                        const Eigen::Vector3d &estLla);

private:
    static SensorErrorStats summarize(const std::vector<double> &errors, std::size_t total);
};

#endif //NAV_EVAL_SENSOR_ERROR_METRICS_H
