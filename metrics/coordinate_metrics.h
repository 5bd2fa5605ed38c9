#ifndef NAV_EVAL_COORDINATE_METRICS_H
#define NAV_EVAL_COORDINATE_METRICS_H

#include <optional>
#include <Eigen/Core>

#include "measurement/nav_record.h"
#include "metrics/metric_types.h"

class CoordinateMetrics
{
public:
    /**
     * @brief WGS-84 大地坐标 (deg, deg, m) 转 ECEF (m)，任一输入缺失或非有限时返回空
     */
    static std::optional<Eigen::Vector3d> geodeticToEcef(const std::optional<double> &latDeg,
                                                         const std::optional<double> &lonDeg,
                                                         const std::optional<double> &altM);

    /**
     * @brief 转换后数据自身 LLA 与 ECEF 的一致性
     *
     * 对容差内配对的每条转换后记录，将其 LLA 转为 ECEF 后与记录中的 ECEF 比较欧氏距离。
     * 只检查转换后数据的内部一致性，真值只提供时间配对。
     */
    static CoordinateConsistency consistency(const Dataset &groundTruth, const Dataset &converted,
                                             double tolerance);

    /**
     * @brief 单条记录的 LLA→ECEF 残差 (m)，坐标不完整时返回空
     */
    static std::optional<double> recordResidual(const NavRecord &record);
};

#endif //NAV_EVAL_COORDINATE_METRICS_H
