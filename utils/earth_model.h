#ifndef NAV_EVAL_EARTH_MODEL_H
#define NAV_EVAL_EARTH_MODEL_H

#include <GeographicLib/Constants.hpp>
#include <Eigen/Dense>

class EarthModel {
public:

    struct Ellipsoid {
        const double a  = GeographicLib::Constants::WGS84_a();      // 赤道半径 6378137.0
        const double f  = GeographicLib::Constants::WGS84_f();      // 扁率 1/298.257223563
        const double e2 = f * (2.0 - f);                            // 第一偏心率平方
    };

    /**
     * @brief 子午圈半径 Rm 与卯酉圈半径 Rn
     * @param latRad 纬度 (弧度)
     * @return [Rm, Rn]
     */
    static Eigen::Vector2d computeNavRmRn(double latRad);

    /**
     * @brief LLH 增量 (rad, rad, m) 到 NED 增量 (m) 的转换矩阵
     */
    static Eigen::Matrix3d LLh2NEDMatrix(const double latRad, const double h);

    /**
     * @brief WGS-84 大地坐标转地心地固坐标
     * @param latDeg 纬度 (度)
     * @param lonDeg 经度 (度)
     * @param h      椭球高 (米)
     * @return ECEF [x, y, z] (米)
     */
    static Eigen::Vector3d geodetic2Ecef(double latDeg, double lonDeg, double h);

private:

    static const Ellipsoid wgs84;
};

#endif //NAV_EVAL_EARTH_MODEL_H
