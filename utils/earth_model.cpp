#include "earth_model.h"

#include <cmath>

#include "utils/constants.h"
#include "utils/exceptions.h"

EarthModel::Ellipsoid const EarthModel::wgs84;

Eigen::Vector2d EarthModel::computeNavRmRn(double latRad)
{
    if (!std::isfinite(latRad) || latRad < -M_PI/2 || latRad > M_PI/2) {
        throw nav_eval::ValidationException("latRad",
            "Latitude must be in [-90°, 90°]");
    }

    Eigen::Vector2d res;
    const double sin_phi = std::sin(latRad);

    // Rn = a / sqrt(1 - e²sin²φ), Rm = Rn (1 - e²) / (1 - e²sin²φ)
    double den = 1.0 - wgs84.e2 * sin_phi * sin_phi;
    res[1] = wgs84.a / std::sqrt(den);
    res[0] = res[1] * (1.0 - wgs84.e2) / den;

    return res;
}

/**
 * @brief 计算LLH到NED的转换矩阵
 *
 * 转换关系：
 *   dNED = T * dLLH
 *
 * 矩阵形式（对角矩阵）：
 *   T = [Rm+h           0              0  ]
 *       [0              (Rn+h)*cos(φ)  0  ]
 *       [0              0             -1  ]
 *
 * @param latRad 纬度（弧度）
 * @param h 高度（米）
 * @return 3x3转换矩阵
 */
Eigen::Matrix3d EarthModel::LLh2NEDMatrix(const double latRad, const double h)
{
    if (!std::isfinite(h)) {
        throw nav_eval::ValidationException("h",
            "Height must be finite");
    }

    Eigen::Matrix3d dr = Eigen::Matrix3d::Zero();

    Eigen::Vector2d rmn = computeNavRmRn(latRad);

    dr(0, 0) = rmn[0] + h;  // 北向：子午圈曲率半径
    dr(1, 1) = (rmn[1] + h) * cos(latRad);  // 东向：卯酉圈曲率半径和纬度
    dr(2, 2) = -1;  // 地向：方向相反
    return dr;
}

/**
 * @brief 大地坐标转 ECEF
 *
 *   N = a / sqrt(1 - e²sin²φ)
 *   x = (N + h) cosφ cosλ
 *   y = (N + h) cosφ sinλ
 *   z = (N(1 - e²) + h) sinφ
 *
 * 不做范围检查，调用方负责过滤非有限值。
 */
Eigen::Vector3d EarthModel::geodetic2Ecef(double latDeg, double lonDeg, double h)
{
    const double lat = latDeg * Deg2Rad;
    const double lon = lonDeg * Deg2Rad;

    const double sinLat = std::sin(lat);
    const double cosLat = std::cos(lat);
    const double N = wgs84.a / std::sqrt(1.0 - wgs84.e2 * sinLat * sinLat);

    return {(N + h) * cosLat * std::cos(lon),
            (N + h) * cosLat * std::sin(lon),
            (N * (1.0 - wgs84.e2) + h) * sinLat};
}
