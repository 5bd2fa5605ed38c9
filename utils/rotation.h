#ifndef NAV_EVAL_ROTATION_H
#define NAV_EVAL_ROTATION_H

#include <cmath>
#include <optional>
#include <Eigen/Core>
#include <Eigen/Geometry>
#include <sophus/so3.hpp>

#include "utils/constants.h"

/**
 * @brief 由 (w, x, y, z) 构造单位四元数，模长接近 0 或非有限时返回空
 */
inline std::optional<Eigen::Quaterniond> makeUnitQuaternion(const double w, const double x,
                                                            const double y, const double z)
{
    Eigen::Quaterniond q(w, x, y, z);
    const double norm = q.norm();
    if (!std::isfinite(norm) || norm < QUAT_NORM_EPS)
    {
        return std::nullopt;
    }
    q.normalize();
    return q;
}

/**
 * @brief 两个姿态之间的旋转角 (度)
 *
 * 相对旋转 R_ref^-1 * R_est 的旋转向量模长，q 与 -q 表示同一姿态。
 */
inline double quaternionAngleDeg(const Eigen::Quaterniond &ref, const Eigen::Quaterniond &est)
{
    Sophus::SO3d SO3Ref(ref);
    Sophus::SO3d SO3Est(est);
    Sophus::SO3d SO3Err = SO3Ref.inverse() * SO3Est;
    return SO3Err.log().norm() * Rad2Deg;
}

#endif //NAV_EVAL_ROTATION_H
