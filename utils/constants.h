#ifndef NAV_EVAL_CONSTANTS_H
#define NAV_EVAL_CONSTANTS_H
#include <math.h>

constexpr double Rad2Deg = 180.0 / M_PI;
constexpr double Deg2Rad = M_PI / 180.0;
constexpr double Sec2Us = 1e6;
constexpr double Byte2MB = 1.0 / (1024.0 * 1024.0);

// 默认时间对齐容差 (s)
constexpr double FIELD_ALIGN_TOL = 0.1;
constexpr double POSITION_ALIGN_TOL = 1.0;

constexpr double QUAT_NORM_EPS = 1e-9;

#endif //NAV_EVAL_CONSTANTS_H
