#include "sensor_error_metrics.h"

#include <cmath>

#include "measurement/field_extractor.h"
#include "measurement/time_aligner.h"
#include "metrics/numerical_metrics.h"
#include "metrics/statistics.h"
#include "utils/constants.h"
#include "utils/earth_model.h"
#include "utils/logger.h"
#include "utils/rotation.h"

namespace
{
std::optional<Eigen::Quaterniond> recordQuaternion(const NavRecord &record)
{
    auto w = record.get(FieldId::OrientW);
    auto x = record.get(FieldId::OrientX);
    auto y = record.get(FieldId::OrientY);
    auto z = record.get(FieldId::OrientZ);
    if (!w || !x || !y || !z) return std::nullopt;
    return makeUnitQuaternion(*w, *x, *y, *z);
}
} // namespace

SensorErrorStats SensorErrorMetrics::summarize(const std::vector<double> &errors, std::size_t total)
{
    SensorErrorStats result;
    result.error = Statistics::describe(errors);
    result.numMatchedPoints = errors.size();
    result.matchedPercentage = NumericalMetrics::matchedPercentage(errors.size(), total);
    return result;
}

std::optional<Eigen::Vector3d> SensorErrorMetrics::nedDifference(const Eigen::Vector3d &refLla,
                                                                 const Eigen::Vector3d &estLla)
{
    const double latRad = refLla[0] * Deg2Rad;
    if (!refLla.allFinite() || !estLla.allFinite() || std::abs(latRad) > M_PI / 2)
    {
        return std::nullopt;
    }

    Eigen::Vector3d dLLHRad;
    dLLHRad << (estLla[0] - refLla[0]) * Deg2Rad,
            (estLla[1] - refLla[1]) * Deg2Rad,
            (estLla[2] - refLla[2]);

    Eigen::Matrix3d dr = EarthModel::LLh2NEDMatrix(latRad, refLla[2]);
    return Eigen::Vector3d(dr * dLLHRad);
}

SensorErrorStats SensorErrorMetrics::positionError(const Dataset &groundTruth, const Dataset &converted,
                                                   double tolerance)
{
    TimeAligner aligner(converted);
    std::vector<double> errors;

    for (const auto &p : aligner.align(groundTruth, tolerance))
    {
        auto gtLla = FieldExtractor::vector3(groundTruth.records[p.gtIndex],
                                             FieldId::LlaLatitude, FieldId::LlaLongitude, FieldId::LlaAltitude);
        auto convLla = FieldExtractor::vector3(converted.records[p.convIndex],
                                               FieldId::LlaLatitude, FieldId::LlaLongitude, FieldId::LlaAltitude);
        if (!gtLla || !convLla) continue;

        auto dNed = nedDifference(*gtLla, *convLla);
        if (!dNed)
        {
            LOG_DEBUG_STREAM() << groundTruth.name << ": 真值纬度非法，跳过第 " << p.gtIndex << " 条";
            continue;
        }
        errors.push_back(dNed->norm());
    }

    return summarize(errors, groundTruth.size());
}

SensorErrorStats SensorErrorMetrics::orientationError(const Dataset &groundTruth, const Dataset &converted,
                                                      double tolerance)
{
    TimeAligner aligner(converted);
    std::vector<double> errors;

    for (const auto &p : aligner.align(groundTruth, tolerance))
    {
        auto qRef = recordQuaternion(groundTruth.records[p.gtIndex]);
        auto qEst = recordQuaternion(converted.records[p.convIndex]);
        if (!qRef || !qEst) continue;

        errors.push_back(quaternionAngleDeg(*qRef, *qEst));
    }

    return summarize(errors, groundTruth.size());
}

SensorErrorStats SensorErrorMetrics::accelerationError(const Dataset &groundTruth, const Dataset &converted,
                                                       double tolerance)
{
    TimeAligner aligner(converted);
    std::vector<double> errors;

    for (const auto &p : aligner.align(groundTruth, tolerance))
    {
        auto gtAcc = FieldExtractor::vector3(groundTruth.records[p.gtIndex],
                                             FieldId::AccelX, FieldId::AccelY, FieldId::AccelZ);
        auto convAcc = FieldExtractor::vector3(converted.records[p.convIndex],
                                               FieldId::AccelX, FieldId::AccelY, FieldId::AccelZ);
        if (!gtAcc || !convAcc) continue;

        errors.push_back((*gtAcc - *convAcc).norm());
    }

    return summarize(errors, groundTruth.size());
}
