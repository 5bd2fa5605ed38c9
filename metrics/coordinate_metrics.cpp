#include "coordinate_metrics.h"

#include <cmath>
#include <vector>

#include "measurement/field_extractor.h"
#include "measurement/time_aligner.h"
#include "metrics/statistics.h"
#include "utils/earth_model.h"

std::optional<Eigen::Vector3d> CoordinateMetrics::geodeticToEcef(const std::optional<double> &latDeg,
                                                                 const std::optional<double> &lonDeg,
                                                                 const std::optional<double> &altM)
{
    if (!latDeg || !lonDeg || !altM) return std::nullopt;
    if (!std::isfinite(*latDeg) || !std::isfinite(*lonDeg) || !std::isfinite(*altM)) return std::nullopt;

    return EarthModel::geodetic2Ecef(*latDeg, *lonDeg, *altM);
}

std::optional<double> CoordinateMetrics::recordResidual(const NavRecord &record)
{
    auto expected = geodeticToEcef(record.get(FieldId::LlaLatitude),
                                   record.get(FieldId::LlaLongitude),
                                   record.get(FieldId::LlaAltitude));
    auto stored = FieldExtractor::vector3(record, FieldId::EcefX, FieldId::EcefY, FieldId::EcefZ);
    if (!expected || !stored) return std::nullopt;

    return (*expected - *stored).norm();
}

CoordinateConsistency CoordinateMetrics::consistency(const Dataset &groundTruth, const Dataset &converted,
                                                     double tolerance)
{
    TimeAligner aligner(converted);
    std::vector<double> residuals;

    for (const auto &p : aligner.align(groundTruth, tolerance))
    {
        if (auto r = recordResidual(converted.records[p.convIndex])) residuals.push_back(*r);
    }

    CoordinateConsistency result;
    result.error = Statistics::describe(residuals);
    result.numSamples = residuals.size();
    return result;
}
