#include "temporal_metrics.h"

#include <cmath>

#include "measurement/time_aligner.h"
#include "metrics/statistics.h"
#include "utils/constants.h"

namespace
{
std::vector<double> nearestGapsUs(const std::vector<double> &from, const std::vector<double> &to)
{
    std::vector<double> gaps;
    TimeAligner aligner(to);
    if (aligner.empty()) return gaps;

    gaps.reserve(from.size());
    for (double t : from)
    {
        if (auto m = aligner.nearest(t)) gaps.push_back(m->timeDiff * Sec2Us);
    }
    return gaps;
}
} // namespace

TimestampError TemporalMetrics::timestampError(const Dataset &groundTruth, const Dataset &converted)
{
    auto gaps = nearestGapsUs(TimeAligner::timestamps(groundTruth), TimeAligner::timestamps(converted));

    TimestampError result;
    result.error = Statistics::describe(gaps);
    result.numSamples = gaps.size();
    return result;
}

std::optional<double> TemporalMetrics::rateHz(const std::vector<double> &timestamps)
{
    if (timestamps.size() < 2) return std::nullopt;

    // 相邻差值之和可以直接由首尾求得
    const double meanInterval = (timestamps.back() - timestamps.front()) /
                                static_cast<double>(timestamps.size() - 1);
    if (!(meanInterval > 0.0) || !std::isfinite(meanInterval)) return std::nullopt;

    return 1.0 / meanInterval;
}

SamplingRate TemporalMetrics::samplingRate(const Dataset &groundTruth, const Dataset &converted)
{
    SamplingRate result;
    result.groundTruthRateHz = rateHz(TimeAligner::timestamps(groundTruth));
    result.convertedRateHz = rateHz(TimeAligner::timestamps(converted));

    if (result.groundTruthRateHz && result.convertedRateHz)
    {
        result.relativeError = std::abs(*result.groundTruthRateHz - *result.convertedRateHz) /
                               *result.groundTruthRateHz;
    }
    return result;
}

std::optional<double> TemporalMetrics::meanNearestGapUs(const std::vector<double> &from,
                                                        const std::vector<double> &to)
{
    return Statistics::mean(nearestGapsUs(from, to));
}

CrossSensorAlignment TemporalMetrics::crossSensorAlignment(const Dataset &groundTruthGnss,
                                                           const Dataset &groundTruthImu,
                                                           const Dataset &convertedGnss,
                                                           const Dataset &convertedImu)
{
    CrossSensorAlignment result;
    result.groundTruthMeanErrorUs = meanNearestGapUs(TimeAligner::timestamps(groundTruthGnss),
                                                     TimeAligner::timestamps(groundTruthImu));
    result.convertedMeanErrorUs = meanNearestGapUs(TimeAligner::timestamps(convertedGnss),
                                                   TimeAligner::timestamps(convertedImu));

    if (result.groundTruthMeanErrorUs && result.convertedMeanErrorUs)
    {
        result.alignmentErrorDifferenceUs = std::abs(*result.groundTruthMeanErrorUs -
                                                     *result.convertedMeanErrorUs);
    }
    return result;
}
