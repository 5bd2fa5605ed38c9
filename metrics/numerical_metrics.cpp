#include "numerical_metrics.h"

#include <cmath>

#include "metrics/aligned_series.h"
#include "metrics/statistics.h"

double NumericalMetrics::matchedPercentage(std::size_t matched, std::size_t total)
{
    if (total == 0) return 0.0;
    return static_cast<double>(matched) / static_cast<double>(total) * 100.0;
}

FieldErrorStats NumericalMetrics::fieldError(const Dataset &groundTruth, const Dataset &converted,
                                             const std::vector<TimeAligner::AlignedPair> &pairs,
                                             const std::string &field)
{
    FieldErrorStats result;

    auto series = AlignedSeries::collect(groundTruth, converted, pairs, field);
    if (series.empty()) return result;

    std::vector<double> errors(series.size());
    for (std::size_t i = 0; i < series.size(); ++i)
    {
        errors[i] = std::abs(series.groundTruth[i] - series.converted[i]);
    }

    const auto stats = Statistics::describe(errors);
    result.mae = stats.mean;
    result.rmse = Statistics::rms(errors);
    result.maxError = stats.max;
    result.minError = stats.min;
    result.stdError = stats.std;

    auto gtRange = Statistics::range(AlignedSeries::values(groundTruth, field));
    if (gtRange && *gtRange > 0.0)
    {
        result.nrmse = *result.rmse / *gtRange;
    }

    result.numMatchedPoints = errors.size();
    result.matchedPercentage = matchedPercentage(errors.size(), groundTruth.size());
    return result;
}

std::map<std::string, FieldErrorStats> NumericalMetrics::fieldErrors(const Dataset &groundTruth,
                                                                     const Dataset &converted,
                                                                     const std::vector<std::string> &fields,
                                                                     double tolerance)
{
    TimeAligner aligner(converted);
    const auto pairs = aligner.align(groundTruth, tolerance);

    std::map<std::string, FieldErrorStats> results;
    for (const auto &field : fields)
    {
        results[field] = fieldError(groundTruth, converted, pairs, field);
    }
    return results;
}
