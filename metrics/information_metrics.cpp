#include "information_metrics.h"

#include <algorithm>
#include <cmath>

#include <Eigen/Core>

#include "measurement/time_aligner.h"
#include "metrics/statistics.h"
#include "utils/logger.h"

int InformationMetrics::binCount(std::size_t samples, const HistogramOptions &options)
{
    if (options.samplesPerBin <= 0) return 0;
    const auto bySamples = samples / static_cast<std::size_t>(options.samplesPerBin);
    return static_cast<int>(std::min<std::size_t>(static_cast<std::size_t>(options.maxBins), bySamples));
}

double InformationMetrics::entropyOf(const std::vector<double> &values, const HistogramOptions &options)
{
    const int bins = binCount(values.size(), options);
    if (bins < 2) return 0.0;

    return Statistics::entropy(Statistics::histogram(values, bins).counts);
}

std::optional<double> InformationMetrics::entropyRatio(const std::vector<double> &groundTruth,
                                                       const std::vector<double> &converted,
                                                       const HistogramOptions &options)
{
    if (groundTruth.empty() || converted.empty()) return std::nullopt;

    const double gtEntropy = entropyOf(groundTruth, options);
    if (!(gtEntropy > 0.0)) return std::nullopt;

    return entropyOf(converted, options) / gtEntropy;
}

std::optional<double> InformationMetrics::mutualInformation(const AlignedSeries &series,
                                                            const HistogramOptions &options)
{
    const int bins = binCount(series.size(), options);
    if (series.empty() || bins < 2) return std::nullopt;

    const auto gtHist = Statistics::histogram(series.groundTruth, bins);
    const auto convHist = Statistics::histogram(series.converted, bins);

    // 联合直方图
    Eigen::MatrixXd joint = Eigen::MatrixXd::Zero(bins, bins);
    for (std::size_t k = 0; k < series.size(); ++k)
    {
        const int i = Statistics::binIndex(gtHist.edges, series.groundTruth[k]);
        const int j = Statistics::binIndex(convHist.edges, series.converted[k]);
        if (i < 0 || j < 0) continue;
        joint(i, j) += 1.0;
    }

    const double total = joint.sum();
    if (!(total > 0.0)) return std::nullopt;

    const Eigen::VectorXd pi = joint.rowwise().sum() / total;
    const Eigen::RowVectorXd pj = joint.colwise().sum() / total;

    double mi = 0.0;
    for (int i = 0; i < bins; ++i)
    {
        for (int j = 0; j < bins; ++j)
        {
            if (joint(i, j) <= 0.0) continue;
            const double pij = joint(i, j) / total;
            mi += pij * std::log(pij / (pi[i] * pj[j]));
        }
    }
    return std::max(mi, 0.0);
}

EntropyResult InformationMetrics::entropyRatios(const Dataset &groundTruth, const Dataset &converted,
                                                const std::set<std::string> &fields,
                                                const HistogramOptions &options)
{
    EntropyResult result;
    for (const auto &field : fields)
    {
        result.fieldEntropyRatios[field] = entropyRatio(AlignedSeries::values(groundTruth, field),
                                                        AlignedSeries::values(converted, field),
                                                        options);
    }
    result.averageEntropyRatio = Statistics::meanOfValid(result.fieldEntropyRatios);
    return result;
}

MutualInformationResult InformationMetrics::mutualInformation(const Dataset &groundTruth,
                                                              const Dataset &converted,
                                                              const std::set<std::string> &fields,
                                                              double tolerance,
                                                              const HistogramOptions &options)
{
    TimeAligner aligner(converted);
    const auto pairs = aligner.align(groundTruth, tolerance);

    MutualInformationResult result;
    for (const auto &field : fields)
    {
        auto series = AlignedSeries::collect(groundTruth, converted, pairs, field);
        result.fieldMutualInformation[field] = mutualInformation(series, options);
        if (!result.fieldMutualInformation[field])
        {
            LOG_DEBUG_STREAM() << groundTruth.name << ": " << field << " 配对样本不足，互信息为空";
        }
    }
    result.averageMutualInformation = Statistics::meanOfValid(result.fieldMutualInformation);
    return result;
}
