#ifndef NAV_EVAL_INFORMATION_METRICS_H
#define NAV_EVAL_INFORMATION_METRICS_H

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config/eval_config.h"
#include "measurement/nav_record.h"
#include "metrics/aligned_series.h"
#include "metrics/metric_types.h"

class InformationMetrics
{
public:
    /**
     * @brief 直方图区间数 min(maxBins, n / samplesPerBin)
     */
    static int binCount(std::size_t samples, const HistogramOptions &options);

    /**
     * @brief 取值分布的香农熵 (nat)，区间数少于 2 时为 0
     */
    static double entropyOf(const std::vector<double> &values, const HistogramOptions &options);

    /**
     * @brief 转换后熵 / 真值熵，任一侧没有取值或真值熵为 0 时返回空
     */
    static std::optional<double> entropyRatio(const std::vector<double> &groundTruth,
                                              const std::vector<double> &converted,
                                              const HistogramOptions &options);

    /**
     * @brief 配对样本的互信息 (nat)
     *
     * 两侧分别按自身范围等宽分箱，再在两组边界上统计联合直方图。
     * 没有配对样本或区间数少于 2 时返回空。
     */
    static std::optional<double> mutualInformation(const AlignedSeries &series,
                                                   const HistogramOptions &options);

    static EntropyResult entropyRatios(const Dataset &groundTruth, const Dataset &converted,
                                       const std::set<std::string> &fields,
                                       const HistogramOptions &options);

    static MutualInformationResult mutualInformation(const Dataset &groundTruth, const Dataset &converted,
                                                     const std::set<std::string> &fields,
                                                     double tolerance,
                                                     const HistogramOptions &options);
};

#endif //NAV_EVAL_INFORMATION_METRICS_H
