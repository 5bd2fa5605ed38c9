#ifndef NAV_EVAL_SIGNAL_METRICS_H
#define NAV_EVAL_SIGNAL_METRICS_H

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config/eval_config.h"
#include "measurement/nav_record.h"
#include "metrics/aligned_series.h"
#include "metrics/metric_types.h"

struct SignalFidelity
{
    SnrResult snr;
    std::optional<FrequencyResponse> frequencyResponse;  // 仅 IMU 文件
    DynamicRange dynamicRange;
};

class SignalMetrics
{
public:
    /**
     * @brief 10·log10(mean(gt²) / mean((gt-conv)²))
     *
     * 无配对样本或信号功率为 0 时返回空；噪声功率为 0 时返回 +inf。
     */
    static std::optional<double> snrDb(const AlignedSeries &series);

    /**
     * @brief Welch 功率谱密度 (fs = 1)
     *
     * 段长 min(maxSegment, n/2)，半重叠，周期 Hann 窗，每段去均值，单边谱密度。
     * 段长不足 2 时返回空向量。
     */
    static std::vector<double> welchPsd(const std::vector<double> &signal, std::size_t maxSegment);

    /**
     * @brief 真值与转换后信号 PSD 的相关系数，样本数少于 minSamples 时返回空
     */
    static std::optional<double> psdCorrelation(const AlignedSeries &series, const SpectralOptions &options);

    /**
     * @brief 转换后极差 / 真值极差，真值极差为 0 时返回空
     */
    static std::optional<double> rangeRatio(const AlignedSeries &series);

    static SignalFidelity evaluate(const Dataset &groundTruth, const Dataset &converted,
                                   const std::set<std::string> &fields, double tolerance,
                                   const SpectralOptions &options);
};

#endif //NAV_EVAL_SIGNAL_METRICS_H
