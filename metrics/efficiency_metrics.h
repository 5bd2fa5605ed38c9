#ifndef NAV_EVAL_EFFICIENCY_METRICS_H
#define NAV_EVAL_EFFICIENCY_METRICS_H

#include <cstdint>

#include "metrics/metric_types.h"

class EfficiencyMetrics
{
public:
    // 转换后字节数 / 真值字节数，真值为 0 字节时比值为空
    static SizeRatio sizeRatio(std::uintmax_t groundTruthBytes, std::uintmax_t convertedBytes)
    {
        SizeRatio result;
        result.groundTruthSizeBytes = groundTruthBytes;
        result.convertedSizeBytes = convertedBytes;
        if (groundTruthBytes > 0)
        {
            result.sizeRatio = static_cast<double>(convertedBytes) / static_cast<double>(groundTruthBytes);
        }
        return result;
    }
};

#endif //NAV_EVAL_EFFICIENCY_METRICS_H
