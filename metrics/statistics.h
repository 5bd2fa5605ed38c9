#ifndef NAV_EVAL_STATISTICS_H
#define NAV_EVAL_STATISTICS_H

#include <optional>
#include <vector>
#include <Eigen/Core>

#include "metrics/metric_types.h"

class Statistics
{
public:
    struct Histogram
    {
        std::vector<double> counts;
        std::vector<double> edges;  // counts.size() + 1 个等宽边界
    };

    /**
     * @brief 均值/最大/最小/总体标准差，样本为空时全部为空
     */
    static ErrorStats describe(const std::vector<double> &samples);

    static std::optional<double> mean(const std::vector<double> &samples);

    static std::optional<double> rms(const std::vector<double> &samples);

    // max - min
    static std::optional<double> range(const std::vector<double> &samples);

    /**
     * @brief 跳过空值和非有限值求均值，没有剩余时返回空
     */
    static std::optional<double> meanOfValid(const FieldValues &values);

    static std::optional<double> meanOfValid(const std::vector<std::optional<double>> &values);

    /**
     * @brief Pearson 相关系数，长度不同或任一序列方差为 0 时返回空
     */
    static std::optional<double> pearson(const std::vector<double> &x, const std::vector<double> &y);

    /**
     * @brief 等宽直方图，区间为 [min, max]，min == max 时扩展为 [min-0.5, max+0.5]
     *
     * 与 numpy.histogram 一致：最后一个区间右闭。
     */
    static Histogram histogram(const std::vector<double> &values, int bins);

    /**
     * @brief 给定边界下的区间下标，超出范围返回 -1（最右边界归入最后一个区间）
     */
    static int binIndex(const std::vector<double> &edges, double value);

    /**
     * @brief 计数分布的香农熵 (nat)
     */
    static double entropy(const std::vector<double> &counts);

    static Eigen::Map<const Eigen::ArrayXd> asArray(const std::vector<double> &samples);
};

#endif //NAV_EVAL_STATISTICS_H
