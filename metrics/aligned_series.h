#ifndef NAV_EVAL_ALIGNED_SERIES_H
#define NAV_EVAL_ALIGNED_SERIES_H

#include <string>
#include <vector>

#include "measurement/nav_record.h"
#include "measurement/time_aligner.h"

// 同一字段在已配对记录上的取值，两侧均能解析才保留
struct AlignedSeries
{
    std::vector<double> groundTruth;
    std::vector<double> converted;

    [[nodiscard]] std::size_t size() const { return groundTruth.size(); }

    [[nodiscard]] bool empty() const { return groundTruth.empty(); }

    static AlignedSeries collect(const Dataset &groundTruth, const Dataset &converted,
                                 const std::vector<TimeAligner::AlignedPair> &pairs,
                                 const std::string &field);

    /**
     * @brief 数据集中该字段所有可解析的值（按记录顺序）
     */
    static std::vector<double> values(const Dataset &dataset, const std::string &field);
};

#endif //NAV_EVAL_ALIGNED_SERIES_H
