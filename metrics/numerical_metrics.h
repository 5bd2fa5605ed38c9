#ifndef NAV_EVAL_NUMERICAL_METRICS_H
#define NAV_EVAL_NUMERICAL_METRICS_H

#include <map>
#include <string>
#include <vector>

#include "measurement/nav_record.h"
#include "measurement/time_aligner.h"
#include "metrics/metric_types.h"

class NumericalMetrics
{
public:
    /**
     * @brief 单字段绝对误差统计
     *
     * 误差样本来自已配对且两侧都能解析该字段的记录；
     * 匹配百分比相对于真值记录总数；NRMSE 以真值该字段全部取值的极差归一化，
     * 极差为 0 时为空。
     */
    static FieldErrorStats fieldError(const Dataset &groundTruth, const Dataset &converted,
                                      const std::vector<TimeAligner::AlignedPair> &pairs,
                                      const std::string &field);

    static std::map<std::string, FieldErrorStats> fieldErrors(const Dataset &groundTruth,
                                                              const Dataset &converted,
                                                              const std::vector<std::string> &fields,
                                                              double tolerance);

    static double matchedPercentage(std::size_t matched, std::size_t total);
};

#endif //NAV_EVAL_NUMERICAL_METRICS_H
