#ifndef NAV_EVAL_STRUCTURAL_METRICS_H
#define NAV_EVAL_STRUCTURAL_METRICS_H

#include <set>
#include <string>
#include <vector>

#include "measurement/nav_record.h"
#include "metrics/metric_types.h"

class StructuralMetrics
{
public:
    /**
     * @brief 转换后数据中 (记录 × 必需字段) 能解析出数值的比例 (%)，没有单元格时为空
     */
    static SchemaCompliance schemaCompliance(const Dataset &converted,
                                             const std::vector<std::string> &requiredFields);

    /**
     * @brief 真值中出现过的数值字段有多少在转换后任一记录中存在 (%)
     */
    static FieldMapping fieldMapping(const Dataset &groundTruth, const Dataset &converted);

    /**
     * @brief 数据集所有记录数值字段路径的并集
     */
    static std::set<std::string> observedFields(const Dataset &dataset);

    static void collectObservedFields(const Dataset &dataset, std::set<std::string> &fields);

    static bool existsInAny(const Dataset &dataset, const std::string &field);
};

#endif //NAV_EVAL_STRUCTURAL_METRICS_H
