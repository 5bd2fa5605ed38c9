#ifndef NAV_EVAL_DATA_TRANSFORM_EVALUATOR_H
#define NAV_EVAL_DATA_TRANSFORM_EVALUATOR_H

#include <optional>
#include <string>
#include <vector>

#include "config/eval_config.h"
#include "eval/evaluation_report.h"
#include "eval/report_builder.h"
#include "io/benchmark_results.h"
#include "io/dataset_catalog.h"
#include "io/schema_loader.h"
#include "measurement/nav_record.h"

/**
 * @brief 转换结果评估流程
 *
 * 1. 按文件名配对真值与转换后文件
 * 2. 每对文件加载一次，依次计算各类指标
 * 3. 结果写入报告构建器
 * 4. 计算跨文件汇总并生成报告
 */
class DataTransformEvaluator
{
public:
    /**
     * @brief 任一目录不存在时抛出 FileException
     */
    DataTransformEvaluator(const std::string &groundTruthDir, const std::string &convertedDir,
                           EvalConfig config = EvalConfig());

    void setBenchmarkResults(const BenchmarkResults &results);

    EvaluationReport evaluateAll();

private:
    struct LoadedPair
    {
        FilePair files;
        Dataset groundTruth;
        Dataset converted;
    };

    std::vector<LoadedPair> loadPairs() const;

    SchemaDocument resolveSchema(const std::vector<LoadedPair> &pairs) const;

    void evaluatePair(const LoadedPair &pair, const SchemaDocument &schema, ReportBuilder &builder) const;

    void evaluateCrossSensor(const std::vector<LoadedPair> &pairs, ReportBuilder &builder) const;

    DatasetCatalog catalog_;
    EvalConfig config_;
    std::optional<BenchmarkResults> benchmark_;
};

#endif //NAV_EVAL_DATA_TRANSFORM_EVALUATOR_H
