#ifndef NAV_EVAL_REPORT_BUILDER_H
#define NAV_EVAL_REPORT_BUILDER_H

#include <string>

#include "eval/evaluation_report.h"
#include "io/benchmark_results.h"
#include "measurement/nav_record.h"
#include "metrics/signal_metrics.h"

/**
 * @brief 逐文件累积各指标结果，最后一次性生成报告
 *
 * finalize() 计算跨文件汇总并交出报告，之后再写入会抛出异常。
 */
class ReportBuilder
{
public:
    ReportBuilder() = default;

    ReportBuilder(const ReportBuilder &) = delete;

    ReportBuilder &operator=(const ReportBuilder &) = delete;

    ReportBuilder(ReportBuilder &&) = default;

    ReportBuilder &operator=(ReportBuilder &&) = default;

    void addFieldErrors(SensorCategory category, const std::string &file, FieldErrorTable table);

    void addPositionError(const std::string &file, const SensorErrorStats &stats);

    void addOrientationError(const std::string &file, const SensorErrorStats &stats);

    void addAccelerationError(const std::string &file, const SensorErrorStats &stats);

    void addCoordinateConsistency(const std::string &file, const CoordinateConsistency &result);

    void addTimestampError(const std::string &file, const TimestampError &result);

    void addSamplingRate(const std::string &file, const SamplingRate &result);

    void setCrossSensorAlignment(const CrossSensorAlignment &result);

    void addSchemaCompliance(const std::string &file, const SchemaCompliance &result);

    void addFieldMapping(const std::string &file, const FieldMapping &result);

    void addEntropy(const std::string &file, EntropyResult result);

    void addMutualInformation(const std::string &file, MutualInformationResult result);

    void addSignalFidelity(const std::string &file, SignalFidelity result);

    void addSizeRatio(const std::string &file, const SizeRatio &result);

    void setBenchmark(const BenchmarkResults &results);

    [[nodiscard]] bool finalized() const { return finalized_; }

    EvaluationReport finalize();

    /**
     * @brief 由各节内容计算汇总，跳过空值
     */
    static ReportSummary summarize(const EvaluationReport &report);

private:
    EvaluationReport &report();

    EvaluationReport report_;
    bool finalized_{false};
};

#endif //NAV_EVAL_REPORT_BUILDER_H
