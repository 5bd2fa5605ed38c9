#ifndef NAV_EVAL_REPORT_WRITER_H
#define NAV_EVAL_REPORT_WRITER_H

#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

#include "eval/evaluation_report.h"

/**
 * @brief 评估报告序列化为 JSON
 *
 * 空值写 null；+/-inf 写字符串 "Infinity" / "-Infinity"；键按字典序输出，缩进 2。
 */
class ReportWriter
{
public:
    static nlohmann::json toJson(const EvaluationReport &report);

    static nlohmann::json value(const std::optional<double> &v);

    static nlohmann::json toJson(const FieldErrorStats &stats);

    static nlohmann::json toJson(const FieldValues &values);

    static void write(const EvaluationReport &report, std::ostream &os);

    /**
     * @brief 写入文件，打不开时抛 FileException
     */
    static void write(const EvaluationReport &report, const std::string &path);
};

#endif //NAV_EVAL_REPORT_WRITER_H
