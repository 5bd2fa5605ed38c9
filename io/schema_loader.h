#ifndef NAV_EVAL_SCHEMA_LOADER_H
#define NAV_EVAL_SCHEMA_LOADER_H

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "measurement/nav_record.h"

// 各类别的必需字段列表
struct SchemaDocument
{
    std::map<std::string, std::vector<std::string>> requiredFields;
    bool inferred = false;

    [[nodiscard]] const std::vector<std::string> &required(SensorCategory category) const;

    void setRequired(SensorCategory category, const std::set<std::string> &fields);
};

class SchemaLoader
{
public:
    /**
     * @brief 默认的 schema 说明文件位置：<真值目录的上级>/metadata/schema_documentation.json
     */
    static std::string sidecarPath(const std::string &groundTruthDir);

    /**
     * @brief 读取 schema 说明文件，文件不存在时返回空
     *
     * 文档为对象，每个类别下可选 required_fields 字符串数组。
     * JSON 无法解析或结构不符时抛出 DataException。
     */
    static std::optional<SchemaDocument> load(const std::string &path);
};

#endif //NAV_EVAL_SCHEMA_LOADER_H
