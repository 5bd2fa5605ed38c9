#ifndef NAV_EVAL_FIELD_EXTRACTOR_H
#define NAV_EVAL_FIELD_EXTRACTOR_H

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <Eigen/Core>
#include <nlohmann/json.hpp>

#include "measurement/nav_record.h"

class FieldExtractor
{
public:
    /**
     * @brief 按点分路径取数值
     *
     * 已注册路径直接读类型化字段，其余路径走通用 JSON 解析。
     * 任一段缺失、中间节点不是对象、末端不是数值（布尔值不算）时返回空。
     */
    static std::optional<double> resolve(const NavRecord &record, const std::string &path);

    static std::optional<double> resolveJson(const nlohmann::json &node, const std::string &path);

    static std::optional<double> resolveSegments(const nlohmann::json &node,
                                                 const std::vector<std::string> &segments);

    /**
     * @brief 枚举记录中所有数值叶子的点分路径，不进入数组
     */
    static std::set<std::string> enumerateNumericFields(const NavRecord &record);

    static void collectNumericFields(const nlohmann::json &node, const std::string &prefix,
                                     std::set<std::string> &fields);

    /**
     * @brief 三个已注册字段组成的向量，任一分量缺失返回空
     */
    static std::optional<Eigen::Vector3d> vector3(const NavRecord &record,
                                                  FieldId x, FieldId y, FieldId z);

    /**
     * @brief 从原始 JSON 填充记录的时间与类型化字段
     */
    static NavRecord buildRecord(const nlohmann::json &entry);

    static std::optional<double> numericValue(const nlohmann::json &node);
};

#endif //NAV_EVAL_FIELD_EXTRACTOR_H
