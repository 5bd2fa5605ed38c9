#ifndef NAV_EVAL_FIELD_REGISTRY_H
#define NAV_EVAL_FIELD_REGISTRY_H

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "measurement/nav_record.h"

/**
 * @brief 已知字段的静态注册表
 *
 * 每个 FieldId 对应一个点分路径，路径在首次使用时预先切分，
 * 加载记录时按表解析一次，之后按 FieldId 直接取值。
 */
class FieldRegistry
{
public:
    struct Descriptor
    {
        FieldId id;
        std::string path;
        std::vector<std::string> segments;
    };

    static const std::array<Descriptor, kKnownFieldCount> &descriptors();

    static const std::string &path(FieldId id);

    static std::optional<FieldId> find(const std::string &path);

    static std::vector<std::string> splitPath(const std::string &path);
};

#endif //NAV_EVAL_FIELD_REGISTRY_H
