#include "field_extractor.h"

#include "measurement/field_registry.h"

std::optional<double> FieldExtractor::numericValue(const nlohmann::json &node)
{
    // nlohmann 中布尔值不是 number
    if (!node.is_number()) return std::nullopt;
    return node.get<double>();
}

std::optional<double> FieldExtractor::resolve(const NavRecord &record, const std::string &path)
{
    if (auto id = FieldRegistry::find(path))
    {
        return record.get(*id);
    }
    return resolveJson(record.raw, path);
}

std::optional<double> FieldExtractor::resolveJson(const nlohmann::json &node, const std::string &path)
{
    return resolveSegments(node, FieldRegistry::splitPath(path));
}

std::optional<double> FieldExtractor::resolveSegments(const nlohmann::json &node,
                                                      const std::vector<std::string> &segments)
{
    const nlohmann::json *cur = &node;
    for (const auto &seg : segments)
    {
        if (!cur->is_object()) return std::nullopt;

        auto it = cur->find(seg);
        if (it == cur->end()) return std::nullopt;
        cur = &(*it);
    }
    return numericValue(*cur);
}

std::set<std::string> FieldExtractor::enumerateNumericFields(const NavRecord &record)
{
    std::set<std::string> fields;
    collectNumericFields(record.raw, "", fields);
    return fields;
}

void FieldExtractor::collectNumericFields(const nlohmann::json &node, const std::string &prefix,
                                          std::set<std::string> &fields)
{
    if (!node.is_object()) return;

    for (auto it = node.begin(); it != node.end(); ++it)
    {
        const std::string name = prefix.empty() ? it.key() : prefix + "." + it.key();

        if (it->is_object())
        {
            collectNumericFields(*it, name, fields);
        }
        else if (it->is_number())
        {
            fields.insert(name);
        }
    }
}

std::optional<Eigen::Vector3d> FieldExtractor::vector3(const NavRecord &record,
                                                       FieldId x, FieldId y, FieldId z)
{
    auto vx = record.get(x);
    auto vy = record.get(y);
    auto vz = record.get(z);
    if (!vx || !vy || !vz) return std::nullopt;
    return Eigen::Vector3d(*vx, *vy, *vz);
}

NavRecord FieldExtractor::buildRecord(const nlohmann::json &entry)
{
    NavRecord record;
    record.raw = entry;

    auto t = entry.find("time_unix");
    if (t != entry.end())
    {
        record.time = numericValue(*t);
    }

    for (const auto &d : FieldRegistry::descriptors())
    {
        record.known[static_cast<std::size_t>(d.id)] = resolveSegments(entry, d.segments);
    }
    return record;
}
