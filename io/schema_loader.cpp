#include "schema_loader.h"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "utils/exceptions.h"
#include "utils/logger.h"

namespace fs = std::filesystem;

const std::vector<std::string> &SchemaDocument::required(SensorCategory category) const
{
    static const std::vector<std::string> kNone;

    auto it = requiredFields.find(categoryName(category));
    return it == requiredFields.end() ? kNone : it->second;
}

void SchemaDocument::setRequired(SensorCategory category, const std::set<std::string> &fields)
{
    requiredFields[categoryName(category)].assign(fields.begin(), fields.end());
}

std::string SchemaLoader::sidecarPath(const std::string &groundTruthDir)
{
    fs::path dir = fs::path(groundTruthDir).lexically_normal();
    if (!dir.has_filename())
    {
        dir = dir.parent_path();  // 去掉末尾分隔符
    }
    return (dir.parent_path() / "metadata" / "schema_documentation.json").string();
}

std::optional<SchemaDocument> SchemaLoader::load(const std::string &path)
{
    if (!fs::exists(path))
    {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open())
    {
        throw nav_eval::FileException("open", path);
    }

    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw nav_eval::DataException(path, e.what());
    }

    if (!document.is_object())
    {
        throw nav_eval::DataException(path, "schema document must be an object");
    }

    SchemaDocument schema;
    for (const auto category : {SensorCategory::Gnss, SensorCategory::Imu})
    {
        auto section = document.find(categoryName(category));
        if (section == document.end()) continue;

        if (!section->is_object())
        {
            throw nav_eval::DataException(path, std::string("'") + categoryName(category) + "' must be an object");
        }

        auto fields = section->find("required_fields");
        if (fields == section->end()) continue;

        if (!fields->is_array())
        {
            throw nav_eval::DataException(path, std::string(categoryName(category)) +
                                                ".required_fields must be an array");
        }

        auto &target = schema.requiredFields[categoryName(category)];
        for (const auto &f : *fields)
        {
            if (!f.is_string())
            {
                throw nav_eval::DataException(path, std::string(categoryName(category)) +
                                                    ".required_fields must contain strings");
            }
            target.push_back(f.get<std::string>());
        }
    }

    LOG_INFO_STREAM() << "Schema loaded from " << path;
    return schema;
}
