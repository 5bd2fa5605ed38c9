#include "dataset_loader.h"

#include <filesystem>
#include <system_error>
#include <utility>

#include "measurement/field_extractor.h"
#include "utils/exceptions.h"
#include "utils/logger.h"

DatasetLoader::DatasetLoader(const std::string &path, SensorCategory category)
    : path_(path), file_(path)
{
    if (!file_.is_open())
    {
        throw nav_eval::FileException("open", path);
    }

    dataset_.name = std::filesystem::path(path).filename().string();
    dataset_.category = category;

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        throw nav_eval::FileException("stat", path + " (" + ec.message() + ")");
    }
    dataset_.sizeBytes = size;
}

const Dataset &DatasetLoader::load()
{
    if (loaded_)
    {
        return dataset_;  // 已经加载过
    }

    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(file_);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw nav_eval::DataException(path_, e.what());
    }

    parseRecords(document);
    loaded_ = true;

    LOG_DEBUG_STREAM() << "Loaded " << dataset_.size() << " " << categoryName(dataset_.category)
                       << " records from " << path_;
    return dataset_;
}

void DatasetLoader::parseRecords(const nlohmann::json &document)
{
    if (!document.is_object())
    {
        LOG_WARNING_STREAM() << path_ << ": top level is not an object, no records loaded";
        return;
    }

    auto payload = document.find(datasetKey(dataset_.category));
    if (payload == document.end())
    {
        LOG_DEBUG_STREAM() << path_ << ": no '" << datasetKey(dataset_.category) << "' key";
        return;
    }

    if (!payload->is_array())
    {
        LOG_WARNING_STREAM() << path_ << ": '" << datasetKey(dataset_.category)
                             << "' is not an array, no records loaded";
        return;
    }

    dataset_.records.reserve(payload->size());
    std::size_t index = 0;
    for (const auto &entry : *payload)
    {
        if (!entry.is_object())
        {
            LOG_WARNING_STREAM() << path_ << ": record " << index << " is not an object, skipped";
        }
        else
        {
            dataset_.records.push_back(FieldExtractor::buildRecord(entry));
        }
        ++index;
    }
}

Dataset DatasetLoader::take()
{
    load();
    return std::move(dataset_);
}

Dataset DatasetLoader::loadFile(const std::string &path, SensorCategory category)
{
    DatasetLoader loader(path, category);
    return loader.take();
}
