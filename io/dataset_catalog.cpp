#include "dataset_catalog.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "utils/exceptions.h"
#include "utils/logger.h"

namespace fs = std::filesystem;

namespace
{
void requireDirectory(const std::string &dir)
{
    if (!fs::is_directory(dir))
    {
        throw nav_eval::FileException("open directory", dir);
    }
}
} // namespace

DatasetCatalog::DatasetCatalog(const std::string &groundTruthDir, const std::string &convertedDir)
    : groundTruthDir_(groundTruthDir), convertedDir_(convertedDir)
{
    requireDirectory(groundTruthDir_);
    requireDirectory(convertedDir_);
    scan();
}

std::optional<SensorCategory> DatasetCatalog::categoryOf(const std::string &filename)
{
    std::string lower = filename;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.find(categoryName(SensorCategory::Gnss)) != std::string::npos) return SensorCategory::Gnss;
    if (lower.find(categoryName(SensorCategory::Imu)) != std::string::npos) return SensorCategory::Imu;
    return std::nullopt;
}

void DatasetCatalog::scan()
{
    std::vector<std::string> names;
    for (const auto &entry : fs::directory_iterator(groundTruthDir_))
    {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());

    for (const auto &name : names)
    {
        auto category = categoryOf(name);
        if (!category)
        {
            LOG_DEBUG_STREAM() << "Skip " << name << ": no sensor keyword in file name";
            continue;
        }

        const auto gtPath = (fs::path(groundTruthDir_) / name).string();
        groundTruthFiles_.emplace_back(gtPath, *category);

        const auto convPath = (fs::path(convertedDir_) / name).string();
        if (!fs::is_regular_file(convPath))
        {
            LOG_DEBUG_STREAM() << "Skip " << name << ": no converted counterpart";
            continue;
        }

        pairs_.push_back(FilePair{name, *category, gtPath, convPath});
    }

    LOG_INFO_STREAM() << "Found " << pairs_.size() << " file pair(s) in " << groundTruthDir_;
}

std::vector<std::string> DatasetCatalog::groundTruthFiles(SensorCategory category) const
{
    std::vector<std::string> files;
    for (const auto &f : groundTruthFiles_)
    {
        if (f.second == category) files.push_back(f.first);
    }
    return files;
}
