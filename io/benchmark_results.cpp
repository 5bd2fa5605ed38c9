#include "benchmark_results.h"

#include <fstream>

#include "utils/exceptions.h"

nlohmann::json BenchmarkResultsIO::toJson(const BenchmarkResults &results)
{
    nlohmann::json files = nlohmann::json::object();
    for (const auto &f : results.inputFiles)
    {
        files[f.first] = f.second;
    }

    return {
        {"timestamp", results.timestamp},
        {"input_files", files},
        {"total_time_seconds", results.totalTimeSeconds},
        {"average_time_per_file_seconds", results.averageTimePerFileSeconds},
        {"peak_memory_usage_mb", results.peakMemoryUsageMb},
        {"average_cpu_percent", results.averageCpuPercent},
        {"exit_code", results.exitCode}};
}

BenchmarkResults BenchmarkResultsIO::fromJson(const nlohmann::json &document)
{
    if (!document.is_object())
    {
        throw nav_eval::DataException("benchmark results must be an object");
    }

    BenchmarkResults results;
    try
    {
        results.timestamp = document.value("timestamp", std::string());
        results.totalTimeSeconds = document.at("total_time_seconds").get<double>();
        results.averageTimePerFileSeconds = document.value("average_time_per_file_seconds", 0.0);
        results.peakMemoryUsageMb = document.at("peak_memory_usage_mb").get<double>();
        results.averageCpuPercent = document.at("average_cpu_percent").get<double>();
        results.exitCode = document.value("exit_code", 0);

        auto files = document.find("input_files");
        if (files != document.end() && files->is_object())
        {
            for (auto it = files->begin(); it != files->end(); ++it)
            {
                results.inputFiles[it.key()] = it->get<std::uintmax_t>();
            }
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        throw nav_eval::DataException("benchmark results", e.what());
    }
    return results;
}

BenchmarkResults BenchmarkResultsIO::read(const std::string &path)
{
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
    return fromJson(document);
}

void BenchmarkResultsIO::write(const BenchmarkResults &results, const std::string &path)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        throw nav_eval::FileException("write", path);
    }
    file << toJson(results).dump(2) << "\n";
}
