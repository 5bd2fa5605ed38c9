#ifndef NAV_EVAL_BENCHMARK_RESULTS_H
#define NAV_EVAL_BENCHMARK_RESULTS_H

#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

// nav_benchmark 的输出，也是 nav_eval --benchmark 的输入
struct BenchmarkResults
{
    std::string timestamp;                            // ISO 8601 本地时间
    std::map<std::string, std::uintmax_t> inputFiles; // 相对路径 -> 字节数
    double totalTimeSeconds = 0.0;
    double averageTimePerFileSeconds = 0.0;
    double peakMemoryUsageMb = 0.0;
    double averageCpuPercent = 0.0;
    int exitCode = 0;
};

class BenchmarkResultsIO
{
public:
    static nlohmann::json toJson(const BenchmarkResults &results);

    static BenchmarkResults fromJson(const nlohmann::json &document);

    /**
     * @brief 读取结果文件，打不开抛 FileException，格式错误抛 DataException
     */
    static BenchmarkResults read(const std::string &path);

    static void write(const BenchmarkResults &results, const std::string &path);
};

#endif //NAV_EVAL_BENCHMARK_RESULTS_H
