#ifndef NAV_EVAL_CONVERSION_BENCHMARK_H
#define NAV_EVAL_CONVERSION_BENCHMARK_H

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "io/benchmark_results.h"

struct BenchmarkOptions
{
    std::string inputDir;
    std::string outputDir;
    std::string script;
    std::chrono::milliseconds samplePeriod{100};   // 10 Hz
};

/**
 * @brief 运行外部转换程序并记录耗时与资源占用
 *
 * 以 --input <dir> --output <dir> 启动转换程序（.py 脚本经 python3 运行），
 * 运行期间周期采样子进程的 CPU% 与 RSS。
 */
class ConversionBenchmark
{
public:
    explicit ConversionBenchmark(BenchmarkOptions options);

    /**
     * @brief 输入目录不存在抛 FileException，子进程无法启动或等待失败抛 ProcessException
     */
    BenchmarkResults run();

    /**
     * @brief 递归列出可转换的输入文件（相对路径 -> 字节数）
     */
    static std::map<std::string, std::uintmax_t> enumerateInputs(const std::string &dir);

    static std::vector<std::string> buildCommand(const BenchmarkOptions &options);

    static std::string isoTimestamp();

private:
    BenchmarkOptions options_;
};

#endif //NAV_EVAL_CONVERSION_BENCHMARK_H
