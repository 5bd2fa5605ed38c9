#include <iostream>
#include <string>

#include "benchmark/conversion_benchmark.h"
#include "io/benchmark_results.h"
#include "utils/exceptions.h"
#include "utils/logger.h"

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void printUsage(const char *prog)
{
    std::cerr << "Usage: " << prog << " --input <dir> --output <dir> --script <path>"
              << " [--results <file>] [--log-level <level>]\n";
}

} // namespace

int main(int argc, const char **argv)
{
    BenchmarkOptions options;
    std::string resultsPath = "benchmark_results.json";
    std::string logLevel = "info";

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return kExitOk;
        }
        if (i + 1 >= argc)
        {
            printUsage(argv[0]);
            return kExitUsage;
        }

        const std::string value = argv[++i];
        if (arg == "--input") options.inputDir = value;
        else if (arg == "--output") options.outputDir = value;
        else if (arg == "--script") options.script = value;
        else if (arg == "--results") resultsPath = value;
        else if (arg == "--log-level") logLevel = value;
        else
        {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return kExitUsage;
        }
    }

    if (options.inputDir.empty() || options.outputDir.empty() || options.script.empty())
    {
        printUsage(argv[0]);
        return kExitUsage;
    }

    try
    {
        Logger::Logger::getInstance().init(Logger::parseLevel(logLevel));
    }
    catch (const nav_eval::ValidationException& e)
    {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }

    try
    {
        ConversionBenchmark benchmark(options);
        const auto results = benchmark.run();

        BenchmarkResultsIO::write(results, resultsPath);
        LOG_INFO_STREAM() << "Benchmark results saved to: " << resultsPath;

        return results.exitCode == 0 ? kExitOk : kExitFailure;
    }
    catch (const nav_eval::FileException& e)
    {
        LOG_ERROR_STREAM() << e.what();
        return kExitFailure;
    }
    catch (const nav_eval::ProcessException& e)
    {
        LOG_ERROR_STREAM() << e.what();
        return kExitFailure;
    }
    catch (const std::exception& e)
    {
        LOG_ERROR_STREAM() << "Unexpected error: " << e.what();
        return kExitFailure;
    }
}
