#include "eval_app.h"

#include <iostream>

#include "config/eval_config.h"
#include "eval/data_transform_evaluator.h"
#include "io/benchmark_results.h"
#include "io/report_writer.h"
#include "utils/exceptions.h"

namespace
{

bool takesValue(const std::string &arg)
{
    return arg == "--ground-truth" || arg == "--converted" || arg == "--output" || arg == "--config" ||
           arg == "--benchmark" || arg == "--log-level" || arg == "--log-file";
}

} // namespace

void EvalApp::printUsage(std::ostream &out, const char *prog)
{
    out << "Usage: " << prog << " --ground-truth <dir> --converted <dir> [options]\n"
        << "  --output <file>       write the report to <file> instead of stdout\n"
        << "  --config <file>       YAML evaluation config\n"
        << "  --benchmark <file>    benchmark results produced by nav_benchmark\n"
        << "  --log-level <level>   debug|info|warning|error|none (default info)\n"
        << "  --log-file <file>     also log to a rotating file\n"
        << "  --help                show this message\n";
}

EvalOptions EvalApp::parseArgs(int argc, const char **argv)
{
    EvalOptions opts;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            opts.help = true;
            continue;
        }

        if (!takesValue(arg))
        {
            throw nav_eval::ValidationException(arg, "unknown option");
        }
        if (i + 1 >= argc)
        {
            throw nav_eval::ValidationException(arg, "missing value");
        }
        const std::string value = argv[++i];

        if (arg == "--ground-truth") opts.groundTruthDir = value;
        else if (arg == "--converted") opts.convertedDir = value;
        else if (arg == "--output") opts.outputPath = value;
        else if (arg == "--config") opts.configPath = value;
        else if (arg == "--benchmark") opts.benchmarkPath = value;
        else if (arg == "--log-level") opts.logLevel = Logger::parseLevel(value);
        else opts.logFile = value;
    }

    if (!opts.help && (opts.groundTruthDir.empty() || opts.convertedDir.empty()))
    {
        throw nav_eval::ValidationException("--ground-truth and --converted are required");
    }
    return opts;
}

int EvalApp::run(int argc, const char **argv, std::ostream &out)
{
    // 1. 命令行参数，错误按用法错误处理
    EvalOptions opts;
    try
    {
        opts = parseArgs(argc, argv);
    }
    catch (const nav_eval::ValidationException &e)
    {
        Logger::Logger::getInstance().init(Logger::Level::INFO);
        LOG_ERROR_STREAM() << e.what();
        printUsage(std::cerr, argv[0]);
        return kExitUsage;
    }

    if (opts.help)
    {
        printUsage(std::cerr, argv[0]);
        return kExitOk;
    }

    // 2. 配置文件与日志
    EvalConfig config;
    try
    {
        if (!opts.configPath.empty())
        {
            config = EvalConfig(opts.configPath);
        }

        const auto level = opts.logLevel ? *opts.logLevel : config.logLevel();
        const auto &logFile = opts.logFile.empty() ? config.logFile() : opts.logFile;
        Logger::Logger::getInstance().init(level, logFile);
    }
    catch (const nav_eval::BaseException &e)
    {
        Logger::Logger::getInstance().init(Logger::Level::INFO);
        LOG_ERROR_STREAM() << e.what();
        return kExitFailure;
    }

    // 3. 评估并输出报告
    try
    {
        DataTransformEvaluator evaluator(opts.groundTruthDir, opts.convertedDir, config);

        if (!opts.benchmarkPath.empty())
        {
            evaluator.setBenchmarkResults(BenchmarkResultsIO::read(opts.benchmarkPath));
        }

        const auto report = evaluator.evaluateAll();

        if (opts.outputPath.empty())
        {
            ReportWriter::write(report, out);
        }
        else
        {
            ReportWriter::write(report, opts.outputPath);
            LOG_INFO_STREAM() << "Evaluation report saved to: " << opts.outputPath;
        }
        return kExitOk;
    }
    catch (const nav_eval::BaseException &e)
    {
        LOG_ERROR_STREAM() << e.what();
        return kExitFailure;
    }
    catch (const std::exception &e)
    {
        LOG_ERROR_STREAM() << "Unexpected error: " << e.what();
        return kExitFailure;
    }
}
