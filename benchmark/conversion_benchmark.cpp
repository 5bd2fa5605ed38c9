#include "conversion_benchmark.h"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <set>
#include <sstream>
#include <thread>
#include <utility>
#include <sys/wait.h>
#include <unistd.h>

#include "benchmark/process_monitor.h"
#include "utils/constants.h"
#include "utils/exceptions.h"
#include "utils/logger.h"

namespace fs = std::filesystem;

namespace
{
const std::set<std::string> kInputExtensions = {".json", ".txt", ".nmea", ".obs", ".csv"};

int exitCodeOf(int status)
{
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}
} // namespace

ConversionBenchmark::ConversionBenchmark(BenchmarkOptions options) : options_(std::move(options))
{
}

std::map<std::string, std::uintmax_t> ConversionBenchmark::enumerateInputs(const std::string &dir)
{
    if (!fs::is_directory(dir))
    {
        throw nav_eval::FileException("open directory", dir);
    }

    std::map<std::string, std::uintmax_t> files;
    for (const auto &entry : fs::recursive_directory_iterator(dir))
    {
        if (!entry.is_regular_file()) continue;
        if (kInputExtensions.count(entry.path().extension().string()) == 0) continue;

        files[fs::relative(entry.path(), dir).string()] = entry.file_size();
    }
    return files;
}

std::vector<std::string> ConversionBenchmark::buildCommand(const BenchmarkOptions &options)
{
    std::vector<std::string> cmd;
    if (fs::path(options.script).extension() == ".py")
    {
        cmd.emplace_back("python3");
    }
    cmd.push_back(options.script);
    cmd.emplace_back("--input");
    cmd.push_back(options.inputDir);
    cmd.emplace_back("--output");
    cmd.push_back(options.outputDir);
    return cmd;
}

std::string ConversionBenchmark::isoTimestamp()
{
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

BenchmarkResults ConversionBenchmark::run()
{
    BenchmarkResults results;
    results.timestamp = isoTimestamp();
    results.inputFiles = enumerateInputs(options_.inputDir);

    std::error_code ec;
    fs::create_directories(options_.outputDir, ec);
    if (ec)
    {
        throw nav_eval::FileException("create directory", options_.outputDir + " (" + ec.message() + ")");
    }

    const auto cmd = buildCommand(options_);
    std::vector<char *> argv;
    for (const auto &arg : cmd)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    LOG_INFO_STREAM() << "Running conversion: " << options_.script << " on " << results.inputFiles.size()
                      << " input file(s)";

    const auto start = std::chrono::steady_clock::now();

    const pid_t pid = fork();
    if (pid < 0)
    {
        throw nav_eval::ProcessException(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0)
    {
        execvp(argv[0], argv.data());
        _exit(127);
    }

    // 1. 周期采样直到子进程退出
    ProcessMonitor monitor(pid);
    int status = 0;
    while (true)
    {
        const pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0)
        {
            throw nav_eval::ProcessException(std::string("waitpid failed: ") + std::strerror(errno));
        }

        monitor.sample();
        std::this_thread::sleep_for(options_.samplePeriod);
    }

    // 2. 汇总
    results.totalTimeSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (!results.inputFiles.empty())
    {
        results.averageTimePerFileSeconds = results.totalTimeSeconds /
                                            static_cast<double>(results.inputFiles.size());
    }
    results.peakMemoryUsageMb = static_cast<double>(monitor.peakRssBytes()) * Byte2MB;
    results.averageCpuPercent = monitor.averageCpuPercent();
    results.exitCode = exitCodeOf(status);

    LOG_INFO_STREAM() << "Conversion finished in " << results.totalTimeSeconds << " s, exit code "
                      << results.exitCode;
    if (results.exitCode == 127)
    {
        LOG_WARNING_STREAM() << "Exit code 127: '" << cmd.front() << "' may not be executable";
    }
    return results;
}
