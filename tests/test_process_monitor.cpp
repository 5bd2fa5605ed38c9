#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

#include "benchmark/conversion_benchmark.h"
#include "benchmark/process_monitor.h"
#include "test_helpers.h"
#include "utils/exceptions.h"

using test_helpers::TempDir;

// ---------------------------------------------------------------------------
// ProcessMonitor
// ---------------------------------------------------------------------------

TEST(ProcessMonitor, ReadsOwnProcess)
{
    auto times = ProcessMonitor::readCpuTimes(getpid());
    ASSERT_TRUE(times.has_value());
    EXPECT_GE(times->userS, 0.0);
    EXPECT_GE(times->systemS, 0.0);

    auto rss = ProcessMonitor::readRssBytes(getpid());
    ASSERT_TRUE(rss.has_value());
    EXPECT_GT(*rss, 0u);
}

TEST(ProcessMonitor, SamplesUntilChildIsReaped)
{
    const pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        _exit(0);
    }

    ProcessMonitor monitor(pid);
    EXPECT_EQ(monitor.pid(), pid);
    EXPECT_TRUE(monitor.sample());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(monitor.sample());

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    EXPECT_FALSE(monitor.sample());

    ASSERT_EQ(monitor.samples().size(), 2u);
    EXPECT_GT(monitor.peakRssBytes(), 0u);
    EXPECT_GE(monitor.averageCpuPercent(), 0.0);
    EXPECT_LT(monitor.samples()[0].wallTimeS, monitor.samples()[1].wallTimeS);
}

TEST(ProcessMonitor, UnknownProcess)
{
    EXPECT_FALSE(ProcessMonitor::readCpuTimes(-1).has_value());
    ProcessMonitor monitor(-1);
    EXPECT_FALSE(monitor.sample());
    EXPECT_EQ(monitor.peakRssBytes(), 0u);
    EXPECT_DOUBLE_EQ(monitor.averageCpuPercent(), 0.0);
}

// ---------------------------------------------------------------------------
// ConversionBenchmark
// ---------------------------------------------------------------------------

TEST(ConversionBenchmark, EnumeratesConvertibleInputs)
{
    TempDir dir;
    dir.write("raw/gnss.nmea", "$GPGGA");
    dir.write("raw/sub/imu.csv", "t,ax\n");
    dir.write("raw/notes.md", "ignored");

    auto files = ConversionBenchmark::enumerateInputs((dir.path() / "raw").string());
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files.at("gnss.nmea"), 6u);
    EXPECT_TRUE(files.count("sub/imu.csv"));

    EXPECT_THROW(ConversionBenchmark::enumerateInputs((dir.path() / "none").string()), nav_eval::FileException);
}

TEST(ConversionBenchmark, BuildCommand)
{
    BenchmarkOptions options;
    options.inputDir = "in";
    options.outputDir = "out";
    options.script = "convert.py";
    EXPECT_EQ(ConversionBenchmark::buildCommand(options),
              (std::vector<std::string>{"python3", "convert.py", "--input", "in", "--output", "out"}));

    options.script = "/usr/bin/convert";
    EXPECT_EQ(ConversionBenchmark::buildCommand(options).front(), "/usr/bin/convert");
}

TEST(ConversionBenchmark, RunsConverter)
{
    TempDir dir;
    dir.write("raw/gnss.nmea", "$GPGGA");
    const auto script = dir.write("convert.sh", "#!/bin/sh\nsleep 0.2\nexit 3\n");
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    BenchmarkOptions options;
    options.inputDir = (dir.path() / "raw").string();
    options.outputDir = (dir.path() / "out").string();
    options.script = script.string();
    options.samplePeriod = std::chrono::milliseconds(20);

    auto results = ConversionBenchmark(options).run();

    EXPECT_EQ(results.exitCode, 3);
    EXPECT_GT(results.totalTimeSeconds, 0.1);
    EXPECT_EQ(results.inputFiles.size(), 1u);
    EXPECT_DOUBLE_EQ(results.averageTimePerFileSeconds, results.totalTimeSeconds);
    EXPECT_TRUE(std::filesystem::is_directory(options.outputDir));
    EXPECT_FALSE(results.timestamp.empty());
}
