#ifndef NAV_EVAL_PROCESS_MONITOR_H
#define NAV_EVAL_PROCESS_MONITOR_H

#include <cstddef>
#include <optional>
#include <vector>
#include <sys/types.h>

struct ProcessSample
{
    double wallTimeS = 0.0;
    double cpuPercent = 0.0;
    std::size_t rssBytes = 0;
};

/**
 * @brief 子进程 CPU 与常驻内存采样
 *
 * 读取 /proc/<pid>/stat 的 utime/stime 与 /proc/<pid>/statm 的 RSS 页数，
 * CPU% 为两次采样间 CPU 时间增量 / 墙钟时间增量。
 * 由调用方按固定周期调用 sample()。
 */
class ProcessMonitor
{
public:
    explicit ProcessMonitor(pid_t pid);

    /**
     * @brief 采样一次，进程信息不可读时返回 false
     */
    bool sample();

    [[nodiscard]] const std::vector<ProcessSample> &samples() const { return samples_; }

    [[nodiscard]] std::size_t peakRssBytes() const;

    [[nodiscard]] double averageCpuPercent() const;

    [[nodiscard]] pid_t pid() const { return pid_; }

    struct CpuTimes
    {
        double userS = 0.0;
        double systemS = 0.0;
    };

    static std::optional<CpuTimes> readCpuTimes(pid_t pid);

    static std::optional<std::size_t> readRssBytes(pid_t pid);

private:
    pid_t pid_;
    double startTime_;
    double prevWall_;
    std::optional<CpuTimes> prevTimes_;
    std::vector<ProcessSample> samples_;
};

#endif //NAV_EVAL_PROCESS_MONITOR_H
