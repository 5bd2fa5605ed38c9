#include "process_monitor.h"

#include <chrono>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace
{
double nowSeconds()
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

std::string procPath(pid_t pid, const char *entry)
{
    return "/proc/" + std::to_string(pid) + "/" + entry;
}
} // namespace

ProcessMonitor::ProcessMonitor(pid_t pid)
    : pid_(pid), startTime_(nowSeconds()), prevWall_(startTime_), prevTimes_(readCpuTimes(pid))
{
}

std::optional<ProcessMonitor::CpuTimes> ProcessMonitor::readCpuTimes(pid_t pid)
{
    std::ifstream f(procPath(pid, "stat"));
    if (!f.is_open()) return std::nullopt;

    std::string line;
    if (!std::getline(f, line)) return std::nullopt;

    // comm 可能含空格，从最后一个 ')' 之后开始解析；其后第 12、13 个字段为 utime、stime
    const auto close = line.rfind(')');
    if (close == std::string::npos) return std::nullopt;

    std::istringstream ss(line.substr(close + 1));
    std::string tok;
    for (int i = 0; i < 11; ++i)
    {
        if (!(ss >> tok)) return std::nullopt;
    }

    long utime = 0;
    long stime = 0;
    if (!(ss >> utime >> stime)) return std::nullopt;

    const double ticksPerSec = static_cast<double>(sysconf(_SC_CLK_TCK));
    return CpuTimes{static_cast<double>(utime) / ticksPerSec, static_cast<double>(stime) / ticksPerSec};
}

std::optional<std::size_t> ProcessMonitor::readRssBytes(pid_t pid)
{
    std::ifstream f(procPath(pid, "statm"));
    if (!f.is_open()) return std::nullopt;

    std::size_t vmPages = 0;
    std::size_t rssPages = 0;
    if (!(f >> vmPages >> rssPages)) return std::nullopt;

    return rssPages * static_cast<std::size_t>(sysconf(_SC_PAGESIZE));
}

bool ProcessMonitor::sample()
{
    const auto times = readCpuTimes(pid_);
    const auto rss = readRssBytes(pid_);
    if (!times || !rss) return false;

    const double now = nowSeconds();
    const double wallDelta = now - prevWall_;

    ProcessSample s;
    s.wallTimeS = now - startTime_;
    s.rssBytes = *rss;
    if (prevTimes_ && wallDelta > 0.0)
    {
        const double cpuDelta = (times->userS - prevTimes_->userS) + (times->systemS - prevTimes_->systemS);
        s.cpuPercent = cpuDelta / wallDelta * 100.0;
    }

    samples_.push_back(s);
    prevTimes_ = times;
    prevWall_ = now;
    return true;
}

std::size_t ProcessMonitor::peakRssBytes() const
{
    std::size_t peak = 0;
    for (const auto &s : samples_)
    {
        if (s.rssBytes > peak) peak = s.rssBytes;
    }
    return peak;
}

double ProcessMonitor::averageCpuPercent() const
{
    if (samples_.empty()) return 0.0;

    double sum = 0.0;
    for (const auto &s : samples_) sum += s.cpuPercent;
    return sum / static_cast<double>(samples_.size());
}
