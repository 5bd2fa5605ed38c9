#include "time_aligner.h"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace
{
using Entry = std::pair<double, std::size_t>;

bool timeLess(const Entry &e, double t)
{
    return e.first < t;
}
} // namespace

TimeAligner::TimeAligner(const Dataset &target)
{
    sorted_.reserve(target.size());
    for (std::size_t i = 0; i < target.records.size(); ++i)
    {
        const auto &t = target.records[i].time;
        if (t) sorted_.emplace_back(*t, i);
    }
    sortIndex();
}

TimeAligner::TimeAligner(const std::vector<double> &timestamps)
{
    sorted_.reserve(timestamps.size());
    for (std::size_t i = 0; i < timestamps.size(); ++i)
    {
        sorted_.emplace_back(timestamps[i], i);
    }
    sortIndex();
}

void TimeAligner::sortIndex()
{
    // 稳定排序保证相同时间戳保持原始顺序
    std::stable_sort(sorted_.begin(), sorted_.end(),
                     [](const Entry &a, const Entry &b) { return a.first < b.first; });
}

std::optional<TimeAligner::Match> TimeAligner::nearest(double t) const
{
    if (sorted_.empty() || !std::isfinite(t)) return std::nullopt;

    std::optional<Match> best;

    auto consider = [&](std::vector<Entry>::const_iterator cand)
    {
        // 取同一时间戳中原始下标最小的一条
        auto first = std::lower_bound(sorted_.begin(), sorted_.end(), cand->first, timeLess);
        const double diff = std::abs(t - first->first);
        if (!best || diff < best->timeDiff ||
            (diff == best->timeDiff && first->second < best->index))
        {
            best = Match{first->second, diff};
        }
    };

    auto upper = std::lower_bound(sorted_.begin(), sorted_.end(), t, timeLess);
    if (upper != sorted_.end()) consider(upper);
    if (upper != sorted_.begin()) consider(std::prev(upper));

    return best;
}

std::optional<TimeAligner::Match> TimeAligner::match(const std::optional<double> &t, double tolerance) const
{
    if (!t) return std::nullopt;

    auto m = nearest(*t);
    if (!m || !(m->timeDiff < tolerance)) return std::nullopt;
    return m;
}

std::vector<TimeAligner::AlignedPair> TimeAligner::align(const Dataset &groundTruth, double tolerance) const
{
    std::vector<AlignedPair> pairs;
    pairs.reserve(groundTruth.size());

    for (std::size_t i = 0; i < groundTruth.records.size(); ++i)
    {
        auto m = match(groundTruth.records[i].time, tolerance);
        if (m)
        {
            pairs.push_back({i, m->index, m->timeDiff});
        }
    }
    return pairs;
}

bool TimeAligner::empty() const
{
    return sorted_.empty();
}

std::vector<double> TimeAligner::timestamps(const Dataset &dataset)
{
    std::vector<double> result;
    result.reserve(dataset.size());
    for (const auto &r : dataset.records)
    {
        if (r.time) result.push_back(*r.time);
    }
    return result;
}
