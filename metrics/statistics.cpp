#include "statistics.h"

#include <algorithm>
#include <cmath>

Eigen::Map<const Eigen::ArrayXd> Statistics::asArray(const std::vector<double> &samples)
{
    return Eigen::Map<const Eigen::ArrayXd>(samples.data(), static_cast<Eigen::Index>(samples.size()));
}

ErrorStats Statistics::describe(const std::vector<double> &samples)
{
    ErrorStats stats;
    if (samples.empty()) return stats;

    auto a = asArray(samples);
    const double m = a.mean();

    stats.mean = m;
    stats.max = a.maxCoeff();
    stats.min = a.minCoeff();
    stats.std = std::sqrt((a - m).square().mean());
    return stats;
}

std::optional<double> Statistics::mean(const std::vector<double> &samples)
{
    if (samples.empty()) return std::nullopt;
    return asArray(samples).mean();
}

std::optional<double> Statistics::rms(const std::vector<double> &samples)
{
    if (samples.empty()) return std::nullopt;
    return std::sqrt(asArray(samples).square().mean());
}

std::optional<double> Statistics::range(const std::vector<double> &samples)
{
    if (samples.empty()) return std::nullopt;
    auto a = asArray(samples);
    return a.maxCoeff() - a.minCoeff();
}

std::optional<double> Statistics::meanOfValid(const FieldValues &values)
{
    std::vector<std::optional<double>> flat;
    flat.reserve(values.size());
    for (const auto &kv : values)
    {
        flat.push_back(kv.second);
    }
    return meanOfValid(flat);
}

std::optional<double> Statistics::meanOfValid(const std::vector<std::optional<double>> &values)
{
    std::vector<double> valid;
    for (const auto &v : values)
    {
        if (v && std::isfinite(*v)) valid.push_back(*v);
    }
    return mean(valid);
}

std::optional<double> Statistics::pearson(const std::vector<double> &x, const std::vector<double> &y)
{
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;

    auto ax = asArray(x);
    auto ay = asArray(y);
    const Eigen::ArrayXd dx = ax - ax.mean();
    const Eigen::ArrayXd dy = ay - ay.mean();

    const double denom = std::sqrt(dx.square().sum() * dy.square().sum());
    if (!(denom > 0.0) || !std::isfinite(denom)) return std::nullopt;

    return std::clamp((dx * dy).sum() / denom, -1.0, 1.0);
}

Statistics::Histogram Statistics::histogram(const std::vector<double> &values, int bins)
{
    Histogram h;
    if (bins < 1) return h;

    double lo = 0.0;
    double hi = 1.0;
    if (!values.empty())
    {
        auto a = asArray(values);
        lo = a.minCoeff();
        hi = a.maxCoeff();
    }
    if (lo == hi)
    {
        lo -= 0.5;
        hi += 0.5;
    }

    const double width = hi - lo;
    if (std::isfinite(width))
    {
        Eigen::VectorXd edges = Eigen::VectorXd::LinSpaced(bins + 1, lo, hi);
        h.edges.assign(edges.data(), edges.data() + edges.size());
    }
    else
    {
        // 取值跨度超出 double 表示范围，先缩放再求步长
        const double step = hi / bins - lo / bins;
        h.edges.resize(static_cast<std::size_t>(bins) + 1);
        for (int i = 0; i <= bins; ++i) h.edges[static_cast<std::size_t>(i)] = lo + i * step;
    }
    h.edges.front() = lo;
    h.edges.back() = hi;
    h.counts.assign(static_cast<std::size_t>(bins), 0.0);

    const double norm = static_cast<double>(bins) / width;
    for (double v : values)
    {
        if (!(v >= lo && v <= hi)) continue;

        int idx = -1;
        const double scaled = (v - lo) * norm;
        if (std::isfinite(width))
        {
            // 先按比例估计下标，再用边界修正舍入误差
            idx = std::min(static_cast<int>(scaled), bins - 1);
            if (idx > 0 && v < h.edges[idx]) --idx;
            if (idx < bins - 1 && v >= h.edges[idx + 1]) ++idx;
        }
        else
        {
            idx = binIndex(h.edges, v);
        }
        if (idx < 0) continue;

        h.counts[static_cast<std::size_t>(idx)] += 1.0;
    }
    return h;
}

int Statistics::binIndex(const std::vector<double> &edges, double value)
{
    if (edges.size() < 2) return -1;

    auto pos = std::upper_bound(edges.begin(), edges.end(), value) - edges.begin();
    if (value == edges.back()) --pos;

    const auto bin = pos - 1;
    if (bin < 0 || bin >= static_cast<long>(edges.size()) - 1) return -1;
    return static_cast<int>(bin);
}

double Statistics::entropy(const std::vector<double> &counts)
{
    double total = 0.0;
    for (double c : counts) total += c;
    if (!(total > 0.0)) return 0.0;

    double h = 0.0;
    for (double c : counts)
    {
        if (c <= 0.0) continue;
        const double p = c / total;
        h -= p * std::log(p);
    }
    return h;
}
