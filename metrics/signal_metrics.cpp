#include "signal_metrics.h"

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>

#include <Eigen/Core>
#include <unsupported/Eigen/FFT>

#include "measurement/time_aligner.h"
#include "metrics/statistics.h"

std::optional<double> SignalMetrics::snrDb(const AlignedSeries &series)
{
    if (series.empty()) return std::nullopt;

    auto gt = Statistics::asArray(series.groundTruth);
    auto conv = Statistics::asArray(series.converted);

    const double signalPower = gt.square().mean();
    const double noisePower = (gt - conv).square().mean();

    if (!(noisePower > 0.0)) return std::numeric_limits<double>::infinity();
    if (!(signalPower > 0.0)) return std::nullopt;

    return 10.0 * std::log10(signalPower / noisePower);
}

std::vector<double> SignalMetrics::welchPsd(const std::vector<double> &signal, std::size_t maxSegment)
{
    const std::size_t n = signal.size();
    const std::size_t nperseg = std::min(maxSegment, n / 2);
    if (nperseg < 2) return {};

    const std::size_t noverlap = nperseg / 2;
    const std::size_t step = nperseg - noverlap;
    const std::size_t nfreq = nperseg / 2 + 1;

    // 周期 Hann 窗
    Eigen::VectorXd window(nperseg);
    for (std::size_t i = 0; i < nperseg; ++i)
    {
        window[static_cast<Eigen::Index>(i)] = 0.5 - 0.5 * std::cos(2.0 * M_PI * static_cast<double>(i) /
                                                                    static_cast<double>(nperseg));
    }
    const double scale = 1.0 / window.squaredNorm();

    Eigen::FFT<double> fft;
    std::vector<double> frame(nperseg);
    std::vector<std::complex<double>> spectrum;
    Eigen::VectorXd psd = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(nfreq));
    std::size_t segments = 0;

    for (std::size_t start = 0; start + nperseg <= n; start += step)
    {
        Eigen::Map<const Eigen::VectorXd> seg(signal.data() + start, static_cast<Eigen::Index>(nperseg));
        const double segMean = seg.mean();
        for (std::size_t i = 0; i < nperseg; ++i)
        {
            frame[i] = (seg[static_cast<Eigen::Index>(i)] - segMean) * window[static_cast<Eigen::Index>(i)];
        }

        fft.fwd(spectrum, frame);
        for (std::size_t k = 0; k < nfreq; ++k)
        {
            psd[static_cast<Eigen::Index>(k)] += std::norm(spectrum[k]) * scale;
        }
        ++segments;
    }
    psd /= static_cast<double>(segments);

    // 单边谱：直流和偶数段长时的 Nyquist 频点不加倍
    const std::size_t last = (nperseg % 2 == 0) ? nfreq - 1 : nfreq;
    for (std::size_t k = 1; k < last; ++k)
    {
        psd[static_cast<Eigen::Index>(k)] *= 2.0;
    }

    return std::vector<double>(psd.data(), psd.data() + psd.size());
}

std::optional<double> SignalMetrics::psdCorrelation(const AlignedSeries &series, const SpectralOptions &options)
{
    if (series.size() < options.minSamples) return std::nullopt;

    auto gtPsd = welchPsd(series.groundTruth, options.maxSegment);
    auto convPsd = welchPsd(series.converted, options.maxSegment);
    if (gtPsd.empty() || convPsd.empty()) return std::nullopt;

    return Statistics::pearson(gtPsd, convPsd);
}

std::optional<double> SignalMetrics::rangeRatio(const AlignedSeries &series)
{
    auto gtRange = Statistics::range(series.groundTruth);
    auto convRange = Statistics::range(series.converted);
    if (!gtRange || !convRange || !(*gtRange > 0.0)) return std::nullopt;

    return *convRange / *gtRange;
}

SignalFidelity SignalMetrics::evaluate(const Dataset &groundTruth, const Dataset &converted,
                                       const std::set<std::string> &fields, double tolerance,
                                       const SpectralOptions &options)
{
    TimeAligner aligner(converted);
    const auto pairs = aligner.align(groundTruth, tolerance);
    const bool spectral = groundTruth.category == SensorCategory::Imu;

    SignalFidelity result;
    if (spectral) result.frequencyResponse = FrequencyResponse{};

    for (const auto &field : fields)
    {
        auto series = AlignedSeries::collect(groundTruth, converted, pairs, field);

        result.snr.fieldSnrDb[field] = snrDb(series);
        result.dynamicRange.fieldRangeRatio[field] = rangeRatio(series);
        if (spectral)
        {
            result.frequencyResponse->fieldFrequencyCorrelation[field] = psdCorrelation(series, options);
        }
    }

    // meanOfValid 跳过 +inf
    result.snr.averageSnrDb = Statistics::meanOfValid(result.snr.fieldSnrDb);
    result.dynamicRange.averageRangeRatio = Statistics::meanOfValid(result.dynamicRange.fieldRangeRatio);
    if (spectral)
    {
        result.frequencyResponse->averageFrequencyCorrelation =
                Statistics::meanOfValid(result.frequencyResponse->fieldFrequencyCorrelation);
    }
    return result;
}
