#include "report_builder.h"

#include <utility>
#include <vector>

#include "metrics/statistics.h"
#include "utils/exceptions.h"

EvaluationReport &ReportBuilder::report()
{
    if (finalized_)
    {
        throw nav_eval::BaseException("Report already finalized");
    }
    return report_;
}

void ReportBuilder::addFieldErrors(SensorCategory category, const std::string &file, FieldErrorTable table)
{
    auto &numerical = report().dataFieldAccuracy.numerical;
    auto &target = category == SensorCategory::Gnss ? numerical.gnss : numerical.imu;
    target[file] = std::move(table);
}

void ReportBuilder::addPositionError(const std::string &file, const SensorErrorStats &stats)
{
    report().dataFieldAccuracy.sensorErrors.gnssPosition[file] = stats;
}

void ReportBuilder::addOrientationError(const std::string &file, const SensorErrorStats &stats)
{
    report().dataFieldAccuracy.sensorErrors.imuOrientation[file] = stats;
}

void ReportBuilder::addAccelerationError(const std::string &file, const SensorErrorStats &stats)
{
    report().dataFieldAccuracy.sensorErrors.imuAcceleration[file] = stats;
}

void ReportBuilder::addCoordinateConsistency(const std::string &file, const CoordinateConsistency &result)
{
    report().dataFieldAccuracy.coordinate.coordinateConversionError[file] = result;
}

void ReportBuilder::addTimestampError(const std::string &file, const TimestampError &result)
{
    report().dataFieldAccuracy.temporal.timestampConversionError[file] = result;
}

void ReportBuilder::addSamplingRate(const std::string &file, const SamplingRate &result)
{
    report().dataFieldAccuracy.temporal.samplingRatePreservation[file] = result;
}

void ReportBuilder::setCrossSensorAlignment(const CrossSensorAlignment &result)
{
    report().dataFieldAccuracy.temporal.gnssImuAlignment = result;
}

void ReportBuilder::addSchemaCompliance(const std::string &file, const SchemaCompliance &result)
{
    report().dataFieldAccuracy.structural.schemaComplianceScore[file] = result;
}

void ReportBuilder::addFieldMapping(const std::string &file, const FieldMapping &result)
{
    report().dataFieldAccuracy.structural.fieldMappingAccuracy[file] = result;
}

void ReportBuilder::addEntropy(const std::string &file, EntropyResult result)
{
    report().informationPreservation.content.entropyRatio[file] = std::move(result);
}

void ReportBuilder::addMutualInformation(const std::string &file, MutualInformationResult result)
{
    report().informationPreservation.content.mutualInformation[file] = std::move(result);
}

void ReportBuilder::addSignalFidelity(const std::string &file, SignalFidelity result)
{
    auto &signal = report().informationPreservation.signalFidelity;
    signal.snr[file] = std::move(result.snr);
    signal.dynamicRange[file] = std::move(result.dynamicRange);
    if (result.frequencyResponse)
    {
        signal.frequencyResponse[file] = std::move(*result.frequencyResponse);
    }
}

void ReportBuilder::addSizeRatio(const std::string &file, const SizeRatio &result)
{
    report().efficiency.sizeRatio[file] = result;
}

void ReportBuilder::setBenchmark(const BenchmarkResults &results)
{
    auto &efficiency = report().efficiency;
    efficiency.transformationTimeS = results.totalTimeSeconds;
    efficiency.cpuUsagePercent = results.averageCpuPercent;
    efficiency.memoryUsageMb = results.peakMemoryUsageMb;
}

ReportSummary ReportBuilder::summarize(const EvaluationReport &report)
{
    ReportSummary summary;

    // 各文件各字段的 MAE/RMSE/NRMSE 直接平均
    auto numerical = [](const PerFile<FieldErrorTable> &files,
                        std::optional<double> &mae, std::optional<double> &rmse, std::optional<double> &nrmse)
    {
        std::vector<std::optional<double>> maes, rmses, nrmses;
        for (const auto &file : files)
        {
            for (const auto &field : file.second)
            {
                maes.push_back(field.second.mae);
                rmses.push_back(field.second.rmse);
                nrmses.push_back(field.second.nrmse);
            }
        }
        mae = Statistics::meanOfValid(maes);
        rmse = Statistics::meanOfValid(rmses);
        nrmse = Statistics::meanOfValid(nrmses);
    };

    const auto &num = report.dataFieldAccuracy.numerical;
    numerical(num.gnss, summary.gnssAvgMae, summary.gnssAvgRmse, summary.gnssAvgNrmse);
    numerical(num.imu, summary.imuAvgMae, summary.imuAvgRmse, summary.imuAvgNrmse);

    std::vector<std::optional<double>> entropy;
    for (const auto &file : report.informationPreservation.content.entropyRatio)
    {
        entropy.push_back(file.second.averageEntropyRatio);
    }
    summary.avgEntropyRatio = Statistics::meanOfValid(entropy);

    std::vector<std::optional<double>> snr;
    for (const auto &file : report.informationPreservation.signalFidelity.snr)
    {
        snr.push_back(file.second.averageSnrDb);
    }
    summary.avgSnrDb = Statistics::meanOfValid(snr);

    std::vector<std::optional<double>> size;
    for (const auto &file : report.efficiency.sizeRatio)
    {
        size.push_back(file.second.sizeRatio);
    }
    summary.avgSizeRatio = Statistics::meanOfValid(size);

    return summary;
}

EvaluationReport ReportBuilder::finalize()
{
    report().summary = summarize(report_);
    finalized_ = true;
    return std::move(report_);
}
