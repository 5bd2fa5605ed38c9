#include "report_writer.h"

#include <cmath>
#include <fstream>

#include "utils/exceptions.h"

using nlohmann::json;

namespace
{
json errorStats(const ErrorStats &s, const std::string &quantity, const std::string &unit)
{
    return {
        {"mean_" + quantity + "_" + unit, ReportWriter::value(s.mean)},
        {"max_" + quantity + "_" + unit, ReportWriter::value(s.max)},
        {"min_" + quantity + "_" + unit, ReportWriter::value(s.min)},
        {"std_" + quantity + "_" + unit, ReportWriter::value(s.std)}};
}

json sensorError(const SensorErrorStats &s, const std::string &quantity, const std::string &unit)
{
    json j = errorStats(s.error, quantity, unit);
    j["num_matched_points"] = s.numMatchedPoints;
    j["matched_percentage"] = s.matchedPercentage;
    return j;
}

template<typename T, typename F>
json perFile(const PerFile<T> &files, F convert)
{
    json j = json::object();
    for (const auto &kv : files)
    {
        j[kv.first] = convert(kv.second);
    }
    return j;
}

json dataFieldAccuracy(const DataFieldAccuracy &acc)
{
    auto fieldTable = [](const FieldErrorTable &table)
    {
        json j = json::object();
        for (const auto &kv : table)
        {
            j[kv.first] = ReportWriter::toJson(kv.second);
        }
        return j;
    };

    json numerical = {
        {"gnss", perFile(acc.numerical.gnss, fieldTable)},
        {"imu", perFile(acc.numerical.imu, fieldTable)}};

    json sensorErrors = {
        {"gnss_position", perFile(acc.sensorErrors.gnssPosition,
                                  [](const SensorErrorStats &s) { return sensorError(s, "position_error", "m"); })},
        {"imu_orientation", perFile(acc.sensorErrors.imuOrientation,
                                    [](const SensorErrorStats &s) { return sensorError(s, "orientation_error", "deg"); })},
        {"imu_acceleration", perFile(acc.sensorErrors.imuAcceleration,
                                     [](const SensorErrorStats &s) { return sensorError(s, "acceleration_error", "mps2"); })}};

    json coordinate = {
        {"coordinate_conversion_error", perFile(acc.coordinate.coordinateConversionError,
            [](const CoordinateConsistency &c)
            {
                json j = errorStats(c.error, "error", "m");
                j["num_samples"] = c.numSamples;
                return j;
            })}};

    json alignment = json::object();
    if (acc.temporal.gnssImuAlignment)
    {
        const auto &a = *acc.temporal.gnssImuAlignment;
        alignment["gnss_imu"] = {
            {"ground_truth_mean_error_us", ReportWriter::value(a.groundTruthMeanErrorUs)},
            {"converted_mean_error_us", ReportWriter::value(a.convertedMeanErrorUs)},
            {"alignment_error_difference_us", ReportWriter::value(a.alignmentErrorDifferenceUs)}};
    }

    json temporal = {
        {"timestamp_conversion_error", perFile(acc.temporal.timestampConversionError,
            [](const TimestampError &t)
            {
                json j = errorStats(t.error, "error", "us");
                j["num_samples"] = t.numSamples;
                return j;
            })},
        {"sampling_rate_preservation", perFile(acc.temporal.samplingRatePreservation,
            [](const SamplingRate &r)
            {
                return json{
                    {"ground_truth_rate_hz", ReportWriter::value(r.groundTruthRateHz)},
                    {"converted_rate_hz", ReportWriter::value(r.convertedRateHz)},
                    {"relative_error", ReportWriter::value(r.relativeError)}};
            })},
        {"temporal_alignment_error", alignment}};

    json structural = {
        {"schema_compliance_score", perFile(acc.structural.schemaComplianceScore,
            [](const SchemaCompliance &s)
            {
                return json{
                    {"compliance_score", ReportWriter::value(s.complianceScore)},
                    {"compliant_fields", s.compliantFields},
                    {"total_fields", s.totalFields}};
            })},
        {"field_mapping_accuracy", perFile(acc.structural.fieldMappingAccuracy,
            [](const FieldMapping &m)
            {
                return json{
                    {"mapping_accuracy", m.mappingAccuracy},
                    {"mapped_fields", m.mappedFields},
                    {"total_fields", m.totalFields}};
            })}};

    return {
        {"numerical", numerical},
        {"sensor_errors", sensorErrors},
        {"coordinate", coordinate},
        {"temporal", temporal},
        {"structural", structural}};
}

json informationPreservation(const InformationPreservation &info)
{
    json content = {
        {"entropy_ratio", perFile(info.content.entropyRatio,
            [](const EntropyResult &e)
            {
                return json{
                    {"average_entropy_ratio", ReportWriter::value(e.averageEntropyRatio)},
                    {"field_entropy_ratios", ReportWriter::toJson(e.fieldEntropyRatios)}};
            })},
        {"mutual_information", perFile(info.content.mutualInformation,
            [](const MutualInformationResult &m)
            {
                return json{
                    {"average_mutual_information", ReportWriter::value(m.averageMutualInformation)},
                    {"field_mutual_information", ReportWriter::toJson(m.fieldMutualInformation)}};
            })}};

    json signal = {
        {"snr", perFile(info.signalFidelity.snr,
            [](const SnrResult &s)
            {
                return json{
                    {"average_snr_db", ReportWriter::value(s.averageSnrDb)},
                    {"field_snr_db", ReportWriter::toJson(s.fieldSnrDb)}};
            })},
        {"frequency_response", perFile(info.signalFidelity.frequencyResponse,
            [](const FrequencyResponse &f)
            {
                return json{
                    {"average_frequency_correlation", ReportWriter::value(f.averageFrequencyCorrelation)},
                    {"field_frequency_correlation", ReportWriter::toJson(f.fieldFrequencyCorrelation)}};
            })},
        {"dynamic_range", perFile(info.signalFidelity.dynamicRange,
            [](const DynamicRange &d)
            {
                return json{
                    {"average_range_ratio", ReportWriter::value(d.averageRangeRatio)},
                    {"field_range_ratio", ReportWriter::toJson(d.fieldRangeRatio)}};
            })}};

    json reconstruction = {
        {"round_trip_error", ReportWriter::value(info.reconstruction.roundTripError)},
        {"lossy_compression_metrics", ReportWriter::value(info.reconstruction.lossyCompressionMetrics)}};

    return {
        {"content", content},
        {"signal_fidelity", signal},
        {"reconstruction", reconstruction}};
}

json robustness(const Robustness &r)
{
    return {
        {"input_variation", {
            {"format_variation_robustness", ReportWriter::value(r.inputVariation.formatVariationRobustness)},
            {"vendor_variation_robustness", ReportWriter::value(r.inputVariation.vendorVariationRobustness)},
            {"configuration_variation_robustness",
             ReportWriter::value(r.inputVariation.configurationVariationRobustness)}}},
        {"data_quality", {
            {"missing_data_handling", ReportWriter::value(r.dataQuality.missingDataHandling)},
            {"outlier_handling", ReportWriter::value(r.dataQuality.outlierHandling)},
            {"noise_handling", ReportWriter::value(r.dataQuality.noiseHandling)}}},
        {"edge_case", {
            {"boundary_value_handling", ReportWriter::value(r.edgeCase.boundaryValueHandling)},
            {"special_value_handling", ReportWriter::value(r.edgeCase.specialValueHandling)},
            {"discontinuity_handling", ReportWriter::value(r.edgeCase.discontinuityHandling)}}}};
}

json efficiency(const Efficiency &e)
{
    return {
        {"transformation_time_s", ReportWriter::value(e.transformationTimeS)},
        {"cpu_usage_percent", ReportWriter::value(e.cpuUsagePercent)},
        {"memory_usage_mb", ReportWriter::value(e.memoryUsageMb)},
        {"size_ratio", perFile(e.sizeRatio,
            [](const SizeRatio &s)
            {
                return json{
                    {"ground_truth_size_bytes", s.groundTruthSizeBytes},
                    {"converted_size_bytes", s.convertedSizeBytes},
                    {"size_ratio", ReportWriter::value(s.sizeRatio)}};
            })}};
}

json fgoReadiness(const FgoReadiness &f)
{
    return {
        {"factor_completeness", ReportWriter::value(f.factorCompleteness)},
        {"constraint_quality", ReportWriter::value(f.constraintQuality)},
        {"uncertainty_representation", ReportWriter::value(f.uncertaintyRepresentation)}};
}

json summary(const ReportSummary &s)
{
    return {
        {"numerical_field_accuracy", {
            {"gnss_avg_mae", ReportWriter::value(s.gnssAvgMae)},
            {"gnss_avg_rmse", ReportWriter::value(s.gnssAvgRmse)},
            {"gnss_avg_nrmse", ReportWriter::value(s.gnssAvgNrmse)},
            {"imu_avg_mae", ReportWriter::value(s.imuAvgMae)},
            {"imu_avg_rmse", ReportWriter::value(s.imuAvgRmse)},
            {"imu_avg_nrmse", ReportWriter::value(s.imuAvgNrmse)}}},
        {"information_preservation", {
            {"avg_entropy_ratio", ReportWriter::value(s.avgEntropyRatio)},
            {"avg_snr_db", ReportWriter::value(s.avgSnrDb)}}},
        {"avg_size_ratio", ReportWriter::value(s.avgSizeRatio)}};
}
} // namespace

json ReportWriter::value(const std::optional<double> &v)
{
    if (!v || std::isnan(*v)) return nullptr;
    if (std::isinf(*v)) return *v > 0 ? "Infinity" : "-Infinity";
    return *v;
}

json ReportWriter::toJson(const FieldErrorStats &stats)
{
    return {
        {"mae", value(stats.mae)},
        {"rmse", value(stats.rmse)},
        {"nrmse", value(stats.nrmse)},
        {"max_error", value(stats.maxError)},
        {"min_error", value(stats.minError)},
        {"std_error", value(stats.stdError)},
        {"num_matched_points", stats.numMatchedPoints},
        {"matched_percentage", stats.matchedPercentage}};
}

json ReportWriter::toJson(const FieldValues &values)
{
    json j = json::object();
    for (const auto &kv : values)
    {
        j[kv.first] = value(kv.second);
    }
    return j;
}

json ReportWriter::toJson(const EvaluationReport &report)
{
    return {
        {"data_field_accuracy", dataFieldAccuracy(report.dataFieldAccuracy)},
        {"information_preservation", informationPreservation(report.informationPreservation)},
        {"robustness", robustness(report.robustness)},
        {"efficiency", efficiency(report.efficiency)},
        {"fgo_readiness", fgoReadiness(report.fgoReadiness)},
        {"summary", summary(report.summary)}};
}

void ReportWriter::write(const EvaluationReport &report, std::ostream &os)
{
    os << toJson(report).dump(2) << "\n";
}

void ReportWriter::write(const EvaluationReport &report, const std::string &path)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        throw nav_eval::FileException("write", path);
    }
    write(report, file);
    if (!file)
    {
        throw nav_eval::FileException("write", path);
    }
}
