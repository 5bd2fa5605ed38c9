#ifndef NAV_EVAL_EVALUATION_REPORT_H
#define NAV_EVAL_EVALUATION_REPORT_H

#include <map>
#include <optional>
#include <string>

#include "metrics/metric_types.h"

// 以文件名为键
template<typename T>
using PerFile = std::map<std::string, T>;

using FieldErrorTable = std::map<std::string, FieldErrorStats>;

struct NumericalAccuracy
{
    PerFile<FieldErrorTable> gnss;
    PerFile<FieldErrorTable> imu;
};

struct SensorErrors
{
    PerFile<SensorErrorStats> gnssPosition;
    PerFile<SensorErrorStats> imuOrientation;
    PerFile<SensorErrorStats> imuAcceleration;
};

struct CoordinateAccuracy
{
    PerFile<CoordinateConsistency> coordinateConversionError;
};

struct TemporalAccuracy
{
    PerFile<TimestampError> timestampConversionError;
    PerFile<SamplingRate> samplingRatePreservation;
    std::optional<CrossSensorAlignment> gnssImuAlignment;  // 没有 GNSS/IMU 文件对时为空
};

struct StructuralAccuracy
{
    PerFile<SchemaCompliance> schemaComplianceScore;
    PerFile<FieldMapping> fieldMappingAccuracy;
};

struct DataFieldAccuracy
{
    NumericalAccuracy numerical;
    SensorErrors sensorErrors;
    CoordinateAccuracy coordinate;
    TemporalAccuracy temporal;
    StructuralAccuracy structural;
};

struct InformationContent
{
    PerFile<EntropyResult> entropyRatio;
    PerFile<MutualInformationResult> mutualInformation;
};

struct SignalFidelityReport
{
    PerFile<SnrResult> snr;
    PerFile<FrequencyResponse> frequencyResponse;
    PerFile<DynamicRange> dynamicRange;
};

// 以下未计算的槽位一律为空，序列化为 null

struct Reconstruction
{
    std::optional<double> roundTripError;
    std::optional<double> lossyCompressionMetrics;
};

struct InformationPreservation
{
    InformationContent content;
    SignalFidelityReport signalFidelity;
    Reconstruction reconstruction;
};

struct Robustness
{
    struct InputVariation
    {
        std::optional<double> formatVariationRobustness;
        std::optional<double> vendorVariationRobustness;
        std::optional<double> configurationVariationRobustness;
    };

    struct DataQuality
    {
        std::optional<double> missingDataHandling;
        std::optional<double> outlierHandling;
        std::optional<double> noiseHandling;
    };

    struct EdgeCase
    {
        std::optional<double> boundaryValueHandling;
        std::optional<double> specialValueHandling;
        std::optional<double> discontinuityHandling;
    };

    InputVariation inputVariation;
    DataQuality dataQuality;
    EdgeCase edgeCase;
};

struct Efficiency
{
    std::optional<double> transformationTimeS;
    std::optional<double> cpuUsagePercent;
    std::optional<double> memoryUsageMb;
    PerFile<SizeRatio> sizeRatio;
};

struct FgoReadiness
{
    std::optional<double> factorCompleteness;
    std::optional<double> constraintQuality;
    std::optional<double> uncertaintyRepresentation;
};

struct ReportSummary
{
    std::optional<double> gnssAvgMae;
    std::optional<double> gnssAvgRmse;
    std::optional<double> gnssAvgNrmse;
    std::optional<double> imuAvgMae;
    std::optional<double> imuAvgRmse;
    std::optional<double> imuAvgNrmse;
    std::optional<double> avgEntropyRatio;
    std::optional<double> avgSnrDb;
    std::optional<double> avgSizeRatio;
};

struct EvaluationReport
{
    DataFieldAccuracy dataFieldAccuracy;
    InformationPreservation informationPreservation;
    Robustness robustness;
    Efficiency efficiency;
    FgoReadiness fgoReadiness;
    ReportSummary summary;
};

#endif //NAV_EVAL_EVALUATION_REPORT_H
