#ifndef NAV_EVAL_METRIC_TYPES_H
#define NAV_EVAL_METRIC_TYPES_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

// 空的 optional 表示“无法计算”，与 0 区分

struct ErrorStats
{
    std::optional<double> mean;
    std::optional<double> max;
    std::optional<double> min;
    std::optional<double> std;
};

// 单个字段的数值误差
struct FieldErrorStats
{
    std::optional<double> mae;
    std::optional<double> rmse;
    std::optional<double> nrmse;
    std::optional<double> maxError;
    std::optional<double> minError;
    std::optional<double> stdError;
    std::size_t numMatchedPoints = 0;
    double matchedPercentage = 0.0;
};

// 位置 (m) / 姿态 (deg) / 加速度 (m/s²) 误差
struct SensorErrorStats
{
    ErrorStats error;
    std::size_t numMatchedPoints = 0;
    double matchedPercentage = 0.0;
};

// 转换后数据自身 LLA 与 ECEF 的一致性 (m)
struct CoordinateConsistency
{
    ErrorStats error;
    std::size_t numSamples = 0;
};

// 最近时间戳误差 (us)
struct TimestampError
{
    ErrorStats error;
    std::size_t numSamples = 0;
};

struct SamplingRate
{
    std::optional<double> groundTruthRateHz;
    std::optional<double> convertedRateHz;
    std::optional<double> relativeError;
};

// GNSS 与 IMU 之间的平均最近时间间隔 (us)
struct CrossSensorAlignment
{
    std::optional<double> groundTruthMeanErrorUs;
    std::optional<double> convertedMeanErrorUs;
    std::optional<double> alignmentErrorDifferenceUs;
};

struct SchemaCompliance
{
    std::optional<double> complianceScore;
    std::size_t compliantFields = 0;
    std::size_t totalFields = 0;
};

struct FieldMapping
{
    double mappingAccuracy = 0.0;
    std::size_t mappedFields = 0;
    std::size_t totalFields = 0;
};

using FieldValues = std::map<std::string, std::optional<double>>;

struct EntropyResult
{
    std::optional<double> averageEntropyRatio;
    FieldValues fieldEntropyRatios;
};

struct MutualInformationResult
{
    std::optional<double> averageMutualInformation;
    FieldValues fieldMutualInformation;
};

// 无噪声时 SNR 为 +inf，不参与平均
struct SnrResult
{
    std::optional<double> averageSnrDb;
    FieldValues fieldSnrDb;
};

struct FrequencyResponse
{
    std::optional<double> averageFrequencyCorrelation;
    FieldValues fieldFrequencyCorrelation;
};

struct DynamicRange
{
    std::optional<double> averageRangeRatio;
    FieldValues fieldRangeRatio;
};

struct SizeRatio
{
    std::uintmax_t groundTruthSizeBytes = 0;
    std::uintmax_t convertedSizeBytes = 0;
    std::optional<double> sizeRatio;
};

#endif //NAV_EVAL_METRIC_TYPES_H
