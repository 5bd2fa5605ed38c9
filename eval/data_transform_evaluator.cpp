#include "data_transform_evaluator.h"

#include <set>
#include <utility>

#include "io/dataset_loader.h"
#include "metrics/coordinate_metrics.h"
#include "metrics/efficiency_metrics.h"
#include "metrics/information_metrics.h"
#include "metrics/numerical_metrics.h"
#include "metrics/sensor_error_metrics.h"
#include "metrics/signal_metrics.h"
#include "metrics/structural_metrics.h"
#include "metrics/temporal_metrics.h"
#include "utils/exceptions.h"
#include "utils/logger.h"

DataTransformEvaluator::DataTransformEvaluator(const std::string &groundTruthDir,
                                               const std::string &convertedDir,
                                               EvalConfig config)
    : catalog_(groundTruthDir, convertedDir), config_(std::move(config))
{
}

void DataTransformEvaluator::setBenchmarkResults(const BenchmarkResults &results)
{
    benchmark_ = results;
}

std::vector<DataTransformEvaluator::LoadedPair> DataTransformEvaluator::loadPairs() const
{
    std::vector<LoadedPair> loaded;
    loaded.reserve(catalog_.pairs().size());

    for (const auto &files : catalog_.pairs())
    {
        LoadedPair pair{files,
                        DatasetLoader::loadFile(files.groundTruthPath, files.category),
                        DatasetLoader::loadFile(files.convertedPath, files.category)};
        loaded.push_back(std::move(pair));
    }
    return loaded;
}

SchemaDocument DataTransformEvaluator::resolveSchema(const std::vector<LoadedPair> &pairs) const
{
    const std::string path = config_.schemaPath().empty()
                             ? SchemaLoader::sidecarPath(catalog_.groundTruthDir())
                             : config_.schemaPath();

    if (auto schema = SchemaLoader::load(path))
    {
        return *schema;
    }
    if (!config_.schemaPath().empty())
    {
        throw nav_eval::FileException("open schema", path);
    }

    // 没有 schema 说明文件时，以真值中出现过的数值字段并集作为必需字段
    LOG_INFO("No schema documentation found, inferring required fields from ground truth");

    SchemaDocument schema;
    schema.inferred = true;
    for (const auto category : {SensorCategory::Gnss, SensorCategory::Imu})
    {
        std::set<std::string> fields;
        for (const auto &file : catalog_.groundTruthFiles(category))
        {
            const LoadedPair *known = nullptr;
            for (const auto &p : pairs)
            {
                if (p.files.groundTruthPath == file) known = &p;
            }

            if (known)
            {
                StructuralMetrics::collectObservedFields(known->groundTruth, fields);
            }
            else
            {
                StructuralMetrics::collectObservedFields(DatasetLoader::loadFile(file, category), fields);
            }
        }
        schema.setRequired(category, fields);
    }
    return schema;
}

void DataTransformEvaluator::evaluatePair(const LoadedPair &pair, const SchemaDocument &schema,
                                          ReportBuilder &builder) const
{
    const auto &name = pair.files.name;
    const auto &gt = pair.groundTruth;
    const auto &conv = pair.converted;
    const auto &tol = config_.tolerances();

    LOG_INFO_STREAM() << "Evaluating " << name << " (" << gt.size() << " ground truth / "
                      << conv.size() << " converted records)";

    // 数值字段误差
    builder.addFieldErrors(pair.files.category, name,
                           NumericalMetrics::fieldErrors(gt, conv, config_.fields(pair.files.category), tol.field));

    if (pair.files.category == SensorCategory::Gnss)
    {
        builder.addPositionError(name, SensorErrorMetrics::positionError(gt, conv, tol.position));
        builder.addCoordinateConsistency(name, CoordinateMetrics::consistency(gt, conv, tol.coordinate));
    }
    else
    {
        builder.addOrientationError(name, SensorErrorMetrics::orientationError(gt, conv, tol.orientation));
        builder.addAccelerationError(name, SensorErrorMetrics::accelerationError(gt, conv, tol.acceleration));
    }

    // 时间
    builder.addTimestampError(name, TemporalMetrics::timestampError(gt, conv));
    builder.addSamplingRate(name, TemporalMetrics::samplingRate(gt, conv));

    // 结构
    const auto &required = schema.required(pair.files.category);
    if (!required.empty())
    {
        builder.addSchemaCompliance(name, StructuralMetrics::schemaCompliance(conv, required));
    }
    builder.addFieldMapping(name, StructuralMetrics::fieldMapping(gt, conv));

    // 信息保持
    const auto fields = StructuralMetrics::observedFields(gt);
    builder.addEntropy(name, InformationMetrics::entropyRatios(gt, conv, fields, config_.histogram()));
    builder.addMutualInformation(name, InformationMetrics::mutualInformation(gt, conv, fields, tol.information,
                                                                             config_.histogram()));
    builder.addSignalFidelity(name, SignalMetrics::evaluate(gt, conv, fields, tol.signal, config_.spectral()));

    builder.addSizeRatio(name, EfficiencyMetrics::sizeRatio(gt.sizeBytes, conv.sizeBytes));
}

void DataTransformEvaluator::evaluateCrossSensor(const std::vector<LoadedPair> &pairs,
                                                 ReportBuilder &builder) const
{
    const LoadedPair *gnss = nullptr;
    const LoadedPair *imu = nullptr;
    for (const auto &p : pairs)
    {
        if (!gnss && p.files.category == SensorCategory::Gnss) gnss = &p;
        if (!imu && p.files.category == SensorCategory::Imu) imu = &p;
    }

    if (!gnss || !imu)
    {
        LOG_DEBUG("GNSS/IMU alignment skipped: need one file pair of each category");
        return;
    }

    LOG_INFO_STREAM() << "GNSS/IMU alignment: " << gnss->files.name << " vs " << imu->files.name;
    builder.setCrossSensorAlignment(TemporalMetrics::crossSensorAlignment(gnss->groundTruth, imu->groundTruth,
                                                                          gnss->converted, imu->converted));
}

EvaluationReport DataTransformEvaluator::evaluateAll()
{
    ReportBuilder builder;

    LOG_INFO("Loading datasets");
    const auto pairs = loadPairs();
    const auto schema = resolveSchema(pairs);

    LOG_INFO("Computing metrics");
    for (const auto &pair : pairs)
    {
        evaluatePair(pair, schema, builder);
    }
    evaluateCrossSensor(pairs, builder);

    if (benchmark_)
    {
        builder.setBenchmark(*benchmark_);
    }

    LOG_INFO("Generating summary");
    return builder.finalize();
}
