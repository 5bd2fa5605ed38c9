#ifndef NAV_EVAL_EVAL_CONFIG_H
#define NAV_EVAL_EVAL_CONFIG_H

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "measurement/nav_record.h"
#include "utils/constants.h"
#include "utils/logger.h"

// 各指标的时间对齐容差 (s)，匹配时间差严格小于容差才接受
struct AlignmentTolerances
{
    double field = FIELD_ALIGN_TOL;
    double position = POSITION_ALIGN_TOL;
    double orientation = FIELD_ALIGN_TOL;
    double acceleration = FIELD_ALIGN_TOL;
    double coordinate = FIELD_ALIGN_TOL;
    double information = FIELD_ALIGN_TOL;
    double signal = FIELD_ALIGN_TOL;
};

struct HistogramOptions
{
    int maxBins = 20;
    int samplesPerBin = 5;
};

struct SpectralOptions
{
    std::size_t minSamples = 10;
    std::size_t maxSegment = 256;
};

class EvalConfig
{
public:
    EvalConfig();

    explicit EvalConfig(const std::string&);

    ~EvalConfig() = default;

    EvalConfig(const EvalConfig&) = default;

    EvalConfig& operator=(const EvalConfig&) = default;

    EvalConfig(EvalConfig&&) = default;

    EvalConfig& operator=(EvalConfig&&) = default;

    [[nodiscard]] const AlignmentTolerances& tolerances() const;

    [[nodiscard]] const std::vector<std::string>& fields(SensorCategory category) const;

    [[nodiscard]] const HistogramOptions& histogram() const;

    [[nodiscard]] const SpectralOptions& spectral() const;

    [[nodiscard]] const std::string& schemaPath() const;

    [[nodiscard]] Logger::Level logLevel() const;

    [[nodiscard]] const std::string& logFile() const;

    void setTolerances(const AlignmentTolerances&);

    void setSchemaPath(const std::string&);

    void validate() const;

private:
    void loadTolerances(const YAML::Node& node);

    void loadFields(const YAML::Node& node);

    void loadHistogram(const YAML::Node& node);

    void loadSpectral(const YAML::Node& node);

    void loadLogging(const YAML::Node& node);

private:
    AlignmentTolerances tolerances_;
    std::vector<std::string> gnssFields_;
    std::vector<std::string> imuFields_;
    HistogramOptions histogram_;
    SpectralOptions spectral_;
    std::string schemaPath_;
    Logger::Level logLevel_ = Logger::Level::INFO;
    std::string logFile_;
};
#endif //NAV_EVAL_EVAL_CONFIG_H
