#include "eval_config.h"

#include <cmath>
#include <fstream>
#include <filesystem>

#include "utils/exceptions.h"

namespace
{

const std::vector<std::string> kDefaultGnssFields = {
    "position_lla.latitude_deg", "position_lla.longitude_deg", "position_lla.altitude_m",
    "velocity.x", "velocity.y", "velocity.z",
    "dop.hdop", "dop.vdop", "dop.pdop"};

const std::vector<std::string> kDefaultImuFields = {
    "linear_acceleration.x", "linear_acceleration.y", "linear_acceleration.z",
    "angular_velocity.x", "angular_velocity.y", "angular_velocity.z",
    "orientation.w", "orientation.x", "orientation.y", "orientation.z"};

void readTolerance(const YAML::Node& node, const char* key, double& target)
{
    if (node[key]) {
        target = node[key].as<double>();
    }
}

void checkTolerance(const char* key, double value)
{
    if (!std::isfinite(value) || value < 0.0) {
        throw nav_eval::ValidationException(std::string("tolerances.") + key,
            "Tolerance must be finite and non-negative");
    }
}

} // namespace

EvalConfig::EvalConfig() : gnssFields_(kDefaultGnssFields), imuFields_(kDefaultImuFields)
{
}

EvalConfig::EvalConfig(const std::string& path) : EvalConfig()
{
    if (!std::filesystem::exists(path)) {
        throw nav_eval::FileException("load config", "File does not exist: " + path);
    }

    std::ifstream testFile(path);
    if (!testFile.good()) {
        throw nav_eval::FileException("load config", "Cannot read file: " + path);
    }
    testFile.close();

    try {
        YAML::Node config = YAML::LoadFile(path);

        // 空文件等价于全部使用默认值
        if (!config.IsNull()) {
            if (!config.IsMap()) {
                throw nav_eval::ConfigException("Top level of " + path + " must be a mapping");
            }

            loadTolerances(config["tolerances"]);
            loadFields(config["fields"]);
            loadHistogram(config["histogram"]);
            loadSpectral(config["spectral"]);
            loadLogging(config["logging"]);

            if (config["schema_path"]) {
                schemaPath_ = config["schema_path"].as<std::string>();
            }
        }
    } catch (const YAML::BadFile& e) {
        throw nav_eval::FileException("load config", "YAML parse error: " + std::string(e.what()));
    } catch (const YAML::ParserException& e) {
        throw nav_eval::ConfigException("YAML syntax error: " + std::string(e.what()));
    } catch (const YAML::BadConversion& e) {
        throw nav_eval::ConfigException("Type conversion error: " + std::string(e.what()));
    } catch (const nav_eval::BaseException&) {
        throw;
    } catch (const std::exception& e) {
        throw nav_eval::ConfigException("Unexpected error: " + std::string(e.what()));
    }

    validate();
}

const AlignmentTolerances& EvalConfig::tolerances() const
{
    return tolerances_;
}

const std::vector<std::string>& EvalConfig::fields(SensorCategory category) const
{
    return category == SensorCategory::Gnss ? gnssFields_ : imuFields_;
}

const HistogramOptions& EvalConfig::histogram() const
{
    return histogram_;
}

const SpectralOptions& EvalConfig::spectral() const
{
    return spectral_;
}

const std::string& EvalConfig::schemaPath() const
{
    return schemaPath_;
}

Logger::Level EvalConfig::logLevel() const
{
    return logLevel_;
}

const std::string& EvalConfig::logFile() const
{
    return logFile_;
}

void EvalConfig::setTolerances(const AlignmentTolerances& tolerances)
{
    tolerances_ = tolerances;
    validate();
}

void EvalConfig::setSchemaPath(const std::string& path)
{
    schemaPath_ = path;
}

void EvalConfig::validate() const
{
    checkTolerance("field", tolerances_.field);
    checkTolerance("position", tolerances_.position);
    checkTolerance("orientation", tolerances_.orientation);
    checkTolerance("acceleration", tolerances_.acceleration);
    checkTolerance("coordinate", tolerances_.coordinate);
    checkTolerance("information", tolerances_.information);
    checkTolerance("signal", tolerances_.signal);

    if (histogram_.maxBins < 2) {
        throw nav_eval::ValidationException("histogram.max_bins", "Must be at least 2");
    }
    if (histogram_.samplesPerBin < 1) {
        throw nav_eval::ValidationException("histogram.samples_per_bin", "Must be at least 1");
    }
    if (spectral_.minSamples < 2) {
        throw nav_eval::ValidationException("spectral.min_samples", "Must be at least 2");
    }
    if (spectral_.maxSegment < 2) {
        throw nav_eval::ValidationException("spectral.max_segment", "Must be at least 2");
    }
}

void EvalConfig::loadTolerances(const YAML::Node& node)
{
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw nav_eval::ConfigException("tolerances", "Must be a mapping");
    }

    readTolerance(node, "field", tolerances_.field);
    readTolerance(node, "position", tolerances_.position);
    readTolerance(node, "orientation", tolerances_.orientation);
    readTolerance(node, "acceleration", tolerances_.acceleration);
    readTolerance(node, "coordinate", tolerances_.coordinate);
    readTolerance(node, "information", tolerances_.information);
    readTolerance(node, "signal", tolerances_.signal);
}

void EvalConfig::loadFields(const YAML::Node& node)
{
    if (!node || node.IsNull()) {
        return;
    }

    if (node["gnss"]) {
        gnssFields_ = node["gnss"].as<std::vector<std::string>>();
    }
    if (node["imu"]) {
        imuFields_ = node["imu"].as<std::vector<std::string>>();
    }

    for (const auto* list : {&gnssFields_, &imuFields_}) {
        for (const auto& f : *list) {
            if (f.empty() || f.front() == '.' || f.back() == '.') {
                throw nav_eval::ValidationException("fields", "Malformed field path '" + f + "'");
            }
        }
    }
}

void EvalConfig::loadHistogram(const YAML::Node& node)
{
    if (!node || node.IsNull()) {
        return;
    }

    if (node["max_bins"]) {
        histogram_.maxBins = node["max_bins"].as<int>();
    }
    if (node["samples_per_bin"]) {
        histogram_.samplesPerBin = node["samples_per_bin"].as<int>();
    }
}

void EvalConfig::loadSpectral(const YAML::Node& node)
{
    if (!node || node.IsNull()) {
        return;
    }

    if (node["min_samples"]) {
        spectral_.minSamples = node["min_samples"].as<std::size_t>();
    }
    if (node["max_segment"]) {
        spectral_.maxSegment = node["max_segment"].as<std::size_t>();
    }
}

void EvalConfig::loadLogging(const YAML::Node& node)
{
    if (!node || node.IsNull()) {
        return;
    }

    if (node["level"]) {
        logLevel_ = Logger::parseLevel(node["level"].as<std::string>());
    }
    if (node["file"]) {
        logFile_ = node["file"].as<std::string>();
    }
}
