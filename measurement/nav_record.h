#ifndef NAV_EVAL_NAV_RECORD_H
#define NAV_EVAL_NAV_RECORD_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class SensorCategory
{
    Gnss,
    Imu
};

// "gnss" / "imu"，同时用作文件名关键字和 schema 分类名
const char *categoryName(SensorCategory category);

// 数据集文件顶层键 "gnss_data" / "imu_data"
const char *datasetKey(SensorCategory category);

enum class FieldId : std::size_t
{
    LlaLatitude,
    LlaLongitude,
    LlaAltitude,
    EcefX,
    EcefY,
    EcefZ,
    VelocityX,
    VelocityY,
    VelocityZ,
    Hdop,
    Vdop,
    Pdop,
    AccelX,
    AccelY,
    AccelZ,
    GyroX,
    GyroY,
    GyroZ,
    OrientW,
    OrientX,
    OrientY,
    OrientZ,
    Count
};

constexpr std::size_t kKnownFieldCount = static_cast<std::size_t>(FieldId::Count);

struct NavRecord
{
    std::optional<double> time;                                    // time_unix (s)
    std::array<std::optional<double>, kKnownFieldCount> known{};   // 已注册字段
    nlohmann::json raw = nlohmann::json::object();                 // 原始记录，用于未注册路径

    [[nodiscard]] std::optional<double> get(FieldId id) const
    {
        return known[static_cast<std::size_t>(id)];
    }
};

struct Dataset
{
    std::string name;          // 文件名
    SensorCategory category = SensorCategory::Gnss;
    std::vector<NavRecord> records;
    std::uintmax_t sizeBytes = 0;

    [[nodiscard]] bool empty() const { return records.empty(); }

    [[nodiscard]] std::size_t size() const { return records.size(); }
};

#endif //NAV_EVAL_NAV_RECORD_H
