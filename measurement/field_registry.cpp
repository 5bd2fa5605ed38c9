#include "field_registry.h"

#include <unordered_map>

namespace
{

std::array<FieldRegistry::Descriptor, kKnownFieldCount> buildDescriptors()
{
    const std::array<std::pair<FieldId, const char *>, kKnownFieldCount> table = {{
        {FieldId::LlaLatitude, "position_lla.latitude_deg"},
        {FieldId::LlaLongitude, "position_lla.longitude_deg"},
        {FieldId::LlaAltitude, "position_lla.altitude_m"},
        {FieldId::EcefX, "position_ecef.x"},
        {FieldId::EcefY, "position_ecef.y"},
        {FieldId::EcefZ, "position_ecef.z"},
        {FieldId::VelocityX, "velocity.x"},
        {FieldId::VelocityY, "velocity.y"},
        {FieldId::VelocityZ, "velocity.z"},
        {FieldId::Hdop, "dop.hdop"},
        {FieldId::Vdop, "dop.vdop"},
        {FieldId::Pdop, "dop.pdop"},
        {FieldId::AccelX, "linear_acceleration.x"},
        {FieldId::AccelY, "linear_acceleration.y"},
        {FieldId::AccelZ, "linear_acceleration.z"},
        {FieldId::GyroX, "angular_velocity.x"},
        {FieldId::GyroY, "angular_velocity.y"},
        {FieldId::GyroZ, "angular_velocity.z"},
        {FieldId::OrientW, "orientation.w"},
        {FieldId::OrientX, "orientation.x"},
        {FieldId::OrientY, "orientation.y"},
        {FieldId::OrientZ, "orientation.z"},
    }};

    std::array<FieldRegistry::Descriptor, kKnownFieldCount> result;
    for (const auto &[id, path] : table)
    {
        auto &d = result[static_cast<std::size_t>(id)];
        d.id = id;
        d.path = path;
        d.segments = FieldRegistry::splitPath(path);
    }
    return result;
}

} // namespace

const std::array<FieldRegistry::Descriptor, kKnownFieldCount> &FieldRegistry::descriptors()
{
    static const auto table = buildDescriptors();
    return table;
}

const std::string &FieldRegistry::path(FieldId id)
{
    return descriptors()[static_cast<std::size_t>(id)].path;
}

std::optional<FieldId> FieldRegistry::find(const std::string &path)
{
    static const auto index = [] {
        std::unordered_map<std::string, FieldId> m;
        for (const auto &d : descriptors())
        {
            m.emplace(d.path, d.id);
        }
        return m;
    }();

    auto it = index.find(path);
    if (it == index.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> FieldRegistry::splitPath(const std::string &path)
{
    std::vector<std::string> segments;
    std::string::size_type start = 0;
    while (true)
    {
        auto dot = path.find('.', start);
        if (dot == std::string::npos)
        {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

const char *categoryName(SensorCategory category)
{
    return category == SensorCategory::Gnss ? "gnss" : "imu";
}

const char *datasetKey(SensorCategory category)
{
    return category == SensorCategory::Gnss ? "gnss_data" : "imu_data";
}
