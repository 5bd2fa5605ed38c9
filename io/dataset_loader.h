#ifndef NAV_EVAL_DATASET_LOADER_H
#define NAV_EVAL_DATASET_LOADER_H

#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

#include "measurement/nav_record.h"

/**
 * @brief 读取单个数据集文件
 *
 * 文件为 JSON 对象，顶层键 gnss_data / imu_data 下是记录数组。
 * 顶层键缺失得到空数据集；非数组负载和非对象记录记警告后跳过；
 * JSON 无法解析时抛出 DataException。
 */
class DatasetLoader
{
public:
    DatasetLoader(const std::string &path, SensorCategory category);

    ~DatasetLoader() = default;

    DatasetLoader(const DatasetLoader &) = delete;

    DatasetLoader &operator=(const DatasetLoader &) = delete;

    DatasetLoader(DatasetLoader &&) = default;

    DatasetLoader &operator=(DatasetLoader &&) = default;

    const Dataset &load();

    [[nodiscard]] bool loaded() const { return loaded_; }

    /**
     * @brief 转移已加载的数据集，之后加载器不再持有记录
     */
    Dataset take();

    static Dataset loadFile(const std::string &path, SensorCategory category);

private:
    void parseRecords(const nlohmann::json &document);

    std::string path_;
    std::ifstream file_;
    Dataset dataset_;
    bool loaded_{false};
};

#endif //NAV_EVAL_DATASET_LOADER_H
