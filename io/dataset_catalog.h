#ifndef NAV_EVAL_DATASET_CATALOG_H
#define NAV_EVAL_DATASET_CATALOG_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "measurement/nav_record.h"

// 真值与转换后目录中同名的一对文件
struct FilePair
{
    std::string name;
    SensorCategory category;
    std::string groundTruthPath;
    std::string convertedPath;
};

/**
 * @brief 按文件名配对两个目录中的数据集文件
 *
 * 只考虑 .json 普通文件，类别由文件名中的关键字决定（不区分大小写，gnss 优先）。
 * 结果按文件名排序；没有对应转换后文件的真值文件不成对。
 */
class DatasetCatalog
{
public:
    DatasetCatalog(const std::string &groundTruthDir, const std::string &convertedDir);

    [[nodiscard]] const std::vector<FilePair> &pairs() const { return pairs_; }

    /**
     * @brief 某类别的全部真值文件（包括没有配对的）
     */
    [[nodiscard]] std::vector<std::string> groundTruthFiles(SensorCategory category) const;

    [[nodiscard]] const std::string &groundTruthDir() const { return groundTruthDir_; }

    [[nodiscard]] const std::string &convertedDir() const { return convertedDir_; }

    /**
     * @brief 由文件名判断类别，没有关键字时返回空
     */
    static std::optional<SensorCategory> categoryOf(const std::string &filename);

private:
    void scan();

    std::string groundTruthDir_;
    std::string convertedDir_;
    std::vector<FilePair> pairs_;
    std::vector<std::pair<std::string, SensorCategory>> groundTruthFiles_;
};

#endif //NAV_EVAL_DATASET_CATALOG_H
