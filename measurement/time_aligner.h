#ifndef NAV_EVAL_TIME_ALIGNER_H
#define NAV_EVAL_TIME_ALIGNER_H

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "measurement/nav_record.h"

/**
 * @brief 最近时间戳匹配
 *
 * 对目标序列按时间稳定排序后二分查找，结果与按原始顺序线性扫描一致：
 * 时间差相同时取原始顺序中靠前的记录。没有时间戳的记录不参与匹配。
 */
class TimeAligner
{
public:
    struct Match
    {
        std::size_t index;  // 目标序列中的原始下标
        double timeDiff;    // |t - t_target| (s)
    };

    struct AlignedPair
    {
        std::size_t gtIndex;
        std::size_t convIndex;
        double timeDiff;
    };

    explicit TimeAligner(const Dataset &target);

    explicit TimeAligner(const std::vector<double> &timestamps);

    [[nodiscard]] std::optional<Match> nearest(double t) const;

    /**
     * @brief 最近匹配且时间差严格小于容差才接受
     */
    [[nodiscard]] std::optional<Match> match(const std::optional<double> &t, double tolerance) const;

    /**
     * @brief 真值序列逐条匹配，返回被接受的配对（按真值顺序）
     */
    [[nodiscard]] std::vector<AlignedPair> align(const Dataset &groundTruth, double tolerance) const;

    [[nodiscard]] bool empty() const;

    /**
     * @brief 按记录顺序提取存在的时间戳
     */
    static std::vector<double> timestamps(const Dataset &dataset);

private:
    void sortIndex();

    std::vector<std::pair<double, std::size_t>> sorted_;
};

#endif //NAV_EVAL_TIME_ALIGNER_H
