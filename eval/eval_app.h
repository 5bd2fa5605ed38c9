#ifndef NAV_EVAL_EVAL_APP_H
#define NAV_EVAL_EVAL_APP_H

#include <optional>
#include <ostream>
#include <string>

#include "utils/logger.h"

struct EvalOptions
{
    std::string groundTruthDir;
    std::string convertedDir;
    std::string outputPath;
    std::string configPath;
    std::string benchmarkPath;
    std::optional<Logger::Level> logLevel;
    std::string logFile;
    bool help = false;
};

/**
 * @brief nav_eval 命令行入口
 *
 * 返回码: 0 成功，1 评估失败（文件、数据、配置），2 用法错误
 */
class EvalApp
{
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitUsage = 2;

    /**
     * @brief 解析命令行，参数错误抛 ValidationException
     */
    static EvalOptions parseArgs(int argc, const char **argv);

    static void printUsage(std::ostream &out, const char *prog);

    /**
     * @brief 解析参数、加载配置、执行评估并输出报告
     * @param out 未指定 --output 时报告写到这里
     */
    static int run(int argc, const char **argv, std::ostream &out);
};

#endif //NAV_EVAL_EVAL_APP_H
