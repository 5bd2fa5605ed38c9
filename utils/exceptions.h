#ifndef NAV_EVAL_EXCEPTIONS_H
#define NAV_EVAL_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace nav_eval {

/**
 * @brief 基础异常类
 */
class BaseException : public std::runtime_error {
public:
    explicit BaseException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief 文件/目录相关异常（目录不存在、文件不可读、输出不可写）
 */
class FileException : public BaseException {
public:
    explicit FileException(const std::string& message)
        : BaseException("File error: " + message) {}

    explicit FileException(const std::string& operation, const std::string& path)
        : BaseException("File error [" + operation + "]: " + path) {}
};

/**
 * @brief 配置相关异常
 */
class ConfigException : public BaseException {
public:
    explicit ConfigException(const std::string& message)
        : BaseException("Config error: " + message) {}

    explicit ConfigException(const std::string& key, const std::string& reason)
        : BaseException("Config error [" + key + "]: " + reason) {}
};

/**
 * @brief 数据相关异常（JSON 无法解析、文档结构错误）
 */
class DataException : public BaseException {
public:
    explicit DataException(const std::string& message)
        : BaseException("Data error: " + message) {}

    explicit DataException(const std::string& path, const std::string& reason)
        : BaseException("Data error [" + path + "]: " + reason) {}
};

/**
 * @brief 参数验证异常
 */
class ValidationException : public BaseException {
public:
    explicit ValidationException(const std::string& message)
        : BaseException("Validation error: " + message) {}

    explicit ValidationException(const std::string& parameter, const std::string& reason)
        : BaseException("Validation error [" + parameter + "]: " + reason) {}
};

/**
 * @brief 外部转换进程相关异常
 */
class ProcessException : public BaseException {
public:
    explicit ProcessException(const std::string& message)
        : BaseException("Process error: " + message) {}
};

} // namespace nav_eval

#endif //NAV_EVAL_EXCEPTIONS_H
