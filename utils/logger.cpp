#include "logger.h"

#include <algorithm>
#include <cctype>
#include <vector>
#include <filesystem>

#include "utils/exceptions.h"

namespace Logger {

Level parseLevel(const std::string& text)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warning" || lower == "warn") return Level::WARNING;
    if (lower == "error") return Level::ERROR;
    if (lower == "none" || lower == "off") return Level::NONE;

    throw nav_eval::ValidationException("log level", "Unknown level '" + text + "'");
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::init(Level level, const std::string& logFile) {
    if (initialized_) {
        // 已经初始化，只更新级别
        setLevel(level);
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // 控制台输出（带颜色），写 stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    sinks.push_back(console_sink);

    if (!logFile.empty()) {
        try {
            std::filesystem::path logPath(logFile);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }

            // 每个文件最大 5MB，保留 3 个文件
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 5 * 1024 * 1024, 3);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
            sinks.push_back(file_sink);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to create log file: {} ({}), using console only", logFile, e.what());
        }
    }

    logger_ = std::make_shared<spdlog::logger>("nav_eval", sinks.begin(), sinks.end());
    logger_->set_level(convertLevel(level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::register_logger(logger_);
    spdlog::set_default_logger(logger_);

    initialized_ = true;
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

Level Logger::getLevel() const {
    if (logger_) {
        return convertLevel(logger_->level());
    }
    return Level::NONE;
}

void Logger::log(Level level, const std::string& message, const std::string& file, int line) {
    if (!initialized_ || !logger_) {
        return;
    }

    spdlog::level::level_enum spdlog_level = convertLevel(level);
    if (spdlog_level < logger_->level()) {
        return;
    }

    // 只保留文件名
    std::string fileName = file;
    size_t pos = fileName.find_last_of("/\\");
    if (pos != std::string::npos) {
        fileName = fileName.substr(pos + 1);
    }

    logger_->log(spdlog::source_loc{fileName.c_str(), line, ""},
                 spdlog_level, message);
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop_all();
        logger_.reset();
    }
    initialized_ = false;
}

spdlog::level::level_enum Logger::convertLevel(Level level) const {
    switch (level) {
        case Level::DEBUG:   return spdlog::level::debug;
        case Level::INFO:    return spdlog::level::info;
        case Level::WARNING: return spdlog::level::warn;
        case Level::ERROR:   return spdlog::level::err;
        case Level::NONE:    return spdlog::level::off;
        default:             return spdlog::level::info;
    }
}

Level Logger::convertLevel(spdlog::level::level_enum level) const {
    switch (level) {
        case spdlog::level::trace:
        case spdlog::level::debug:   return Level::DEBUG;
        case spdlog::level::info:    return Level::INFO;
        case spdlog::level::warn:    return Level::WARNING;
        case spdlog::level::err:
        case spdlog::level::critical: return Level::ERROR;
        case spdlog::level::off:     return Level::NONE;
        default:                      return Level::INFO;
    }
}

Logger::~Logger() {
    shutdown();
}

} // namespace Logger
