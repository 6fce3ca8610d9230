#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the downloader.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace parafetch::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Console output with colors, plus an optional rotating file.
 * Messages logged before initialize() go to a plain console logger.
 * initialize() must run before worker threads start logging.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logFile Log file path (empty = console only)
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logFile = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (!logFile.empty()) {
                std::filesystem::path logPath(logFile);
                if (logPath.has_parent_path()) {
                    std::filesystem::create_directories(logPath.parent_path());
                }

                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 10, // 10 MB
                    5                 // 5 rotated files
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            m_logger = std::make_shared<spdlog::logger>("parafetch", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(m_logger);

        } catch (const spdlog::spdlog_ex& ex) {
            m_logger = fallbackLogger();
            m_logger->error("Logger initialization failed: {}", ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            m_logger = fallbackLogger();
            m_logger->error("Cannot create log directory: {}", ex.what());
        }
    }

    /**
     * Flush all log sinks
     */
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    /**
     * Log trace message
     */
    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->trace(fmt, std::forward<Args>(args)...);
    }

    /**
     * Log debug message
     */
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->debug(fmt, std::forward<Args>(args)...);
    }

    /**
     * Log info message
     */
    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->info(fmt, std::forward<Args>(args)...);
    }

    /**
     * Log warning message
     */
    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->warn(fmt, std::forward<Args>(args)...);
    }

    /**
     * Log error message
     */
    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->error(fmt, std::forward<Args>(args)...);
    }

    /**
     * Log critical message
     */
    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->critical(fmt, std::forward<Args>(args)...);
    }

    /**
     * Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
     * @param name Level name, case-sensitive
     * @param fallback Returned for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::Info) {
        if (name == "trace")    return LogLevel::Trace;
        if (name == "debug")    return LogLevel::Debug;
        if (name == "info")     return LogLevel::Info;
        if (name == "warn")     return LogLevel::Warn;
        if (name == "error")    return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off")      return LogLevel::Off;
        return fallback;
    }

private:
    Logger() : m_logger(fallbackLogger()) {}
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    const std::shared_ptr<spdlog::logger>& logger() const { return m_logger; }

    static std::shared_ptr<spdlog::logger> fallbackLogger() {
        auto existing = spdlog::get("parafetch_fallback");
        return existing ? existing : spdlog::stdout_color_mt("parafetch_fallback");
    }

    /**
     * Convert LogLevel to spdlog::level
     */
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace parafetch::core

// Convenience macros
#define LOG_TRACE(...)    parafetch::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    parafetch::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     parafetch::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     parafetch::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    parafetch::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) parafetch::core::Logger::instance().critical(__VA_ARGS__)
