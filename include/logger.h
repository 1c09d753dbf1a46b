#pragma once

#include <string>
#include <memory>

namespace live_scribe {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/// Parse "debug" | "info" | "warn" | "error" (case-insensitive); unknown -> INFO
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output. Safe to call from the
 * audio thread, channel reader thread and event loop concurrently.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) live_scribe::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) live_scribe::Logger::info(msg)
#define LOG_WARN(msg) live_scribe::Logger::warn(msg)
#define LOG_ERROR(msg) live_scribe::Logger::error(msg)

// Component-specific logging macros
#define LOG_AUDIO(msg) live_scribe::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_CREDENTIAL(msg) live_scribe::Logger::info(std::string("[Credential] ") + (msg))
#define LOG_SESSION(msg) live_scribe::Logger::info(std::string("[Session] ") + (msg))
#define LOG_DETECTOR(msg) live_scribe::Logger::info(std::string("[Detector] ") + (msg))
#define LOG_DISPATCH(msg) live_scribe::Logger::info(std::string("[Dispatch] ") + (msg))

} // namespace live_scribe
