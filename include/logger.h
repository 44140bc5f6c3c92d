#pragma once

#include <string>
#include <memory>

namespace interrupt_filter {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output. Safe to call from
 * whichever thread delivers transcript events.
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

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @param name Level name from configuration
     * @param fallback Returned when name is not recognized
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

    static const char* level_string(LogLevel level);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Component-specific logging macros
#define LOG_LEXICON(msg) interrupt_filter::Logger::info(std::string("[Lexicon] ") + (msg))
#define LOG_FILTER(msg) interrupt_filter::Logger::info(std::string("[Filter] ") + (msg))
#define LOG_SESSION(msg) interrupt_filter::Logger::debug(std::string("[Session] ") + (msg))
#define LOG_DECISION(session_id, action, data) interrupt_filter::Logger::info(std::string("[decision] session=") + (session_id) + " action=" + (action) + " " + (data))

} // namespace interrupt_filter
