#pragma once

#include <string>
#include <memory>

namespace helios {

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
 * Structured logging with levels and optional file output. Safe to call from
 * PortAudio callback threads as well as the session loop.
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

    /**
     * @brief Parse "debug" | "info" | "warn" | "error" (case-insensitive)
     * @param fallback Returned for unrecognized names
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Convenience macros
#define LOG_DEBUG(msg) helios::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) helios::Logger::info(msg)
#define LOG_WARN(msg) helios::Logger::warn(msg)
#define LOG_ERROR(msg) helios::Logger::error(msg)

// Component-specific logging macros
#define LOG_SESSION(msg) helios::Logger::info(std::string("[Session] ") + (msg))
#define LOG_PLAYBACK(msg) helios::Logger::debug(std::string("[Playback] ") + (msg))
#define LOG_CAPTURE(msg) helios::Logger::debug(std::string("[Capture] ") + (msg))
#define LOG_CHANNEL(msg) helios::Logger::info(std::string("[Channel] ") + (msg))
#define LOG_TOOL(msg) helios::Logger::info(std::string("[Tool] ") + (msg))

} // namespace helios
