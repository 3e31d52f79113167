#pragma once

#include <string>
#include <memory>

namespace parley {

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
 * @brief Parse a level name ("debug", "info", "warn", "error")
 * @return Parsed level, or fallback when the name is unknown
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Every pipeline stage runs on its own thread and logs through this class,
 * so each line is formatted and written under one mutex.
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

// Convenience macros
#define LOG_DEBUG(msg) parley::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + (msg))
#define LOG_INFO(msg) parley::Logger::info(msg)
#define LOG_WARN(msg) parley::Logger::warn(msg)
#define LOG_ERROR(msg) parley::Logger::error(msg)

// Component-specific logging macros
#define LOG_PIPE(msg) parley::Logger::info(std::string("[Pipeline] ") + (msg))
#define LOG_CONN(msg) parley::Logger::info(std::string("[Conn] ") + (msg))
#define LOG_AUDIO(msg) parley::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_STT(msg) parley::Logger::info(std::string("[STT] ") + (msg))
#define LOG_LLM(msg) parley::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_TTS(msg) parley::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_AVATAR(msg) parley::Logger::info(std::string("[Avatar] ") + (msg))
#define LOG_VISION(msg) parley::Logger::debug(std::string("[Vision] ") + (msg))
#define LOG_CTX(msg) parley::Logger::debug(std::string("[Context] ") + (msg))

} // namespace parley
