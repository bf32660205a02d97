#pragma once

#include "drawlink/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace drawlink {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Supports three usage patterns:
 * 1. Default mode: spdlog console backend, created on first use
 * 2. Custom mode: callers inject their own ILoggerBackend implementation
 * 3. Capture mode: log lines are also kept in memory for programmatic retrieval
 *
 * Thread-safe: backend replacement and capture are mutex-guarded.
 *
 * Example:
 * @code
 * drawlink::Logger::initialize();
 * LOG_INFO("Generated diagram with {} nodes", count);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend Logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stderr only)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    /**
     * @brief Set minimum log level
     */
    static void setLevel(LogLevel level);

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off")
     * @return Parsed level, or fallback for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::Info);

    // Logging methods
    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    /**
     * @brief Flush log buffers
     */
    static void flush();

    // ===== Log Capture API =====

    /**
     * @brief Enable or disable log capture
     *
     * When enabled, every log message is stored in memory in addition to
     * being sent to the backend. Use getCapturedLogs() to retrieve them.
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /// Captured lines containing pattern (all lines when empty), oldest first
    static std::vector<std::string> getCapturedLogs(const std::string& pattern = "");

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const char* tag, const std::string& message,
                      const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace drawlink

// Logging macros with std::format support
#define LOG_TRACE(...) drawlink::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) drawlink::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  drawlink::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  drawlink::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) drawlink::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
