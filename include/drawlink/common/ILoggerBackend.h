#pragma once

#include <source_location>
#include <string>

namespace drawlink {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Sink for Logger output
 *
 * SpdlogBackend is the default. Embedders that already own a logging
 * system (a service host, a test harness) inject their own implementation
 * through Logger::setBackend().
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param level Log level
     * @param message Pre-formatted message, prefixed with the calling function
     * @param loc Source location of the LOG_* call
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace drawlink
