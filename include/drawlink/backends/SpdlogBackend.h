#pragma once

#include "drawlink/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace drawlink {

/**
 * @brief spdlog-based logger backend
 *
 * - Colored console sink
 * - Optional file sink (<logDir>/drawlink.log)
 * - Level taken from LOG_LEVEL or SPDLOG_LEVEL when set
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace drawlink
