#pragma once

#include "elbow/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace elbow {

/**
 * @brief spdlog-based logger backend
 *
 * Provides:
 * - Colored console sink on stderr (stdout stays free for tool output)
 * - Optional file sink (elbow.log in the given directory)
 * - LOG_LEVEL / SPDLOG_LEVEL environment override
 *
 * Default backend created by Logger::initialize().
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

}  // namespace elbow
