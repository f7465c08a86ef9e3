#pragma once

#include "accessroute/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace accessroute {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink always, plus an optional file sink (accessroute.log) in
 * the given directory. The level can be overridden with the LOG_LEVEL or
 * SPDLOG_LEVEL environment variables.
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

}  // namespace accessroute
