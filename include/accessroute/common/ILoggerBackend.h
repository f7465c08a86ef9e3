#pragma once

#include <source_location>
#include <string>

namespace accessroute {

/**
 * @brief Log level enumeration
 */
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
 * @brief Logger backend interface for dependency injection
 *
 * Implement this interface to route accessroute diagnostics into a host
 * application's logging system. The backend receives every message; level
 * filtering is up to the implementation.
 *
 * Example: keep graph loading warnings for a data quality report
 * @code
 * class WarningCollector : public accessroute::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location&) override {
 *         if (level >= minLevel_) warnings.push_back(message);
 *     }
 *     void setLevel(LogLevel level) override { minLevel_ = level; }
 *     void flush() override {}
 *
 *     std::vector<std::string> warnings;
 *
 * private:
 *     LogLevel minLevel_ = LogLevel::Warn;
 * };
 *
 * auto collector = std::make_unique<WarningCollector>();
 * WarningCollector* warnings = collector.get();
 * accessroute::Logger::setBackend(std::move(collector));
 *
 * GraphLoadReport report;
 * auto graph = GraphLoader::loadFromFile("campus.json", &report);
 * // warnings->warnings now holds one "Dropping edge #..." line per rejected edge
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     * @param level Log level
     * @param message Pre-formatted message
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /**
     * @brief Set minimum log level
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace accessroute
