#pragma once

#include <optional>
#include <source_location>
#include <string>

namespace looptrace {

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

/// Lower-case name of a level ("trace", "debug", ...)
const char* logLevelName(LogLevel level);

/// Parse a level name, case-insensitive. Accepts "warning" and "err" as aliases.
std::optional<LogLevel> parseLogLevel(const std::string& name);

/**
 * @brief Logger backend interface for dependency injection
 *
 * Implement this interface to route search progress into another logging
 * system. The library itself never depends on a concrete backend.
 *
 * Example:
 * @code
 * class MyLogger : public looptrace::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         mySystem->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { mySystem->setMinLevel(level); }
 *     void flush() override { mySystem->flush(); }
 * };
 *
 * looptrace::Logger::setBackend(std::make_unique<MyLogger>());
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

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace looptrace
