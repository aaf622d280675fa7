#pragma once

#include "looptrace/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace looptrace {

/**
 * @brief Process-wide logging facade used by the command line tool
 *
 * The search engine itself never logs through this class; it reports to an
 * injected IDiagnosticsSink. LoggerDiagnosticsSink bridges the two.
 *
 * Supports three usage patterns:
 * 1. Default mode: built-in backend (spdlog if available, DefaultBackend otherwise)
 * 2. Custom mode: users inject their own ILoggerBackend implementation
 * 3. Capture mode: messages are also kept in memory for tests
 *
 * Example:
 * @code
 * looptrace::Logger::setBackend(looptrace::Logger::createDefaultBackend("cycles.txt.log"));
 * LOG_INFO("graph built ({} vertices, {} edges)", graph.vertexCount(), graph.edgeCount());
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Create the backend selected at build time
     * @param logFile File that receives a copy of every message (empty = console only).
     *        If it cannot be opened, a timestamped "<logFile>.<time>.err" file is used instead.
     */
    static std::unique_ptr<ILoggerBackend> createDefaultBackend(const std::string& logFile = "");

    /**
     * @brief Initialize default logger (stdout only) unless a backend is already set
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output unless a backend is already set
     */
    static void initialize(const std::string& logFile);

    static void setLevel(LogLevel level);

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

    static void flush();

    // ===== Log Capture API =====

    /**
     * @brief Enable or disable log capture
     *
     * When enabled, all log messages are stored in memory in addition to
     * being sent to the backend. Use getCapturedLogs() to retrieve them.
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured logs with optional filtering
     * @param pattern Optional substring filter (empty = all logs)
     * @param maxLines Maximum number of lines to return (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string& message, const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace looptrace

// Logging macros with std::format support
#define LOG_TRACE(...) looptrace::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) looptrace::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  looptrace::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  looptrace::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) looptrace::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
