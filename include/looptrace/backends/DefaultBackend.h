#pragma once

#include "looptrace/common/ILoggerBackend.h"
#include <fstream>
#include <mutex>
#include <string>

namespace looptrace {

/**
 * @brief Dependency-free backend used when LOOPTRACE_USE_SPDLOG=OFF
 *
 * Level-colored lines on stdout and, when a log file is given, the same
 * messages appended to it as "[dd/mm/YYYY HH:MM:SS] message".
 */
class DefaultBackend : public ILoggerBackend {
public:
    /// @throws IOError if `logFile` is set and cannot be opened
    explicit DefaultBackend(const std::string& logFile = "");

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_ = LogLevel::Info;
    std::ofstream file_;
    std::mutex mutex_;

    static const char* levelColor(LogLevel level);
    static std::string timestamp(const char* format);
};

}  // namespace looptrace
