#pragma once

#include "looptrace/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace looptrace {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink plus, when a log file is given, an appending file sink with a
 * dated timestamp on every line. If the log file cannot be opened the file
 * sink is replaced by "<logFile>.<YYYY.MM.DD.HH.MM.SS.ffffff>.err", which
 * receives the open failure and every later message.
 *
 * Default backend when LOOPTRACE_USE_SPDLOG=ON.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logFile = "");

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    /// Path of the error file in use, empty when the log file opened normally
    const std::string& fallbackFile() const { return fallbackFile_; }

    /// "<logFile>.<YYYY.MM.DD.HH.MM.SS.ffffff>.err" for the current local time
    static std::string fallbackFileName(const std::string& logFile);

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::string fallbackFile_;
    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace looptrace
