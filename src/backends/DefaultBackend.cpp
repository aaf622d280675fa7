#include "looptrace/backends/DefaultBackend.h"
#include "looptrace/core/Errors.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace looptrace {

DefaultBackend::DefaultBackend(const std::string& logFile) {
    if (const char* env_level = std::getenv("LOG_LEVEL")) {
        if (auto level = parseLogLevel(env_level)) {
            currentLevel_ = *level;
        }
    }

    if (!logFile.empty()) {
        file_.open(logFile, std::ios::out | std::ios::app);
        if (!file_) {
            throw IOError("Cannot open log file '" + logFile + "'");
        }
    }
}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (currentLevel_ == LogLevel::Off || level < currentLevel_) {
        return;
    }

    std::cout << "[" << timestamp("%H:%M:%S") << "] [" << levelColor(level)
              << logLevelName(level) << "\033[0m] " << message << '\n';
    if (file_.is_open()) {
        file_ << "[" << timestamp("%d/%m/%Y %H:%M:%S") << "] " << message << '\n';
    }
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    if (file_.is_open()) {
        file_.flush();
    }
}

const char* DefaultBackend::levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error:
        case LogLevel::Critical: return "\033[31m";
        default: return "";
    }
}

std::string DefaultBackend::timestamp(const char* format) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), format, &local);
    return buffer;
}

}  // namespace looptrace
