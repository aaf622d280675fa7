#include "looptrace/backends/SpdlogBackend.h"
#include "looptrace/core/Errors.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <format>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace looptrace {

namespace {

constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* FILE_PATTERN = "[%d/%m/%Y %H:%M:%S] %v";

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console_sink);

    std::string openFailure;
    if (!logFile.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
            file_sink->set_pattern(FILE_PATTERN);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& ex) {
            openFailure = ex.what();
            fallbackFile_ = fallbackFileName(logFile);
            try {
                auto err_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fallbackFile_, false);
                err_sink->set_pattern(FILE_PATTERN);
                sinks.push_back(err_sink);
            } catch (const spdlog::spdlog_ex& errEx) {
                throw IOError("Cannot open log file '" + logFile + "' (" + openFailure +
                              ") nor fallback '" + fallbackFile_ + "' (" + errEx.what() + ")");
            }
        }
    }

    // Not registered globally: several backends may coexist in one process
    logger_ = std::make_shared<spdlog::logger>("looptrace", sinks.begin(), sinks.end());
    logger_->set_level(spdlog::level::info);

    const char* env_level = std::getenv("LOG_LEVEL");
    if (!env_level) {
        env_level = std::getenv("SPDLOG_LEVEL");
    }
    if (env_level) {
        if (auto level = parseLogLevel(env_level)) {
            logger_->set_level(convertLevel(*level));
        }
    }

    if (!openFailure.empty()) {
        logger_->error("cannot open log file '{}': {}", logFile, openFailure);
        logger_->flush();
    }
}

std::string SpdlogBackend::fallbackFileName(const std::string& logFile) {
    auto now = std::chrono::system_clock::now();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&seconds, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y.%m.%d.%H.%M.%S", &local);
    return std::format("{}.{}.{:06}.err", logFile, stamp, micros);
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

}  // namespace looptrace
