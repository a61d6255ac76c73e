#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace llmtrigger::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& CurrentConfig() {
    static LogConfig config{};
    return config;
}

LogSink& CurrentSink() {
    static LogSink sink;
    return sink;
}

}  // namespace

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    CurrentConfig() = config;
}

void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(LogMutex());
    CurrentSink() = std::move(sink);
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (static_cast<int>(level) < static_cast<int>(CurrentConfig().min_level)) {
        return;
    }
    const auto& sink = CurrentSink();
    if (sink) {
        sink(LogMessage{level, tag, message});
        return;
    }
    std::cerr << "[" << ToString(level) << "] [" << tag << "] " << message << std::endl;
}

}  // namespace llmtrigger::utils
