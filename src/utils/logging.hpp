#pragma once

#include <functional>
#include <string>

namespace llmtrigger::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

using LogSink = std::function<void(const LogMessage&)>;

void SetLogConfig(const LogConfig& config);

// Replaces the stderr writer. An empty sink restores it.
void SetLogSink(LogSink sink);

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

void Log(LogLevel level, const std::string& tag, const std::string& message);

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace llmtrigger::utils
