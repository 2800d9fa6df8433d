#pragma once

#include <string>
#include <unordered_map>
#include <utility>

namespace runbox::utils {

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

// Accepts debug/info/warn/warning/error in any case; anything else yields fallback.
LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] LEVEL message key=value ..." to stderr when level passes min_level.
void Log(const LogMessage& message);

inline void LogDebug(const std::string& tag,
                     const std::string& message,
                     std::unordered_map<std::string, std::string> fields = {}) {
    Log({LogLevel::kDebug, tag, message, std::move(fields)});
}

inline void LogInfo(const std::string& tag,
                    const std::string& message,
                    std::unordered_map<std::string, std::string> fields = {}) {
    Log({LogLevel::kInfo, tag, message, std::move(fields)});
}

inline void LogWarn(const std::string& tag,
                    const std::string& message,
                    std::unordered_map<std::string, std::string> fields = {}) {
    Log({LogLevel::kWarn, tag, message, std::move(fields)});
}

inline void LogError(const std::string& tag,
                     const std::string& message,
                     std::unordered_map<std::string, std::string> fields = {}) {
    Log({LogLevel::kError, tag, message, std::move(fields)});
}

}  // namespace runbox::utils
