#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace kestrel::utils {

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

std::optional<LogLevel> ParseLogLevel(const std::string& value);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

class Logger {
public:
    static Logger& Instance();

    void Configure(const LogConfig& config);
    bool Enabled(LogLevel level) const;
    void Write(const LogMessage& msg);

private:
    Logger() = default;

    mutable std::mutex mutex_;
    LogConfig config_{};
};

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields = {});

inline void LogDebug(const std::string& tag, const std::string& message,
                     const std::unordered_map<std::string, std::string>& fields = {}) {
    Log(LogLevel::kDebug, tag, message, fields);
}

inline void LogInfo(const std::string& tag, const std::string& message,
                    const std::unordered_map<std::string, std::string>& fields = {}) {
    Log(LogLevel::kInfo, tag, message, fields);
}

inline void LogWarn(const std::string& tag, const std::string& message,
                    const std::unordered_map<std::string, std::string>& fields = {}) {
    Log(LogLevel::kWarn, tag, message, fields);
}

inline void LogError(const std::string& tag, const std::string& message,
                     const std::unordered_map<std::string, std::string>& fields = {}) {
    Log(LogLevel::kError, tag, message, fields);
}

}  // namespace kestrel::utils
