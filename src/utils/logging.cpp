#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>

namespace kestrel::utils {

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
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
    return std::nullopt;
}

Logger& Logger::Instance() {
    static Logger logger;
    return logger;
}

void Logger::Configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(config_.min_level);
}

void Logger::Write(const LogMessage& msg) {
    if (!Enabled(msg.level)) {
        return;
    }
    const std::map<std::string, std::string> sorted(msg.fields.begin(), msg.fields.end());
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[" << msg.tag << "]";
    if (msg.level != LogLevel::kInfo) {
        std::cerr << " " << ToString(msg.level);
    }
    if (!msg.message.empty()) {
        std::cerr << " " << msg.message;
    }
    for (const auto& [key, value] : sorted) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields) {
    Logger::Instance().Write(LogMessage{level, tag, message, fields});
}

}  // namespace kestrel::utils
