#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace kestrel::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

inline std::string Truncate(const std::string& value, std::size_t max_len) {
    if (value.size() <= max_len) {
        return value;
    }
    return value.substr(0, max_len) + "\n...(truncated)...";
}

inline std::string RandomHex(std::size_t length) {
    static const char* kChars = "0123456789abcdef";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        id.push_back(kChars[dist(gen)]);
    }
    return id;
}

inline std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

inline std::filesystem::path ExpandUser(const std::string& path) {
    if (path == "~") {
        return GetHomePath();
    }
    if (path.rfind("~/", 0) == 0) {
        return GetHomePath() / path.substr(2);
    }
    return std::filesystem::path(path);
}

// Local wall-clock time of a millisecond timestamp, e.g. "2026-01-31 14:05".
inline std::string FormatLocalTime(long long ms, const char* format = "%Y-%m-%d %H:%M") {
    const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm local_time{};
    localtime_r(&seconds, &local_time);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &local_time);
    return std::string(buffer);
}

inline std::string SplitSessionChannel(const std::string& session_key) {
    const auto delimiter = session_key.find(':');
    return delimiter == std::string::npos ? std::string() : session_key.substr(0, delimiter);
}

inline std::string SplitSessionChatId(const std::string& session_key) {
    const auto delimiter = session_key.find(':');
    return delimiter == std::string::npos ? session_key : session_key.substr(delimiter + 1);
}

}  // namespace kestrel::utils
