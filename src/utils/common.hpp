#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace llmtrigger::utils {

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

// Splits on every occurrence of a literal delimiter; empty segments are kept.
inline std::vector<std::string> Split(const std::string& value, const std::string& delimiter) {
    std::vector<std::string> parts;
    if (delimiter.empty()) {
        parts.push_back(value);
        return parts;
    }
    std::size_t start = 0;
    while (true) {
        const auto pos = value.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(value.substr(start));
            break;
        }
        parts.push_back(value.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    return parts;
}

inline std::vector<std::string> SplitWhitespace(const std::string& value) {
    std::vector<std::string> parts;
    std::istringstream stream(value);
    std::string item;
    while (stream >> item) {
        parts.push_back(item);
    }
    return parts;
}

inline std::string Trim(const std::string& value) {
    const auto begin = std::find_if(value.begin(), value.end(), [](unsigned char c) {
        return !std::isspace(c);
    });
    const auto end = std::find_if(value.rbegin(), value.rend(), [](unsigned char c) {
        return !std::isspace(c);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline long long ToEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

// Local wall-clock rendering, "YYYY-MM-DD HH:MM:SS".
inline std::string FormatLocalTime(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace llmtrigger::utils
