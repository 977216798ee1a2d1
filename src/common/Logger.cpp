#include "llmrouter/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace llmrouter {
namespace common {

static std::string FormatTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmv;
    ::localtime_r(&in_time_t, &tmv);
    std::stringstream ss;
    ss << std::put_time(&tmv, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

static const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

// ANSI Color codes
static const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m"; // Cyan
        case LogLevel::INFO:  return "\033[32m"; // Green
        case LogLevel::WARN:  return "\033[33m"; // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        case LogLevel::FATAL: return "\033[35m"; // Magenta
        default: return "\033[0m";
    }
}

static void AppendJsonEscaped(std::ostream& os, const std::string& s) {
    for (unsigned char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) {
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                       << std::dec << std::setfill(' ');
                } else {
                    os << static_cast<char>(c);
                }
        }
    }
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::SetLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::ParseLevel(const std::string& levelStr) {
    std::string s = levelStr;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (s == "DEBUG" || s == "TRACE") return LogLevel::DEBUG;
    if (s == "INFO") return LogLevel::INFO;
    if (s == "WARN" || s == "WARNING") return LogLevel::WARN;
    if (s == "ERROR") return LogLevel::ERROR;
    if (s == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

std::string Logger::Redact(const std::string& secret) {
    if (secret.empty()) return "";
    if (secret.size() <= 4) return "****";
    return "****" + secret.substr(secret.size() - 4);
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    const std::string ts = FormatTimestamp();
    std::lock_guard<std::mutex> lock(mutex_);

    if (JsonFormat()) {
        std::string lv = LevelToString(level);
        while (!lv.empty() && lv.back() == ' ') lv.pop_back();
        std::cout << "{\"ts\":\"" << ts << "\",\"level\":\"" << lv << "\",\"file\":\"";
        AppendJsonEscaped(std::cout, file);
        std::cout << "\",\"line\":" << line << ",\"msg\":\"";
        AppendJsonEscaped(std::cout, msg);
        std::cout << "\"}" << std::endl;
        return;
    }

    // Format: [Time] [Level] [File:Line] Message
    std::cout << LevelToColor(level)
              << "[" << ts << "] "
              << "[" << LevelToString(level) << "] "
              << "[" << file << ":" << line << "] "
              << msg
              << "\033[0m" // Reset color
              << std::endl;
}

} // namespace common
} // namespace llmrouter
