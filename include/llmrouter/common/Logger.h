#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace llmrouter {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }
    // Case-insensitive; unknown names map to INFO.
    LogLevel ParseLevel(const std::string& levelStr);

    // One JSON object per line instead of colored text.
    void SetJsonFormat(bool on) { json_.store(on, std::memory_order_relaxed); }
    bool JsonFormat() const { return json_.load(std::memory_order_relaxed); }

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

    // "sk-abcdef123456" -> "****3456"
    static std::string Redact(const std::string& secret);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::atomic<bool> json_{false};
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace llmrouter

#define LOG_DEBUG \
    if (llmrouter::common::LogLevel::DEBUG >= llmrouter::common::Logger::Instance().GetLevel()) \
    llmrouter::common::LogStream(llmrouter::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (llmrouter::common::LogLevel::INFO >= llmrouter::common::Logger::Instance().GetLevel()) \
    llmrouter::common::LogStream(llmrouter::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (llmrouter::common::LogLevel::WARN >= llmrouter::common::Logger::Instance().GetLevel()) \
    llmrouter::common::LogStream(llmrouter::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (llmrouter::common::LogLevel::ERROR >= llmrouter::common::Logger::Instance().GetLevel()) \
    llmrouter::common::LogStream(llmrouter::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (llmrouter::common::LogLevel::FATAL >= llmrouter::common::Logger::Instance().GetLevel()) \
    llmrouter::common::LogStream(llmrouter::common::LogLevel::FATAL, __FILE__, __LINE__)
