#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace mediagate {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide sink: stdout (optionally colored) plus an optional
// append-only file. Lines are written whole under one lock.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }
    // Case-insensitive; unknown names map to INFO.
    LogLevel ParseLevel(const std::string& levelStr) const;

    void SetColor(bool on);
    // Empty path closes the file sink.
    bool SetLogFile(const std::string& path);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::mutex mutex_;
    bool color_ = true;
    std::ofstream file_;
};

// Collects one line and hands it to the Logger when the statement ends.
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}
    ~LogStream() { Logger::Instance().Log(level_, file_, line_, ss_.str()); }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream ss_;
};

} // namespace common
} // namespace mediagate

// Arguments are not evaluated when the level is filtered out.
#define MEDIAGATE_LOG(lvl) \
    if (mediagate::common::LogLevel::lvl < mediagate::common::Logger::Instance().GetLevel()) {} \
    else mediagate::common::LogStream(mediagate::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG MEDIAGATE_LOG(DEBUG)
#define LOG_INFO MEDIAGATE_LOG(INFO)
#define LOG_WARN MEDIAGATE_LOG(WARN)
#define LOG_ERROR MEDIAGATE_LOG(ERROR)
#define LOG_FATAL MEDIAGATE_LOG(FATAL)
