#include "mediagate/common/Logger.h"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>
#include <strings.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace mediagate {
namespace common {

namespace {

struct LevelStyle {
    const char* tag;
    const char* color;
};

const LevelStyle kStyles[] = {
    {"DEBUG", "\033[36m"},
    {"INFO ", "\033[32m"},
    {"WARN ", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"FATAL", "\033[35m"},
};

const char kColorReset[] = "\033[0m";

// 2026-10-18 12:00:00.123
void FormatTimestamp(char* buf, size_t cap) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const int ms = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm tm;
    localtime_r(&secs, &tm);
    const size_t n = std::strftime(buf, cap, "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(buf + n, cap - n, ".%03d", ms);
}

long CurrentTid() {
    thread_local const long tid = ::syscall(SYS_gettid);
    return tid;
}

const char* Basename(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

LogLevel Logger::ParseLevel(const std::string& levelStr) const {
    static const LogLevel kLevels[] = {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN,
                                       LogLevel::ERROR, LogLevel::FATAL};
    static const char* const kNames[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    for (size_t i = 0; i < sizeof kNames / sizeof kNames[0]; ++i) {
        if (::strcasecmp(levelStr.c_str(), kNames[i]) == 0) return kLevels[i];
    }
    return LogLevel::INFO;
}

void Logger::SetColor(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = on;
}

bool Logger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.close();
    file_.clear();
    if (path.empty()) return true;
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    char stamp[32];
    FormatTimestamp(stamp, sizeof stamp);
    const LevelStyle& style = kStyles[static_cast<int>(level)];

    // [time] [LEVEL] [tid] [file:line] message
    char prefix[160];
    std::snprintf(prefix, sizeof prefix, "[%s] [%s] [%ld] [%s:%d] ",
                  stamp, style.tag, CurrentTid(), Basename(file), line);

    std::lock_guard<std::mutex> lock(mutex_);
    if (color_) {
        std::cout << style.color << prefix << msg << kColorReset << '\n';
    } else {
        std::cout << prefix << msg << '\n';
    }
    std::cout.flush();
    if (file_.is_open()) {
        file_ << prefix << msg << '\n';
        file_.flush();
    }
}

} // namespace common
} // namespace mediagate
