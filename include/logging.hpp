#pragma once
#include <cstdio>
#include <cstdarg>
#include <atomic>
#include <mutex>
#include <string>

namespace byteframe {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

// "trace", "debug", "info", "warn", "error"
bool parse_log_level(const std::string& name, LogLevel& out);
const char* log_level_name(LogLevel lvl);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return lvl >= level_; }
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
};

} // namespace byteframe
