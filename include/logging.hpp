#pragma once
#include <atomic>
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace chunkcast {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

// Returns false and leaves `out` untouched on an unknown name.
bool parse_log_level(const std::string& name, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }
    // nullptr restores stderr
    void set_output(FILE* out);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    FILE* out_ = nullptr;
    const char* level_str(LogLevel lvl);
};

} // namespace chunkcast
