#ifndef SNAPVAULT_LOG_H
#define SNAPVAULT_LOG_H

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

#if defined(__GNUC__)
#define SNAPVAULT_PRINTF(fmt_idx, arg_idx) __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define SNAPVAULT_PRINTF(fmt_idx, arg_idx)
#endif

namespace snapvault {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

bool parse_log_level(const std::string &value, LogLevel *out);
const char *log_level_label(LogLevel level);

// Reporting handle created once by the entry point and handed to every
// component. Lines are written whole under a mutex so the transfer pump
// thread can report progress while the coordinator logs.
class Log {
public:
    explicit Log(FILE *out = stdout, LogLevel level = LogLevel::Info);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_; }
    bool interactive() const;

    void debug(const char *fmt, ...) SNAPVAULT_PRINTF(2, 3);
    void info(const char *fmt, ...) SNAPVAULT_PRINTF(2, 3);
    void warn(const char *fmt, ...) SNAPVAULT_PRINTF(2, 3);
    void error(const char *fmt, ...) SNAPVAULT_PRINTF(2, 3);

    void heading(const std::string &caption);

private:
    void write(LogLevel level, const char *fmt, va_list ap);

    FILE *out_;
    LogLevel level_;
    std::mutex mutex_;
};

}

#endif
