#include "log.h"

#include <cctype>
#include <unistd.h>

namespace snapvault {

bool parse_log_level(const std::string &value, LogLevel *out) {
    std::string v = value;
    for (auto &c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "debug") {
        *out = LogLevel::Debug;
    } else if (v.empty() || v == "info") {
        *out = LogLevel::Info;
    } else if (v == "warning" || v == "warn") {
        *out = LogLevel::Warning;
    } else if (v == "error") {
        *out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

const char *log_level_label(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warning:
            return "warning";
        case LogLevel::Error:
            return "error";
        default:
            return "unknown";
    }
}

Log::Log(FILE *out, LogLevel level) : out_(out), level_(level) {}

bool Log::interactive() const {
    return out_ && isatty(fileno(out_));
}

void Log::debug(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    write(LogLevel::Debug, fmt, ap);
    va_end(ap);
}

void Log::info(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    write(LogLevel::Info, fmt, ap);
    va_end(ap);
}

void Log::warn(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    write(LogLevel::Warning, fmt, ap);
    va_end(ap);
}

void Log::error(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    write(LogLevel::Error, fmt, ap);
    va_end(ap);
}

void Log::heading(const std::string &caption) {
    std::string line = "--[ " + caption + " ]";
    while (line.size() < 50) line += '-';
    info("%s", line.c_str());
}

void Log::write(LogLevel level, const char *fmt, va_list ap) {
    if (!out_ || !enabled(level)) return;
    char buf[4096];
    std::vsnprintf(buf, sizeof(buf), fmt, ap);

    std::lock_guard<std::mutex> lock(mutex_);
    switch (level) {
        case LogLevel::Debug:
            std::fprintf(out_, "debug: %s\n", buf);
            break;
        case LogLevel::Warning:
            std::fprintf(out_, "warning: %s\n", buf);
            break;
        case LogLevel::Error:
            std::fprintf(out_, "error: %s\n", buf);
            break;
        default:
            std::fprintf(out_, "%s\n", buf);
            break;
    }
    std::fflush(out_);
}

}
