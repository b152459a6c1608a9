#pragma once

#include <cstdio>
#include <cstdarg>
#include <string>

namespace parley {

// Simple logger writing to stderr. Each call emits one complete line with a
// single write, so lines from concurrent sessions do not interleave.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo) : level_(level) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    // Parse "error", "warn", "info" or "debug". Returns false otherwise.
    static bool parse_level(const std::string& name, Level& level) {
        if (name == "error") level = kError;
        else if (name == "warn") level = kWarn;
        else if (name == "info") level = kInfo;
        else if (name == "debug") level = kDebug;
        else return false;
        return true;
    }

    void error(const char* fmt, ...) const {
        if (level_ < kError) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;

    static void log_impl(const char* tag, const char* fmt, va_list ap) {
        char line[1024];
        int n = std::snprintf(line, sizeof(line), "[%s] ", tag);
        if (n < 0) return;
        size_t used = static_cast<size_t>(n);
        int m = std::vsnprintf(line + used, sizeof(line) - used, fmt, ap);
        if (m > 0) used += static_cast<size_t>(m);
        if (used > sizeof(line) - 2) used = sizeof(line) - 2;  // truncated
        line[used++] = '\n';
        std::fwrite(line, 1, used, stderr);
    }
};

} // namespace parley
