#pragma once
/**
 * @file log.hpp
 * @brief Leveled stderr logger for the echolite tools.
 *
 * The codec itself never logs; only the CLI does. Lines look like
 * `[debug] parsed 14 bytes, opc=1` and go to stderr so stdout stays clean
 * for hex / JSON output.
 */

#include <cstdio>
#include <cstdarg>
#include <string>

namespace echolite {

class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo) : level_(level) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl("error", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("warn", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("info", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("debug", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;

    static void log_impl(const char* tag, const char* fmt, va_list ap) {
        std::fprintf(stderr, "[%s] ", tag);
        std::vfprintf(stderr, fmt, ap);
        std::fprintf(stderr, "\n");
    }
};

/// "error" / "warn" / "info" / "debug" → level. False for anything else.
inline bool parse_log_level(const std::string& s, Logger::Level& out) {
    if      (s == "error") out = Logger::kError;
    else if (s == "warn")  out = Logger::kWarn;
    else if (s == "info")  out = Logger::kInfo;
    else if (s == "debug") out = Logger::kDebug;
    else return false;
    return true;
}

} // namespace echolite
