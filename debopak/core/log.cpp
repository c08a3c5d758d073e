#include "log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace debopak {

namespace {

LogConfig g_log{};

const char* level_prefix(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "?";
}

} // namespace

void set_log_config(const LogConfig& cfg) {
    g_log = cfg;
}

const LogConfig& log_config() {
    return g_log;
}

void logf(LogLevel level, const char* tag, const char* fmt, ...) {
    if (!g_log.enabled) return;
    if (static_cast<int>(level) < static_cast<int>(g_log.minLevel)) return;

    bool show = true;
    if (std::strcmp(tag, "read") == 0) show = g_log.read;
    else if (std::strcmp(tag, "write") == 0) show = g_log.write;
    else if (std::strcmp(tag, "index") == 0) show = g_log.index;

    if (!show) return;

    std::fprintf(stderr, "[debopak][%s][%s] ", level_prefix(level), tag);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fprintf(stderr, "\n");
}

} // namespace debopak
