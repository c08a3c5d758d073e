#pragma once

#include "types.hpp"

namespace debopak {

// Process-wide logging switches. Library code only emits Debug/Info lines;
// failures travel as PakError and are logged by the caller.
struct LogConfig {
    bool enabled{true};
    LogLevel minLevel{LogLevel::Info};
    bool read{true};
    bool write{true};
    bool index{false};
};

void set_log_config(const LogConfig& cfg);
const LogConfig& log_config();

// printf-style line on stderr: "[debopak][LEVEL][tag] message".
// Tags "read", "write" and "index" are filtered by LogConfig; any other tag
// is always shown when the level passes.
void logf(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace debopak
