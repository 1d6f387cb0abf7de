#pragma once
#include <string>

enum LogLevel {
    NONE = -1,
    LOG  = 0,
    WARN,
    ERR,
    CRIT,
    INFO,
    TRACE
};

namespace Debug {
    inline bool quiet   = false;
    inline bool verbose = false;

    void        log(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
};
