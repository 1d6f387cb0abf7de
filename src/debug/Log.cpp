#include "Log.hpp"

#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <mutex>

static std::mutex logMutex;

void Debug::log(LogLevel level, const char* fmt, ...) {
    if (quiet && level != NONE && level != CRIT)
        return;

    if (level == TRACE && !verbose)
        return;

    std::string levelStr = "";

    switch (level) {
        case LOG: levelStr = "[LOG] "; break;
        case WARN: levelStr = "[WARN] "; break;
        case ERR: levelStr = "[ERR] "; break;
        case CRIT: levelStr = "[CRITICAL] "; break;
        case INFO: levelStr = "[INFO] "; break;
        case TRACE: levelStr = "[TRACE] "; break;
        default: break;
    }

    char    buf[1024] = "";
    char*   outputStr = buf;
    int     logLen    = 0;

    va_list args;
    va_start(args, fmt);
    logLen = vsnprintf(buf, sizeof buf, fmt, args);
    va_end(args);

    std::string longBuf;
    if ((long unsigned int)logLen >= sizeof buf) {
        // previews carry whole base64 images, those don't fit the stack buffer
        longBuf.resize(logLen + 1);
        va_start(args, fmt);
        vsnprintf(longBuf.data(), longBuf.size(), fmt, args);
        va_end(args);
        longBuf.resize(logLen);
        outputStr = longBuf.data();
    }

    std::lock_guard<std::mutex> lg(logMutex);
    std::cout << levelStr << outputStr << "\n";
    std::cout.flush();
}
