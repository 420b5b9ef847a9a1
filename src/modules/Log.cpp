#include "Log.h"
#include <stdarg.h>
#include <stdio.h>

static LogLevel minLevel = LogLevel::Info;

static void logWrite(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (level < minLevel) {
        return;
    }

    char line[LOG_LINE_MAX_LEN];
    int prefix = snprintf(line, sizeof(line), "[%s] ", tag);
    if (prefix < 0) {
        return;
    }
    if (prefix < (int)sizeof(line)) {
        vsnprintf(line + prefix, sizeof(line) - prefix, fmt, args);
    }

    logSink(level, line);
}

void setLogLevel(LogLevel level) {
    minLevel = level;
}

LogLevel getLogLevel() {
    return minLevel;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void logDebug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logWrite(LogLevel::Debug, tag, fmt, args);
    va_end(args);
}

void logInfo(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logWrite(LogLevel::Info, tag, fmt, args);
    va_end(args);
}

void logWarn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logWrite(LogLevel::Warn, tag, fmt, args);
    va_end(args);
}

void logError(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logWrite(LogLevel::Error, tag, fmt, args);
    va_end(args);
}
