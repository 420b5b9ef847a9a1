#ifndef LOG_H
#define LOG_H

#include "Models.h"

// Log lines look like "[TAG] message". Formatting and level filtering live
// in Log.cpp; the platform provides logSink() to emit a finished line.

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
const char* logLevelName(LogLevel level);

void logDebug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void logInfo(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void logWarn(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void logError(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// Implemented per platform (Serial on the board, capture buffer in tests)
void logSink(LogLevel level, const char* line);

#endif
