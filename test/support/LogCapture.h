#ifndef LOGCAPTURE_H
#define LOGCAPTURE_H

#include <string>
#include <vector>
#include "Log.h"

struct CapturedLine {
    LogLevel level;
    std::string text;
};

// Lines received by the test build of logSink()
const std::vector<CapturedLine>& capturedLogs();
void clearCapturedLogs();
bool logContains(const std::string& text);

#endif
