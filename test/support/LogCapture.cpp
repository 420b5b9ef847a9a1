#include "LogCapture.h"

static std::vector<CapturedLine> lines;

void logSink(LogLevel level, const char* line) {
    CapturedLine captured;
    captured.level = level;
    captured.text = line;
    lines.push_back(captured);
}

const std::vector<CapturedLine>& capturedLogs() {
    return lines;
}

void clearCapturedLogs() {
    lines.clear();
}

bool logContains(const std::string& text) {
    for (size_t i = 0; i < lines.size(); i++) {
        if (lines[i].text.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}
