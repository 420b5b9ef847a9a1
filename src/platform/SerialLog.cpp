#include "Log.h"
#include <Arduino.h>

void logSink(LogLevel level, const char* line) {
    if (level == LogLevel::Error) {
        Serial.print("E ");
    }
    Serial.println(line);
}
