#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <stddef.h>
#include "Models.h"

enum class ConfigLoadResult : uint8_t {
    Loaded,      // Settings file parsed and valid
    Defaults,    // No settings file, compiled-in defaults used
    Invalid      // Settings file unreadable, malformed or rejected
};

class ConfigManager {
public:
    ConfigManager();

    // Mount the filesystem holding the settings file
    bool begin();

    // Defaults, then settings file on top, then validation
    ConfigLoadResult load(DoorbellConfiguration& config);

    // Apply a JSON settings document on top of config
    bool parse(const char* json, size_t length, DoorbellConfiguration& config);

    // Fill in defaults from config.h
    void getDefaults(DoorbellConfiguration& config);

    // Check ranges, required fields and pin conflicts
    bool validate(const DoorbellConfiguration& config);

    static bool parseLogLevel(const char* name, LogLevel& outLevel);

private:
    bool mounted;
};

#endif
