#include "ConfigManager.h"
#include "Log.h"
#include "config.h"
#include <Arduino.h>
#include <LittleFS.h>

bool ConfigManager::begin() {
    // Do not format on failure: the settings file is uploaded with the image
    if (!LittleFS.begin(false)) {
        logWarn("ConfigManager", "LittleFS mount failed");
        mounted = false;
        return false;
    }
    mounted = true;
    logInfo("ConfigManager", "LittleFS mounted");
    return true;
}

ConfigLoadResult ConfigManager::load(DoorbellConfiguration& config) {
    getDefaults(config);

    if (!mounted || !LittleFS.exists(CONFIG_FILE_PATH)) {
        logWarn("ConfigManager", "No %s found, using defaults", CONFIG_FILE_PATH);
        return validate(config) ? ConfigLoadResult::Defaults : ConfigLoadResult::Invalid;
    }

    File file = LittleFS.open(CONFIG_FILE_PATH, "r");
    if (!file) {
        logError("ConfigManager", "Failed to open %s", CONFIG_FILE_PATH);
        return ConfigLoadResult::Invalid;
    }

    size_t size = file.size();
    if (size == 0 || size > CONFIG_FILE_MAX_SIZE) {
        logError("ConfigManager", "%s has unexpected size %u", CONFIG_FILE_PATH, (unsigned)size);
        file.close();
        return ConfigLoadResult::Invalid;
    }

    char buffer[CONFIG_FILE_MAX_SIZE];
    size_t read = file.readBytes(buffer, size);
    file.close();

    if (read != size) {
        logError("ConfigManager", "Short read on %s (%u of %u bytes)", CONFIG_FILE_PATH,
                 (unsigned)read, (unsigned)size);
        return ConfigLoadResult::Invalid;
    }

    if (!parse(buffer, read, config) || !validate(config)) {
        return ConfigLoadResult::Invalid;
    }

    logInfo("ConfigManager", "Configuration loaded from %s", CONFIG_FILE_PATH);
    return ConfigLoadResult::Loaded;
}
