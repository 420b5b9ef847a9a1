#ifndef HOMEASSISTANTDISCOVERY_H
#define HOMEASSISTANTDISCOVERY_H

#include <stddef.h>
#include "Models.h"

#define TOPIC_SUB_STATE "state"
#define TOPIC_SUB_AVAILABILITY "availability"
#define TOPIC_SUB_COMMAND "command"

// Topic layout and the device-based discovery document:
//   <prefix>/availability
//   <prefix>/<object_id>/{state,availability,command}
//   <discovery_prefix>/device/<device_id>/config
class HomeAssistantDiscovery {
public:
    HomeAssistantDiscovery(const DoorbellConfiguration& config);

    bool componentTopic(char* out, size_t len, const char* topicId, const char* subtopic) const;
    bool deviceAvailabilityTopic(char* out, size_t len) const;
    bool discoveryTopic(char* out, size_t len) const;

    // Returns the payload length, 0 if it does not fit into out
    size_t buildPayload(char* out, size_t len, const ComponentInfo* components, size_t count) const;

private:
    const DoorbellConfiguration& config;
};

#endif
