#include "DoorbellTask.h"
#include "Log.h"

DoorbellTask::DoorbellTask(DoorbellAdapter& adapter)
    : adapter(adapter), taskHandle(NULL) {
}

bool DoorbellTask::begin() {
    if (taskHandle != NULL) {
        logWarn("DOORBELL_TASK", "Task already running");
        return true;
    }

    BaseType_t result = xTaskCreatePinnedToCore(
        taskFunction,
        "Doorbell",
        DOORBELL_TASK_STACK_SIZE,
        this,
        DOORBELL_TASK_PRIORITY,
        &taskHandle,
        DOORBELL_TASK_CORE
    );

    if (result != pdPASS) {
        logError("DOORBELL_TASK", "Failed to create task!");
        taskHandle = NULL;
        return false;
    }

    logInfo("DOORBELL_TASK", "Task started on core %d, tick %d ms", DOORBELL_TASK_CORE, DOORBELL_TICK_MS);
    return true;
}

// Static task function - FreeRTOS entry point
void DoorbellTask::taskFunction(void* param) {
    DoorbellTask* instance = static_cast<DoorbellTask*>(param);
    instance->runLoop();

    // Only reached if the loop returns
    vTaskDelete(NULL);
}

void DoorbellTask::runLoop() {
    TickType_t lastWake = xTaskGetTickCount();

    while (true) {
        adapter.update(millis());

        if (adapter.isRestartRequested()) {
            adapter.shutdown();
            logInfo("DOORBELL_TASK", "Restarting...");
            Serial.flush();
            ESP.restart();
        }

        vTaskDelayUntil(&lastWake, pdMS_TO_TICKS(DOORBELL_TICK_MS));
    }
}
