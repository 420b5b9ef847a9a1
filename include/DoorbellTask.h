#ifndef DOORBELLTASK_H
#define DOORBELLTASK_H

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include "DoorbellAdapter.h"
#include "config.h"

// Runs the doorbell loop on its own FreeRTOS task at a fixed tick
class DoorbellTask {
public:
    DoorbellTask(DoorbellAdapter& adapter);
    bool begin();

private:
    DoorbellAdapter& adapter;
    TaskHandle_t taskHandle;

    static void taskFunction(void* param);
    void runLoop();
};

#endif
