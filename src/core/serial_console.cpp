#include "serial_console.h"
#include "console.h"
#include <Arduino.h>

SemaphoreHandle_t SerialConsole::mutex = nullptr;

void SerialConsole::init(uint32_t baud) {
    Serial.begin(baud);

    if (mutex == nullptr) {
        mutex = xSemaphoreCreateMutex();
    }

    Console::init(&SerialConsole::write);

    if (mutex == nullptr) {
        Serial.println("[CONSOLE] ERROR: Failed to create mutex, output may interleave");
    }
}

bool SerialConsole::lock(uint32_t timeoutMs) {
    if (mutex == nullptr) return false;
    return xSemaphoreTake(mutex, pdMS_TO_TICKS(timeoutMs)) == pdTRUE;
}

void SerialConsole::unlock() {
    if (mutex != nullptr) {
        xSemaphoreGive(mutex);
    }
}

void SerialConsole::write(const char* text) {
    // A stuck holder must not silence diagnostics, so print even on timeout
    Guard guard;
    Serial.print(text);
}
