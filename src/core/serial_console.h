#pragma once

#include <stdint.h>
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

// ========== SERIAL SINK FOR Console ==========
// The access task and the detached log tasks print concurrently.
// This mutex keeps their lines from interleaving on the UART.

class SerialConsole {
public:
    static void init(uint32_t baud);

    // RAII lock guard
    class Guard {
    public:
        Guard(uint32_t timeoutMs = 100) : acquired(SerialConsole::lock(timeoutMs)) {}
        ~Guard() { if (acquired) SerialConsole::unlock(); }
        bool isAcquired() const { return acquired; }
    private:
        bool acquired;
    };

private:
    static bool lock(uint32_t timeoutMs);
    static void unlock();
    static void write(const char* text);

    static SemaphoreHandle_t mutex;
};
