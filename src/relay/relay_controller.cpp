#include "relay_controller.h"
#include "core/console.h"

// ================= PUBLIC =================

RelayController::RelayController(RelayDriver& driver, DelayFn pause)
    : driver(driver), pause(pause), pin(0), initialized(false) {}

bool RelayController::init(uint8_t relayPin) {
    pin = relayPin;

    // FAIL-SAFE: pin comes up locked
    if (!driver.setup(pin, false)) {
        Console::printf("[RELAY] ERROR: could not claim pin %u\n", pin);
        initialized = false;
        return false;
    }

    initialized = true;
    Console::printf("[RELAY] LOCK (boot default) on pin %u\n", pin);
    return true;
}

void RelayController::release() {
    if (!initialized) return;

    driver.setOutput(pin, false);
    driver.cleanup();
    initialized = false;
    Console::println("[RELAY] Pin released, relay locked");
}

void RelayController::engage(uint32_t durationMs) {
    if (!initialized) {
        Console::println("[RELAY] Not initialized, engage ignored");
        return;
    }

    Console::println("[RELAY] UNLOCK");
    setRelay(true);
    pause(durationMs);
    setRelay(false);
    Console::println("[RELAY] LOCK");
}

void RelayController::signalDenial(uint8_t flashCount, uint32_t intervalMs) {
    if (!initialized) return;

    Console::println("[RELAY] Flashing for access denial");
    for (uint8_t i = 0; i < flashCount; i++) {
        setRelay(true);
        pause(intervalMs);
        setRelay(false);
        pause(intervalMs);
    }
    Console::println("[RELAY] Denial flash complete");
}

void RelayController::lock() {
    if (!initialized) return;
    setRelay(false);
}

// ================= PRIVATE =================

void RelayController::setRelay(bool unlock) {
    driver.setOutput(pin, unlock);
}
